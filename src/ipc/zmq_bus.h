#pragma once

#include "bus/message_bus.h"

#include <atomic>
#include <memory>
#include <string>

namespace courier {

// ZeroMQ transport for the multi-process deployment.
// Every component talks to one forwarder (see run_forwarder):
//   PUB: connects to the forwarder's XSUB side (pub_endpoint).
//   SUB: connects to the forwarder's XPUB side (sub_endpoint).
// Messages are two frames: channel name, JSON text.
class ZmqBus : public MessageBus {
public:
    ZmqBus(const std::string& name,
           const std::string& pub_endpoint,
           const std::string& sub_endpoint);
    ~ZmqBus() override;

    ZmqBus(const ZmqBus&) = delete;
    ZmqBus& operator=(const ZmqBus&) = delete;

    // Throws TransportError if a socket cannot be created or connected.
    void connect();
    void disconnect();

    void subscribe(const std::string& channel, Handler handler) override;
    void publish(const std::string& channel, const nlohmann::json& payload) override;

    // Polls SUB for up to `timeout`, then drains whatever is readable.
    // Priority channels in the drained batch are dispatched first.
    size_t pump(std::chrono::milliseconds timeout) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Derive the forwarder's XPUB endpoint from its XSUB endpoint (port + 1).
// e.g. tcp://127.0.0.1:5555 → tcp://127.0.0.1:5556.
std::string derive_sub_endpoint(const std::string& pub_endpoint);

// Broker role: bind XSUB on `frontend`, XPUB on `backend`, and shuttle
// frames between them until `running` goes false.
void run_forwarder(const std::string& frontend,
                   const std::string& backend,
                   std::atomic<bool>& running);

} // namespace courier
