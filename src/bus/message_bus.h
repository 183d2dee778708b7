#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace courier {

// Publish/subscribe seam between components. Components never share
// memory: they only see JSON payloads arriving on named channels, so the
// same component code runs embedded (InProcessBus) or as its own process
// (ZmqBus).
//
// Guarantees: per-publisher, per-channel FIFO. Delivery is at-most-once.
// system.init / system.reset ride a priority lane and are dispatched ahead
// of anything already queued.
class MessageBus {
public:
    using Handler = std::function<void(const nlohmann::json&)>;

    virtual ~MessageBus() = default;

    virtual void subscribe(const std::string& channel, Handler handler) = 0;

    // Fire-and-forget.
    virtual void publish(const std::string& channel, const nlohmann::json& payload) = 0;

    // Dispatch pending messages to their handlers, waiting at most
    // `timeout` for the first one. Returns the number dispatched.
    virtual size_t pump(std::chrono::milliseconds timeout) = 0;
};

bool is_priority_channel(const std::string& channel);

// Run one handler; a throwing handler is logged under `tag` and does not
// stop the bus.
void dispatch_guarded(const char* tag,
                      const std::string& channel,
                      const MessageBus::Handler& handler,
                      const nlohmann::json& payload);

} // namespace courier
