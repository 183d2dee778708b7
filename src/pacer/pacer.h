#pragma once

#include "bus/message_bus.h"
#include "config/config.h"

#include <atomic>
#include <cstdint>

namespace courier {

// Tick source for standalone runs.
//   fire → monitor.request {seq} → ... → execute.result {seq} → next tick
// A tick that is not acknowledged within ack_timeout_ms is abandoned and
// the next one fires anyway.
class Pacer {
public:
    Pacer(MessageBus& bus, const Config& config);

    Pacer(const Pacer&) = delete;
    Pacer& operator=(const Pacer&) = delete;

    // Publish monitor.request with the next sequence number.
    uint64_t fire();

    // Fire one tick and pump the bus until it is acknowledged or times out.
    bool tick();

    // system.init / system.reset, carrying the last issued seq as the floor.
    void init();
    void reset();

    // Blocking run-loop: one tick per tick_interval_ms.
    void run(std::atomic<bool>& running);

    uint64_t seq() const { return seq_.load(); }
    bool acknowledged() const { return done_seq_.load() >= seq_.load(); }

private:
    void on_result(const nlohmann::json& payload);

    MessageBus& bus_;
    int         tick_interval_ms_;
    int         ack_timeout_ms_;

    std::atomic<uint64_t> seq_{0};
    std::atomic<uint64_t> done_seq_{0};
};

} // namespace courier
