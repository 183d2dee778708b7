#include "pacer/pacer.h"

#include "messages/messages.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace courier {

Pacer::Pacer(MessageBus& bus, const Config& config)
    : bus_(bus)
    , tick_interval_ms_(config.tick_interval_ms)
    , ack_timeout_ms_(config.ack_timeout_ms)
{
    bus_.subscribe(channel::kExecuteResult, [this](const auto& p) { on_result(p); });
}

uint64_t Pacer::fire() {
    const uint64_t seq = ++seq_;
    bus_.publish(channel::kMonitorRequest, nlohmann::json{{"seq", seq}});
    return seq;
}

bool Pacer::tick() {
    using clock = std::chrono::steady_clock;

    const uint64_t seq = fire();
    const auto deadline = clock::now() + std::chrono::milliseconds(ack_timeout_ms_);

    while (!acknowledged()) {
        const auto now = clock::now();
        if (now >= deadline) {
            std::cerr << "[PACER] Tick " << seq << " not acknowledged after "
                      << ack_timeout_ms_ << " ms\n";
            return false;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        bus_.pump(std::min(left, std::chrono::milliseconds(50)));
    }
    return true;
}

void Pacer::init() {
    bus_.publish(channel::kSystemInit, nlohmann::json{{"floor_seq", seq_.load()}});
    std::cout << "[PACER] Init sent.\n";
}

void Pacer::reset() {
    bus_.publish(channel::kSystemReset, nlohmann::json{{"floor_seq", seq_.load()}});
    std::cout << "[PACER] Reset sent (floor " << seq_.load() << ").\n";
}

void Pacer::run(std::atomic<bool>& running) {
    using clock = std::chrono::steady_clock;

    std::cout << "[PACER] Ticking every " << tick_interval_ms_ << " ms.\n";
    while (running.load()) {
        const auto started = clock::now();
        tick();

        // Keep serving the bus for the rest of the interval so user events
        // land between ticks.
        const auto next = started + std::chrono::milliseconds(tick_interval_ms_);
        while (running.load() && clock::now() < next) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                next - clock::now());
            bus_.pump(std::clamp(left, std::chrono::milliseconds(0),
                                 std::chrono::milliseconds(50)));
        }
    }
    std::cout << "[PACER] Stopped at tick " << seq_.load() << ".\n";
}

void Pacer::on_result(const nlohmann::json& payload) {
    const uint64_t seq = payload.at("seq").get<uint64_t>();
    uint64_t done = done_seq_.load();
    while (seq > done && !done_seq_.compare_exchange_weak(done, seq)) {
    }
}

} // namespace courier
