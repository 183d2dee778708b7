#pragma once

#include "bus/message_bus.h"
#include "clock/clock.h"
#include "messages/messages.h"

#include <optional>
#include <vector>

namespace courier {

// Monitor — turns one tick's fresh Knowledge and Environment samples into a
// Facts record and publishes it on monitor.result.
//
// A tick starts on monitor.request {seq}. Knowledge and Environment answer
// the same request with snapshots tagged sample_seq = seq; only when both
// have arrived are facts derived. Untagged broadcasts are ignored.
class Monitor {
public:
    explicit Monitor(MessageBus& bus, Clock clock = wall_clock);

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    // Pure derivation. `previous_obstacles` is the dynamic obstacle set seen
    // at the previous sample (nullopt on the first sample after a reset, in
    // which case the delta is empty).
    static Facts derive(const KnowledgeSnapshot& knowledge,
                        const EnvironmentSnapshot& environment,
                        const std::optional<std::vector<Coord>>& previous_obstacles,
                        double now,
                        uint64_t seq);

private:
    void on_request(const nlohmann::json& payload);
    void on_knowledge(const nlohmann::json& payload);
    void on_environment(const nlohmann::json& payload);
    void on_reset(const nlohmann::json& payload);

    void try_complete();

    MessageBus& bus_;
    Clock       clock_;

    uint64_t pending_seq_{0};
    uint64_t floor_seq_{0};
    std::optional<KnowledgeSnapshot>   knowledge_;
    std::optional<EnvironmentSnapshot> environment_;
    std::optional<std::vector<Coord>>  previous_obstacles_;
};

} // namespace courier
