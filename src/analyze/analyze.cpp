#include "analyze/analyze.h"

#include <algorithm>
#include <iostream>

namespace courier {

Verdict decide(const Facts& f) {
    if (!f.initialized) {
        return {Decision::NoAction, "not initialised"};
    }

    const MissionState s = f.mission_state;
    const bool moving = s == MissionState::Active || s == MissionState::Returning;

    if (s == MissionState::Collecting) {
        if (f.pending_count >= f.capacity) {
            return {Decision::StartMission,
                    std::to_string(f.pending_count) + " pending orders fill capacity " +
                    std::to_string(f.capacity)};
        }
        if (f.pending_count > 0 && f.elapsed_since_first_pending >= f.timeout_s) {
            return {Decision::StartMission,
                    "oldest order waited " + std::to_string(f.elapsed_since_first_pending) + "s"};
        }
    }
    if (f.robot_stuck) {
        return {Decision::EnterStuck, "no route to the remaining destinations"};
    }
    if (moving && (f.path_blocked || !f.obstacle_delta.empty())) {
        return {Decision::Replan,
                f.path_blocked ? "current leg blocked" : "obstacle layout changed"};
    }
    if (s == MissionState::Stuck && f.route_viable) {
        return {Decision::Resume, "route available again"};
    }
    if (s == MissionState::Active && f.all_delivered) {
        return {Decision::BeginReturn, "all orders delivered"};
    }
    if (s == MissionState::Returning && f.robot_at_base) {
        return {Decision::CompleteMission, "back at base"};
    }
    return {Decision::NoAction, ""};
}

Analyzer::Analyzer(MessageBus& bus) : bus_(bus) {
    bus_.subscribe(channel::kMonitorResult, [this](const auto& p) { on_result(p); });
    bus_.subscribe(channel::kSystemInit,    [this](const auto& p) { on_reset(p); });
    bus_.subscribe(channel::kSystemReset,   [this](const auto& p) { on_reset(p); });
}

void Analyzer::on_result(const nlohmann::json& payload) {
    auto in = payload.get<MonitorResult>();
    const uint64_t seq = in.facts.seq;
    if (seq <= last_seq_ || seq <= floor_seq_) {
        std::cerr << "[ANALYZE] Dropping stale result for tick " << seq << "\n";
        return;
    }
    last_seq_ = seq;

    const Verdict v = decide(in.facts);
    if (v.decision != Decision::NoAction) {
        std::cout << "[ANALYZE] Tick " << seq << ": " << to_string(v.decision)
                  << " (" << v.reason << ")\n";
    }

    AnalyzeResult out;
    out.seq         = seq;
    out.decision    = v.decision;
    out.reason      = v.reason;
    out.knowledge   = std::move(in.knowledge);
    out.environment = std::move(in.environment);
    bus_.publish(channel::kAnalyzeResult, out);
}

void Analyzer::on_reset(const nlohmann::json& payload) {
    floor_seq_ = std::max(floor_seq_, payload.value("floor_seq", uint64_t{0}));
}

} // namespace courier
