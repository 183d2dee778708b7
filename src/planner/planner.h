#pragma once

#include "bus/message_bus.h"
#include "clock/clock.h"
#include "messages/messages.h"

namespace courier {

// Turn one decision into a directive for Execute, computing a route where
// the decision needs one. Routes start at the robot's current cell, so the
// new plan's path[0] is where the robot stands. StartMission loads the
// oldest reachable pending orders up to capacity. A NoPathError from the
// pathfinder becomes an EnterStuck directive. Never throws for a missing
// route; malformed input still raises.
PlanResult plan_for(const AnalyzeResult& in, double now);

// Consumes analyze.result, publishes plan.result.
class Planner {
public:
    explicit Planner(MessageBus& bus, Clock clock = wall_clock);

    Planner(const Planner&) = delete;
    Planner& operator=(const Planner&) = delete;

private:
    void on_result(const nlohmann::json& payload);
    void on_reset(const nlohmann::json& payload);

    MessageBus& bus_;
    Clock       clock_;
    uint64_t    last_seq_{0};
    uint64_t    floor_seq_{0};
};

} // namespace courier
