#include "monitor/monitor.h"

#include "errors/errors.h"
#include "pathfinder/pathfinder.h"

#include <algorithm>
#include <iostream>
#include <iterator>

namespace courier {

namespace {

bool is_moving(MissionState s) {
    return s == MissionState::Active || s == MissionState::Returning;
}

// True when every target can be reached from `from` on `grid`.
bool reachable(const Grid& grid, const Coord& from, const std::vector<Coord>& targets) {
    try {
        for (const auto& t : targets) {
            pathfinder::find_path(from, t, grid);
        }
    } catch (const NoPathError&) {
        return false;
    }
    return true;
}

// Remaining cells of the leg the robot is on.
bool leg_blocked(const Plan& plan, size_t plan_index, const Grid& grid) {
    if (plan_index >= plan.path.size()) return false;
    const LegKind leg = plan.path[plan_index].leg;
    for (size_t i = plan_index; i < plan.path.size() && plan.path[i].leg == leg; ++i) {
        if (!grid.is_passable(plan.path[i].cell)) return true;
    }
    return false;
}

// Where the robot still has to go for the mission it is in (or, when Stuck,
// the mission it was in).
std::vector<Coord> required_targets(const KnowledgeSnapshot& k) {
    const MissionState s =
        k.mission_state == MissionState::Stuck ? k.resume_state : k.mission_state;

    std::vector<Coord> targets;
    switch (s) {
    case MissionState::Active:
        for (const auto& id : k.carried) {
            const Order* o = k.find_order(id);
            if (o && o->status == OrderStatus::Loaded) targets.push_back(o->destination);
        }
        targets.push_back(k.base);
        break;
    case MissionState::Returning:
        targets.push_back(k.base);
        break;
    case MissionState::Collecting: {
        // The houses the next mission would start with.
        const auto pending = k.pending_orders();
        const size_t n = std::min(pending.size(), static_cast<size_t>(k.capacity));
        for (size_t i = 0; i < n; ++i) targets.push_back(pending[i]->destination);
        break;
    }
    case MissionState::Idle:
    case MissionState::Stuck:
        break;
    }
    return targets;
}

} // namespace

Monitor::Monitor(MessageBus& bus, Clock clock)
    : bus_(bus), clock_(std::move(clock))
{
    bus_.subscribe(channel::kMonitorRequest,    [this](const auto& p) { on_request(p); });
    bus_.subscribe(channel::kKnowledgeUpdate,   [this](const auto& p) { on_knowledge(p); });
    bus_.subscribe(channel::kEnvironmentUpdate, [this](const auto& p) { on_environment(p); });
    bus_.subscribe(channel::kSystemInit,        [this](const auto& p) { on_reset(p); });
    bus_.subscribe(channel::kSystemReset,       [this](const auto& p) { on_reset(p); });
}

Facts Monitor::derive(const KnowledgeSnapshot& k,
                      const EnvironmentSnapshot& e,
                      const std::optional<std::vector<Coord>>& previous_obstacles,
                      double now,
                      uint64_t seq) {
    Facts f;
    f.seq = seq;
    if (!k.initialized || !e.initialized) return f;

    f.initialized   = true;
    f.mission_state = k.mission_state;
    f.capacity      = k.capacity;
    f.timeout_s     = k.mission_timeout_s;

    const auto pending = k.pending_orders();
    f.pending_count = static_cast<int>(pending.size());
    if (!pending.empty()) {
        f.elapsed_since_first_pending = std::max(0.0, now - pending.front()->created_at);
    }

    // Obstacle delta against the previous sample.
    std::vector<Coord> current = e.dynamic_obstacles;
    std::sort(current.begin(), current.end());
    if (previous_obstacles) {
        std::vector<Coord> before = *previous_obstacles;
        std::sort(before.begin(), before.end());
        std::set_difference(current.begin(), current.end(), before.begin(), before.end(),
                            std::back_inserter(f.obstacle_delta.added));
        std::set_difference(before.begin(), before.end(), current.begin(), current.end(),
                            std::back_inserter(f.obstacle_delta.removed));
    }

    const Grid grid = e.grid();
    const Coord& robot = e.robot.position;

    if (is_moving(k.mission_state) && k.plan) {
        f.path_blocked = leg_blocked(*k.plan, k.plan_index, grid);
    }
    f.route_viable  = reachable(grid, robot, required_targets(k));
    f.robot_stuck   = is_moving(k.mission_state) && !f.route_viable;
    f.robot_at_base = robot == k.base;

    if (k.mission_state == MissionState::Active) {
        f.all_delivered = std::none_of(k.carried.begin(), k.carried.end(),
            [&](const std::string& id) {
                const Order* o = k.find_order(id);
                return o && o->status == OrderStatus::Loaded;
            });
    }
    return f;
}

// ── Sampling ────────────────────────────────────────────────────

void Monitor::on_request(const nlohmann::json& payload) {
    const uint64_t seq = payload.at("seq").get<uint64_t>();
    if (seq <= floor_seq_) return;
    if (pending_seq_ != 0 && pending_seq_ != seq) {
        std::cerr << "[MONITOR] Tick " << pending_seq_ << " never completed sampling\n";
    }
    pending_seq_ = seq;
    try_complete();
}

void Monitor::on_knowledge(const nlohmann::json& payload) {
    auto snap = payload.get<KnowledgeSnapshot>();
    if (snap.sample_seq == 0 || snap.sample_seq <= floor_seq_) return;
    // A sample may overtake its own request on a multi-hop transport.
    if (snap.sample_seq < pending_seq_) return;
    knowledge_ = std::move(snap);
    try_complete();
}

void Monitor::on_environment(const nlohmann::json& payload) {
    auto snap = payload.get<EnvironmentSnapshot>();
    if (snap.sample_seq == 0 || snap.sample_seq <= floor_seq_) return;
    if (snap.sample_seq < pending_seq_) return;
    environment_ = std::move(snap);
    try_complete();
}

void Monitor::on_reset(const nlohmann::json& payload) {
    floor_seq_ = std::max(floor_seq_, payload.value("floor_seq", uint64_t{0}));
    pending_seq_ = 0;
    knowledge_.reset();
    environment_.reset();
    previous_obstacles_.reset();
    std::cout << "[MONITOR] Reset (floor " << floor_seq_ << ")\n";
}

void Monitor::try_complete() {
    if (pending_seq_ == 0 || !knowledge_ || !environment_) return;
    if (knowledge_->sample_seq != pending_seq_ ||
        environment_->sample_seq != pending_seq_) {
        return;
    }

    MonitorResult result;
    result.facts = derive(*knowledge_, *environment_, previous_obstacles_,
                          clock_(), pending_seq_);
    result.knowledge   = std::move(*knowledge_);
    result.environment = std::move(*environment_);

    if (result.environment.initialized) {
        previous_obstacles_ = result.environment.dynamic_obstacles;
    }
    knowledge_.reset();
    environment_.reset();
    pending_seq_ = 0;

    const Facts& f = result.facts;
    if (!f.obstacle_delta.empty()) {
        std::cout << "[MONITOR] Tick " << f.seq << ": obstacles +"
                  << f.obstacle_delta.added.size() << " -"
                  << f.obstacle_delta.removed.size() << "\n";
    }
    bus_.publish(channel::kMonitorResult, result);
}

} // namespace courier
