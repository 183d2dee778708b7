#include "planner/planner.h"

#include "errors/errors.h"
#include "pathfinder/pathfinder.h"

#include <algorithm>
#include <iostream>

namespace courier {

namespace {

void tag_onto(std::vector<PathStep>& out, const pathfinder::Path& cells, LegKind leg) {
    // Drop the junction cell already at the end of `out`.
    size_t first = (!out.empty() && !cells.empty() && out.back().cell == cells.front()) ? 1 : 0;
    for (size_t i = first; i < cells.size(); ++i) {
        out.push_back({cells[i], leg});
    }
}

// Deliveries to `orders` (in optimised order) from `start`, then home.
Plan route_through(const std::vector<const Order*>& orders,
                   const Coord& start,
                   const Grid& grid,
                   const Coord& base,
                   double now) {
    std::vector<Coord> dests;
    dests.reserve(orders.size());
    for (const Order* o : orders) dests.push_back(o->destination);

    const pathfinder::Sequence seq = pathfinder::optimize_sequence(start, dests, grid);

    Plan plan;
    for (size_t idx : seq.order) {
        plan.sequence.push_back(orders[idx]->id);
        plan.destinations.push_back(orders[idx]->destination);
    }
    tag_onto(plan.path, seq.path, LegKind::Delivery);

    const Coord last = plan.path.empty() ? start : plan.path.back().cell;
    tag_onto(plan.path, pathfinder::find_path(last, base, grid), LegKind::Return);

    plan.cost        = static_cast<int>(plan.path.size()) - 1;
    plan.computed_at = now;
    return plan;
}

Plan route_home(const Coord& start, const Grid& grid, const Coord& base, double now) {
    Plan plan;
    tag_onto(plan.path, pathfinder::find_path(start, base, grid), LegKind::Return);
    plan.cost        = static_cast<int>(plan.path.size()) - 1;
    plan.computed_at = now;
    return plan;
}

} // namespace

PlanResult plan_for(const AnalyzeResult& in, double now) {
    PlanResult out;
    out.seq    = in.seq;
    out.reason = in.reason;

    const KnowledgeSnapshot&   k = in.knowledge;
    const EnvironmentSnapshot& e = in.environment;

    switch (in.decision) {
    case Decision::NoAction:        out.directive = Directive::Continue;   return out;
    case Decision::EnterStuck:      out.directive = Directive::EnterStuck; return out;
    case Decision::Resume:          out.directive = Directive::Resume;     return out;
    case Decision::CompleteMission: out.directive = Directive::Complete;   return out;
    case Decision::StartMission:
    case Decision::Replan:
    case Decision::BeginReturn:
        break;
    }

    if (!k.initialized || !e.initialized) {
        throw ValidationError(std::string("cannot plan ") + to_string(in.decision) +
                              " without initialised snapshots");
    }

    const Grid   grid  = e.grid();
    const Coord& robot = e.robot.position;

    try {
        switch (in.decision) {
        case Decision::StartMission: {
            // Oldest reachable orders first; an unreachable house stays pending.
            std::vector<const Order*> load;
            for (const Order* o : k.pending_orders()) {
                if (load.size() >= static_cast<size_t>(k.capacity)) break;
                try {
                    (void)pathfinder::find_path(robot, o->destination, grid);
                    load.push_back(o);
                } catch (const NoPathError&) {
                    std::cerr << "[PLAN] " << o->id << " at " << to_string(o->destination)
                              << " is unreachable, leaving it pending\n";
                }
            }
            if (load.empty()) throw NoPathError("no pending order is reachable");
            out.plan = route_through(load, robot, grid, k.base, now);
            out.orders_to_load = out.plan->sequence;
            out.directive = Directive::StartMission;
            break;
        }
        case Decision::Replan: {
            std::vector<const Order*> remaining;
            if (k.mission_state == MissionState::Active) {
                for (const auto& id : k.carried) {
                    const Order* o = k.find_order(id);
                    if (o && o->status == OrderStatus::Loaded) remaining.push_back(o);
                }
            }
            out.plan = remaining.empty()
                ? route_home(robot, grid, k.base, now)
                : route_through(remaining, robot, grid, k.base, now);
            out.directive = Directive::Replan;
            break;
        }
        case Decision::BeginReturn:
            out.plan = route_home(robot, grid, k.base, now);
            out.directive = Directive::BeginReturn;
            break;
        default:
            break;
        }
    } catch (const NoPathError& err) {
        out.plan.reset();
        out.orders_to_load.clear();
        out.directive = Directive::EnterStuck;
        out.reason    = err.what();
    }
    return out;
}

// ── Bus unit ────────────────────────────────────────────────────

Planner::Planner(MessageBus& bus, Clock clock)
    : bus_(bus), clock_(std::move(clock))
{
    bus_.subscribe(channel::kAnalyzeResult, [this](const auto& p) { on_result(p); });
    bus_.subscribe(channel::kSystemInit,    [this](const auto& p) { on_reset(p); });
    bus_.subscribe(channel::kSystemReset,   [this](const auto& p) { on_reset(p); });
}

void Planner::on_result(const nlohmann::json& payload) {
    const auto in = payload.get<AnalyzeResult>();
    if (in.seq <= last_seq_ || in.seq <= floor_seq_) {
        std::cerr << "[PLAN] Dropping stale decision for tick " << in.seq << "\n";
        return;
    }
    last_seq_ = in.seq;

    const PlanResult out = plan_for(in, clock_());
    if (out.plan) {
        std::cout << "[PLAN] Tick " << out.seq << ": " << to_string(out.directive)
                  << ", " << out.plan->sequence.size() << " stops, cost "
                  << out.plan->cost << "\n";
    } else if (out.directive == Directive::EnterStuck) {
        std::cout << "[PLAN] Tick " << out.seq << ": stuck (" << out.reason << ")\n";
    }
    bus_.publish(channel::kPlanResult, out);
}

void Planner::on_reset(const nlohmann::json& payload) {
    floor_seq_ = std::max(floor_seq_, payload.value("floor_seq", uint64_t{0}));
}

} // namespace courier
