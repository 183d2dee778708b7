#include "execute/execute.h"

#include "errors/errors.h"
#include "knowledge/knowledge.h"

#include <algorithm>
#include <iostream>

namespace courier {

using nlohmann::json;

Executor::Executor(MessageBus& bus, Clock clock)
    : bus_(bus), clock_(std::move(clock))
{
    bus_.subscribe(channel::kPlanResult,        [this](const auto& p) { on_plan(p); });
    bus_.subscribe(channel::kKnowledgeUpdate,   [this](const auto& p) { on_knowledge(p); });
    bus_.subscribe(channel::kEnvironmentUpdate, [this](const auto& p) { on_environment(p); });
    bus_.subscribe(channel::kSystemInit,        [this](const auto& p) { on_reset(p); });
    bus_.subscribe(channel::kSystemReset,       [this](const auto& p) { on_reset(p); });
}

// ── Inputs ──────────────────────────────────────────────────────

void Executor::on_knowledge(const json& payload) {
    auto k = payload.get<KnowledgeSnapshot>();
    if (!k.initialized) return;
    if (k.applied_patch < last_sent_patch_) return;   // our write is still in flight
    if (knowledge_.initialized && k.version < knowledge_.version) return;
    knowledge_ = std::move(k);
}

void Executor::on_environment(const json& payload) {
    auto e = payload.get<EnvironmentSnapshot>();
    if (!e.initialized) return;
    if (environment_.initialized && e.version < environment_.version) return;
    environment_ = std::move(e);

    const CommandAck& ack = environment_.last_ack;
    if (pending_move_ && ack.command == "move" && ack.intent == pending_move_->seq) {
        on_move_ack(ack);
    }
}

void Executor::on_reset(const json& payload) {
    floor_seq_ = std::max(floor_seq_, payload.value("floor_seq", uint64_t{0}));
    pending_move_.reset();
    // Versions and patch ids survive the reset; wait for fresh snapshots.
    knowledge_.initialized   = false;
    environment_.initialized = false;
}

void Executor::on_plan(const json& payload) {
    const auto r = payload.get<PlanResult>();
    if (r.seq <= last_seq_ || r.seq <= floor_seq_) {
        std::cerr << "[EXECUTE] Dropping stale directive for tick " << r.seq << "\n";
        return;
    }
    last_seq_ = r.seq;

    if (pending_move_) {
        std::cerr << "[EXECUTE] Move for tick " << pending_move_->seq
                  << " was never acknowledged\n";
        pending_move_.reset();
    }
    if (!knowledge_.initialized) {
        std::cerr << "[EXECUTE] No knowledge yet, skipping tick " << r.seq << "\n";
        finish(r.seq);
        return;
    }

    switch (r.directive) {
    case Directive::Continue:
        if (knowledge_.mission_state == MissionState::Idle && knowledge_.pending_count() > 0) {
            collect(r.seq);
        } else {
            step(r.seq);
        }
        break;
    case Directive::StartMission:
        start_mission(r);
        break;
    case Directive::Replan: {
        Metrics m = knowledge_.metrics;
        ++m.replan_count;
        install(r, json{{"metrics", m}});
        break;
    }
    case Directive::BeginReturn:
        install(r, json{{"mission_state", MissionState::Returning}});
        break;
    case Directive::EnterStuck:
        enter_stuck(r.seq);
        break;
    case Directive::Resume:
        resume(r.seq);
        break;
    case Directive::Complete:
        complete(r.seq);
        break;
    }
}

// ── Directives ──────────────────────────────────────────────────

void Executor::start_mission(const PlanResult& r) {
    const MissionState s = knowledge_.mission_state;
    if (!r.plan || (s != MissionState::Collecting && s != MissionState::Idle)) {
        std::cerr << "[EXECUTE] Cannot start a mission from "
                  << to_string(s) << "\n";
        finish(r.seq);
        return;
    }
    if (environment_.initialized && environment_.robot.position != knowledge_.base) {
        std::cerr << "[EXECUTE] Robot is away from base, not loading\n";
        finish(r.seq);
        return;
    }

    std::vector<Order>       loaded;
    std::vector<std::string> carried;
    for (const auto& id : r.orders_to_load) {
        if (static_cast<int>(carried.size()) >= knowledge_.capacity) break;
        const Order* o = knowledge_.find_order(id);
        if (!o || o->status != OrderStatus::Pending) {
            std::cerr << "[EXECUTE] Order " << id << " is no longer pending\n";
            continue;
        }
        Order copy  = *o;
        copy.status = OrderStatus::Loaded;
        loaded.push_back(std::move(copy));
        carried.push_back(id);
    }
    if (carried.empty()) {
        finish(r.seq);
        return;
    }

    const json fields = {
        {"orders", loaded},
        {"carried", carried},
        {"mission_state", MissionState::Active},
        {"resume_state", MissionState::Idle},
        {"plan", *r.plan},
        {"plan_index", size_t{1}},
        {"mission_started_at", clock_()},
    };
    if (commit(r.seq, fields)) {
        for (const auto& id : carried) {
            command(channel::kEnvironmentLoad, r.seq, json{{"order_id", id}});
        }
        std::cout << "[EXECUTE] Mission started: " << carried.size()
                  << " orders, route cost " << r.plan->cost << "\n";
    }
    finish(r.seq);
}

void Executor::install(const PlanResult& r, json fields) {
    if (!r.plan) {
        std::cerr << "[EXECUTE] " << to_string(r.directive) << " without a plan\n";
        finish(r.seq);
        return;
    }
    fields["plan"]       = *r.plan;
    fields["plan_index"] = size_t{1};
    if (!commit(r.seq, fields)) {
        finish(r.seq);
        return;
    }
    step(r.seq);
}

void Executor::collect(uint64_t seq) {
    if (commit(seq, json{{"mission_state", MissionState::Collecting}})) {
        std::cout << "[EXECUTE] Collecting " << knowledge_.pending_count()
                  << " waiting orders\n";
    }
    finish(seq);
}

void Executor::enter_stuck(uint64_t seq) {
    const MissionState s = knowledge_.mission_state;
    if (s == MissionState::Collecting || s == MissionState::Idle) {
        // Nothing aboard; the queue is retried next tick.
        std::cerr << "[EXECUTE] No reachable order while " << to_string(s) << "\n";
    } else if (s != MissionState::Stuck) {
        const json fields = {
            {"resume_state", s},
            {"mission_state", MissionState::Stuck},
        };
        if (commit(seq, fields)) {
            command(channel::kEnvironmentStatus, seq, json{{"status", "stuck"}});
            std::cout << "[EXECUTE] Stuck while " << to_string(s) << "\n";
        }
    }
    finish(seq);
}

void Executor::resume(uint64_t seq) {
    if (knowledge_.mission_state != MissionState::Stuck) {
        finish(seq);
        return;
    }
    const MissionState back = knowledge_.resume_state;
    const json fields = {
        {"mission_state", back},
        {"resume_state", MissionState::Idle},
    };
    if (!commit(seq, fields)) {
        finish(seq);
        return;
    }
    command(channel::kEnvironmentStatus, seq, json{{"status", "idle"}});
    std::cout << "[EXECUTE] Resuming " << to_string(back) << "\n";
    step(seq);
}

void Executor::complete(uint64_t seq) {
    // Anything still aboard goes back in the queue.
    std::vector<Order> requeued;
    for (const auto& id : knowledge_.carried) {
        const Order* o = knowledge_.find_order(id);
        if (o && o->status == OrderStatus::Loaded) {
            Order copy  = *o;
            copy.status = OrderStatus::Pending;
            requeued.push_back(std::move(copy));
        }
    }

    const bool waiting = knowledge_.pending_count() + static_cast<int>(requeued.size()) > 0;
    json fields = {
        {"plan", nullptr},
        {"plan_index", size_t{0}},
        {"carried", json::array()},
        {"mission_state", waiting ? MissionState::Collecting : MissionState::Idle},
        {"mission_started_at", 0.0},
    };
    if (!requeued.empty()) fields["orders"] = requeued;

    if (commit(seq, fields)) {
        command(channel::kEnvironmentClear, seq, json::object());
        std::cout << "[EXECUTE] Mission complete, " << knowledge_.metrics.total_deliveries
                  << " deliveries so far\n";
    }
    finish(seq);
}

// ── Movement ────────────────────────────────────────────────────

void Executor::step(uint64_t seq) {
    const MissionState s = knowledge_.mission_state;
    const bool moving = s == MissionState::Active || s == MissionState::Returning;
    if (!moving || !knowledge_.plan || knowledge_.plan_index >= knowledge_.plan->path.size()) {
        finish(seq);
        return;
    }
    if (!environment_.initialized) {
        std::cerr << "[EXECUTE] No environment yet, holding position\n";
        finish(seq);
        return;
    }

    const Coord  target = knowledge_.plan->path[knowledge_.plan_index].cell;
    const Coord& here   = environment_.robot.position;
    if (manhattan(here, target) != 1) {
        std::cerr << "[EXECUTE] Robot at " << to_string(here) << " is not next to "
                  << to_string(target) << "\n";
        finish(seq);
        return;
    }
    if (!environment_.grid().is_passable(target)) {
        std::cerr << "[EXECUTE] Next cell " << to_string(target)
                  << " is blocked, waiting for a new route\n";
        finish(seq);
        return;
    }

    pending_move_ = PendingMove{seq, target};
    command(channel::kEnvironmentMove, seq, json{{"target", target}});
}

void Executor::on_move_ack(const CommandAck& ack) {
    const PendingMove move = *pending_move_;
    pending_move_.reset();

    if (!ack.ok) {
        std::cerr << "[EXECUTE] Move to " << to_string(move.target)
                  << " rejected: " << ack.error << "\n";
        finish(move.seq);
        return;
    }

    Metrics m = knowledge_.metrics;
    m.total_distance += 1;

    const double now = clock_();
    std::vector<Order>       delivered;
    std::vector<std::string> carried;
    for (const auto& id : knowledge_.carried) {
        const Order* o = knowledge_.find_order(id);
        if (o && o->status == OrderStatus::Loaded && o->destination == move.target) {
            Order d        = *o;
            d.status       = OrderStatus::Delivered;
            d.delivered_at = now;
            m.total_deliveries += 1;
            m.average_delivery_time_s +=
                ((now - d.created_at) - m.average_delivery_time_s) / m.total_deliveries;
            delivered.push_back(std::move(d));
        } else {
            carried.push_back(id);
        }
    }

    json fields = {
        {"plan_index", knowledge_.plan_index + 1},
        {"metrics", m},
    };
    if (!delivered.empty()) {
        fields["orders"]  = delivered;
        fields["carried"] = carried;
    }
    if (commit(move.seq, fields)) {
        for (const auto& d : delivered) {
            command(channel::kEnvironmentDeliver, move.seq, json{{"order_id", d.id}});
            std::cout << "[EXECUTE] Delivered " << d.id << " at "
                      << to_string(d.destination) << "\n";
        }
    }
    finish(move.seq);
}

// ── Outputs ─────────────────────────────────────────────────────

bool Executor::commit(uint64_t seq, const json& fields) {
    try {
        apply_patch(knowledge_, fields);
    } catch (const ValidationError& e) {
        std::cerr << "[EXECUTE] Patch not sent: " << e.what() << "\n";
        return false;
    }

    PatchEnvelope patch;
    patch.seq      = seq;
    patch.patch_id = next_patch_id_++;
    patch.fields   = fields;
    last_sent_patch_ = patch.patch_id;
    bus_.publish(channel::kKnowledgeSet, patch);
    return true;
}

void Executor::command(const char* topic, uint64_t seq, json body) {
    body["seq"]    = seq;
    body["intent"] = seq;
    bus_.publish(topic, body);
}

void Executor::finish(uint64_t seq) {
    bus_.publish(channel::kExecuteResult, json{{"seq", seq}});
}

} // namespace courier
