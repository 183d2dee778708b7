#pragma once

#include "bus/message_bus.h"
#include "clock/clock.h"
#include "messages/messages.h"

#include <optional>

namespace courier {

// Execute — the mission state machine and the only writer of mission and
// metric fields in Knowledge.
//
// Consumes plan.result, applies the directive through knowledge.set and
// drives the robot through environment.* commands. A move only counts once
// the environment acknowledges it (last_ack with intent == tick seq); the
// tick then finishes with execute.result {seq}.
//
// Keeps a local Knowledge view. Its own patches are applied to that view as
// they are sent; a knowledge.update replaces the view only once it reflects
// the last patch sent (applied_patch), so an older broadcast never rolls
// back a write that is still in flight.
class Executor {
public:
    explicit Executor(MessageBus& bus, Clock clock = wall_clock);

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    const KnowledgeSnapshot& knowledge() const { return knowledge_; }

    // True while a move is waiting for its acknowledgement.
    bool awaiting_move() const { return pending_move_.has_value(); }

private:
    struct PendingMove {
        uint64_t seq{0};
        Coord    target;
    };

    void on_plan(const nlohmann::json& payload);
    void on_knowledge(const nlohmann::json& payload);
    void on_environment(const nlohmann::json& payload);
    void on_reset(const nlohmann::json& payload);

    void start_mission(const PlanResult& r);
    void install(const PlanResult& r, nlohmann::json fields);
    // Idle with waiting orders moves to Collecting.
    void collect(uint64_t seq);
    void enter_stuck(uint64_t seq);
    void resume(uint64_t seq);
    void complete(uint64_t seq);

    // Ask the environment to enter path[plan_index]; finishes the tick when
    // no move is possible.
    void step(uint64_t seq);
    void on_move_ack(const CommandAck& ack);

    // Send a field patch to Knowledge and apply it to the local view.
    // Returns false (and sends nothing) when the patch does not validate.
    bool commit(uint64_t seq, const nlohmann::json& fields);

    void command(const char* topic, uint64_t seq, nlohmann::json body);
    void finish(uint64_t seq);

    MessageBus& bus_;
    Clock       clock_;

    KnowledgeSnapshot   knowledge_;
    EnvironmentSnapshot environment_;

    std::optional<PendingMove> pending_move_;
    uint64_t last_seq_{0};
    uint64_t floor_seq_{0};
    uint64_t next_patch_id_{1};
    uint64_t last_sent_patch_{0};
};

} // namespace courier
