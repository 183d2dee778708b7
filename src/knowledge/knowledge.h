#pragma once

#include "bus/message_bus.h"
#include "clock/clock.h"
#include "config/config.h"
#include "knowledge/state.h"

#include <mutex>
#include <string>

namespace courier {

// Apply a field patch to `state`. All-or-nothing: on any problem (unknown
// or read-only field, wrong type, carried set over capacity, dangling order
// id) throws ValidationError and `state` is untouched. Values are absolute,
// so applying the same patch twice equals applying it once; `orders` entries
// replace the stored order with the same id or are appended. Returns false
// when the patch changed nothing.
bool apply_patch(KnowledgeSnapshot& state, const nlohmann::json& fields);

// Knowledge — the single source of truth for orders, plan, mission state,
// metrics and the carried set. Holds no decision logic.
//
//   knowledge.set          → apply_update, then broadcast
//   user.add_order         → add_order, then broadcast
//   monitor.request        → broadcast tagged with the tick's seq
//   system.init / reset    → reset
class KnowledgeStore {
public:
    KnowledgeStore(MessageBus& bus, const Config& config, Clock clock = wall_clock);

    KnowledgeStore(const KnowledgeStore&) = delete;
    KnowledgeStore& operator=(const KnowledgeStore&) = delete;

    // Throws ValidationError without mutating anything. The version only
    // moves when content changes; the snapshot is broadcast either way.
    void apply_update(const nlohmann::json& fields, uint64_t patch_id = 0);

    KnowledgeSnapshot snapshot() const;

    // User intake. Leaves mission_state alone.
    // Throws ValidationError on a duplicate id or a non-house destination.
    void add_order(const std::string& order_id, const Coord& destination,
                   double created_at);

    void reset();

private:
    void on_set(const nlohmann::json& payload);
    void on_add_order(const nlohmann::json& payload);
    void on_request(const nlohmann::json& payload);
    void on_reset(const nlohmann::json& payload);

    void mark_processed(uint64_t patch_id);
    void broadcast(uint64_t sample_seq);

    MessageBus& bus_;
    Config      config_;
    Clock       clock_;

    mutable std::mutex mu_;
    KnowledgeSnapshot  state_;
    uint64_t           floor_seq_{0};
};

} // namespace courier
