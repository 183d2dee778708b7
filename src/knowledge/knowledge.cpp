#include "knowledge/knowledge.h"

#include "errors/errors.h"
#include "messages/messages.h"

#include <algorithm>
#include <iostream>
#include <set>

namespace courier {

// ── Patch application ───────────────────────────────────────────

static const std::set<std::string> kReadOnlyFields = {
    "version", "sample_seq", "applied_patch", "initialized",
    "base", "capacity", "mission_timeout_s",
};

static void check_invariants(const KnowledgeSnapshot& before,
                             const KnowledgeSnapshot& after) {
    if (static_cast<int>(after.carried.size()) > after.capacity) {
        throw ValidationError("carried set of " + std::to_string(after.carried.size()) +
                              " exceeds capacity " + std::to_string(after.capacity));
    }
    std::set<std::string> seen;
    for (const auto& id : after.carried) {
        if (!after.find_order(id)) {
            throw ValidationError("carried order " + id + " is unknown");
        }
        if (!seen.insert(id).second) {
            throw ValidationError("order " + id + " carried twice");
        }
    }
    const size_t path_len = after.plan ? after.plan->path.size() : 0;
    if (after.plan_index > path_len) {
        throw ValidationError("plan_index " + std::to_string(after.plan_index) +
                              " beyond path of " + std::to_string(path_len));
    }

    const Metrics& m0 = before.metrics;
    const Metrics& m1 = after.metrics;
    if (m1.total_deliveries < m0.total_deliveries ||
        m1.total_distance < m0.total_distance ||
        m1.replan_count < m0.replan_count) {
        throw ValidationError("metrics may not decrease");
    }
}

bool apply_patch(KnowledgeSnapshot& state, const nlohmann::json& fields) {
    if (!fields.is_object()) {
        throw ValidationError("patch must be a JSON object");
    }
    if (!state.initialized) {
        throw ValidationError("knowledge not initialised");
    }

    KnowledgeSnapshot next = state;
    try {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            const std::string& key = it.key();
            const auto& value = it.value();

            if (key == "orders") {
                // Upsert by id: a writer holding an older order list must not
                // drop orders the user added since.
                for (const auto& o : value.get<std::vector<Order>>()) {
                    if (Order* existing = next.find_order(o.id)) {
                        *existing = o;
                    } else {
                        next.orders.push_back(o);
                    }
                }
            } else if (key == "carried") {
                value.get_to(next.carried);
            } else if (key == "mission_state") {
                value.get_to(next.mission_state);
            } else if (key == "resume_state") {
                value.get_to(next.resume_state);
            } else if (key == "plan") {
                if (value.is_null()) {
                    next.plan.reset();
                } else {
                    next.plan = value.get<Plan>();
                }
            } else if (key == "plan_index") {
                if (!value.is_number_unsigned()) {
                    throw ValidationError("plan_index must be a non-negative integer");
                }
                value.get_to(next.plan_index);
            } else if (key == "mission_started_at") {
                if (!value.is_number()) {
                    throw ValidationError("mission_started_at must be a number");
                }
                value.get_to(next.mission_started_at);
            } else if (key == "metrics") {
                value.get_to(next.metrics);
            } else if (kReadOnlyFields.count(key)) {
                throw ValidationError("field '" + key + "' is read-only");
            } else {
                throw ValidationError("unknown field '" + key + "'");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("type mismatch: ") + e.what());
    }

    check_invariants(state, next);
    if (nlohmann::json(next) == nlohmann::json(state)) return false;
    state = std::move(next);
    return true;
}

// ── Store ───────────────────────────────────────────────────────

KnowledgeStore::KnowledgeStore(MessageBus& bus, const Config& config, Clock clock)
    : bus_(bus), config_(config), clock_(std::move(clock))
{
    bus_.subscribe(channel::kKnowledgeSet,   [this](const auto& p) { on_set(p); });
    bus_.subscribe(channel::kUserAddOrder,   [this](const auto& p) { on_add_order(p); });
    bus_.subscribe(channel::kMonitorRequest, [this](const auto& p) { on_request(p); });
    bus_.subscribe(channel::kSystemInit,     [this](const auto& p) { on_reset(p); });
    bus_.subscribe(channel::kSystemReset,    [this](const auto& p) { on_reset(p); });
}

void KnowledgeStore::apply_update(const nlohmann::json& fields, uint64_t patch_id) {
    {
        std::lock_guard lock(mu_);
        if (apply_patch(state_, fields)) ++state_.version;
        if (patch_id > state_.applied_patch) state_.applied_patch = patch_id;
    }
    broadcast(0);
}

KnowledgeSnapshot KnowledgeStore::snapshot() const {
    std::lock_guard lock(mu_);
    return state_;
}

void KnowledgeStore::add_order(const std::string& order_id, const Coord& destination,
                               double created_at) {
    {
        std::lock_guard lock(mu_);
        if (!state_.initialized) {
            throw ValidationError("knowledge not initialised");
        }
        if (order_id.empty()) {
            throw ValidationError("order id is empty");
        }
        if (state_.find_order(order_id)) {
            throw ValidationError("order " + order_id + " already exists");
        }
        const auto& houses = config_.layout.houses;
        if (std::find(houses.begin(), houses.end(), destination) == houses.end()) {
            throw ValidationError("destination " + to_string(destination) + " is not a house");
        }

        Order order;
        order.id          = order_id;
        order.destination = destination;
        order.status      = OrderStatus::Pending;
        order.created_at  = created_at;
        state_.orders.push_back(std::move(order));
        ++state_.version;
    }
    std::cout << "[KNOWLEDGE] Added order " << order_id << " → "
              << to_string(destination) << "\n";
    broadcast(0);
}

void KnowledgeStore::reset() {
    {
        std::lock_guard lock(mu_);
        const uint64_t version = state_.version;
        const uint64_t applied = state_.applied_patch;

        state_ = KnowledgeSnapshot{};
        state_.version           = version + 1;
        state_.applied_patch     = applied;
        state_.initialized       = true;
        state_.base              = config_.layout.base;
        state_.capacity          = config_.capacity;
        state_.mission_timeout_s = config_.mission_timeout_s;
    }
    std::cout << "[KNOWLEDGE] Initialised with base at "
              << to_string(config_.layout.base) << ", capacity "
              << config_.capacity << "\n";
    broadcast(0);
}

// ── Handlers ────────────────────────────────────────────────────

void KnowledgeStore::on_set(const nlohmann::json& payload) {
    const auto patch = payload.get<PatchEnvelope>();
    if (patch.seq != 0 && patch.seq <= floor_seq_) {
        std::cerr << "[KNOWLEDGE] Dropping patch from tick " << patch.seq
                  << " (before reset)\n";
        mark_processed(patch.patch_id);
        return;
    }
    try {
        apply_update(patch.fields, patch.patch_id);
    } catch (const ValidationError& e) {
        std::cerr << "[KNOWLEDGE] Rejected patch " << patch.patch_id << ": "
                  << e.what() << "\n";
        mark_processed(patch.patch_id);
    }
}

// The writer still needs to see a dropped or rejected patch was processed.
void KnowledgeStore::mark_processed(uint64_t patch_id) {
    {
        std::lock_guard lock(mu_);
        if (patch_id > state_.applied_patch) state_.applied_patch = patch_id;
    }
    broadcast(0);
}

void KnowledgeStore::on_add_order(const nlohmann::json& payload) {
    const std::string id = payload.at("order_id").get<std::string>();
    const Coord dest     = payload.at("destination").get<Coord>();
    const double created = payload.value("created_at", clock_());
    try {
        add_order(id, dest, created);
    } catch (const ValidationError& e) {
        std::cerr << "[KNOWLEDGE] Rejected order " << id << ": " << e.what() << "\n";
    }
}

void KnowledgeStore::on_request(const nlohmann::json& payload) {
    broadcast(payload.at("seq").get<uint64_t>());
}

void KnowledgeStore::on_reset(const nlohmann::json& payload) {
    floor_seq_ = std::max(floor_seq_, payload.value("floor_seq", uint64_t{0}));
    reset();
}

void KnowledgeStore::broadcast(uint64_t sample_seq) {
    KnowledgeSnapshot snap = snapshot();
    if (!snap.initialized && sample_seq == 0) return;
    snap.sample_seq = sample_seq;
    bus_.publish(channel::kKnowledgeUpdate, snap);
}

} // namespace courier
