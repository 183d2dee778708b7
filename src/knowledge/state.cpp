#include "knowledge/state.h"

#include "errors/errors.h"

#include <algorithm>

namespace courier {

const char* to_string(MissionState s) {
    switch (s) {
    case MissionState::Idle:       return "idle";
    case MissionState::Collecting: return "collecting";
    case MissionState::Active:     return "active";
    case MissionState::Returning:  return "returning";
    case MissionState::Stuck:      return "stuck";
    }
    return "unknown";
}

const char* to_string(OrderStatus s) {
    switch (s) {
    case OrderStatus::Pending:   return "pending";
    case OrderStatus::Loaded:    return "loaded";
    case OrderStatus::Delivered: return "delivered";
    }
    return "unknown";
}

const char* to_string(LegKind k) {
    switch (k) {
    case LegKind::Delivery: return "delivery";
    case LegKind::Return:   return "return";
    }
    return "unknown";
}

MissionState parse_mission_state(const std::string& s) {
    if (s == "idle")       return MissionState::Idle;
    if (s == "collecting") return MissionState::Collecting;
    if (s == "active")     return MissionState::Active;
    if (s == "returning")  return MissionState::Returning;
    if (s == "stuck")      return MissionState::Stuck;
    throw ValidationError("unknown mission state '" + s + "'");
}

OrderStatus parse_order_status(const std::string& s) {
    if (s == "pending")   return OrderStatus::Pending;
    if (s == "loaded")    return OrderStatus::Loaded;
    if (s == "delivered") return OrderStatus::Delivered;
    throw ValidationError("unknown order status '" + s + "'");
}

LegKind parse_leg_kind(const std::string& s) {
    if (s == "delivery") return LegKind::Delivery;
    if (s == "return")   return LegKind::Return;
    throw ValidationError("unknown leg kind '" + s + "'");
}

const Order* KnowledgeSnapshot::find_order(const std::string& id) const {
    for (const auto& o : orders) {
        if (o.id == id) return &o;
    }
    return nullptr;
}

Order* KnowledgeSnapshot::find_order(const std::string& id) {
    for (auto& o : orders) {
        if (o.id == id) return &o;
    }
    return nullptr;
}

int KnowledgeSnapshot::pending_count() const {
    return static_cast<int>(std::count_if(orders.begin(), orders.end(),
        [](const Order& o) { return o.status == OrderStatus::Pending; }));
}

std::vector<const Order*> KnowledgeSnapshot::pending_orders() const {
    std::vector<const Order*> out;
    for (const auto& o : orders) {
        if (o.status == OrderStatus::Pending) out.push_back(&o);
    }
    std::stable_sort(out.begin(), out.end(), [](const Order* a, const Order* b) {
        return a->created_at < b->created_at;
    });
    return out;
}

} // namespace courier
