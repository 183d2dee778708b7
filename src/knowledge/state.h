#pragma once

#include "grid/grid.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace courier {

enum class MissionState : uint8_t {
    Idle,
    Collecting,
    Active,
    Returning,
    Stuck,
};

enum class OrderStatus : uint8_t {
    Pending,
    Loaded,
    Delivered,
};

enum class LegKind : uint8_t {
    Delivery,   // base → houses
    Return,     // last house → base
};

const char* to_string(MissionState s);
const char* to_string(OrderStatus s);
const char* to_string(LegKind k);

// Throw ValidationError on unknown names.
MissionState parse_mission_state(const std::string& s);
OrderStatus  parse_order_status(const std::string& s);
LegKind      parse_leg_kind(const std::string& s);

struct Order {
    std::string id;
    Coord       destination;
    OrderStatus status{OrderStatus::Pending};
    double      created_at{0.0};
    double      delivered_at{0.0};
};

struct PathStep {
    Coord   cell;
    LegKind leg{LegKind::Delivery};

    bool operator==(const PathStep& o) const { return cell == o.cell && leg == o.leg; }
};

struct Plan {
    std::vector<std::string> sequence;       // order ids, delivery order
    std::vector<Coord>       destinations;   // parallel to sequence
    std::vector<PathStep>    path;           // path[0] is where the robot stood
    int                      cost{0};
    double                   computed_at{0.0};
};

struct Metrics {
    int    total_deliveries{0};
    int    total_distance{0};
    int    replan_count{0};
    double average_delivery_time_s{0.0};
};

// Canonical Knowledge state. Copies of it are the "snapshots" broadcast on
// knowledge.update.
struct KnowledgeSnapshot {
    uint64_t version{0};         // bumps on every change, survives resets
    uint64_t sample_seq{0};      // tick that asked for it, 0 for broadcasts
    uint64_t applied_patch{0};   // id of the last knowledge.set processed, survives resets
    bool     initialized{false};

    Coord  base;
    int    capacity{3};
    double mission_timeout_s{30.0};

    std::vector<Order>       orders;
    std::vector<std::string> carried;
    MissionState             mission_state{MissionState::Idle};
    MissionState             resume_state{MissionState::Idle};
    std::optional<Plan>      plan;
    size_t                   plan_index{0};   // next path cell to enter
    double                   mission_started_at{0.0};
    Metrics                  metrics;

    const Order* find_order(const std::string& id) const;
    Order*       find_order(const std::string& id);

    int pending_count() const;

    // Pending orders, oldest first (ties keep arrival order).
    std::vector<const Order*> pending_orders() const;
};

} // namespace courier
