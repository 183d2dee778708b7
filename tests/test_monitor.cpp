#include <doctest/doctest.h>

#include "bus/in_process_bus.h"
#include "environment/environment.h"
#include "fixtures.h"
#include "knowledge/knowledge.h"
#include "monitor/monitor.h"

using namespace courier;
using nlohmann::json;

namespace {

KnowledgeSnapshot knowledge_at(MissionState state) {
    KnowledgeSnapshot k;
    k.initialized       = true;
    k.base              = {1, 1};
    k.capacity          = 3;
    k.mission_timeout_s = 30.0;
    k.mission_state     = state;
    return k;
}

EnvironmentSnapshot environment_with(const Coord& robot, std::vector<Coord> obstacles = {}) {
    EnvironmentSnapshot e;
    e.initialized       = true;
    e.layout            = test::open_config().layout;
    e.dynamic_obstacles = std::move(obstacles);
    e.robot.position    = robot;
    return e;
}

Order order(const std::string& id, Coord dest, OrderStatus status, double created) {
    Order o;
    o.id          = id;
    o.destination = dest;
    o.status      = status;
    o.created_at  = created;
    return o;
}

// (1,1) → (8,1) along y = 1, then back.
Plan straight_plan() {
    Plan p;
    p.sequence     = {"A"};
    p.destinations = {{8, 1}};
    for (int x = 1; x <= 8; ++x) p.path.push_back({{x, 1}, LegKind::Delivery});
    for (int x = 7; x >= 1; --x) p.path.push_back({{x, 1}, LegKind::Return});
    p.cost = static_cast<int>(p.path.size()) - 1;
    return p;
}

KnowledgeSnapshot active_mission() {
    KnowledgeSnapshot k = knowledge_at(MissionState::Active);
    k.orders     = {order("A", {8, 1}, OrderStatus::Loaded, 0.0)};
    k.carried    = {"A"};
    k.plan       = straight_plan();
    k.plan_index = 3;
    return k;
}

} // namespace

TEST_CASE("Monitor/NeutralWhenUninitialised") {
    const Facts f = Monitor::derive(KnowledgeSnapshot{}, EnvironmentSnapshot{},
                                    std::nullopt, 10.0, 4);
    CHECK(f.seq == 4u);
    CHECK_FALSE(f.initialized);
    CHECK(f.mission_state == MissionState::Idle);
    CHECK(f.pending_count == 0);
    CHECK_FALSE(f.path_blocked);
    CHECK_FALSE(f.robot_stuck);
    CHECK(f.obstacle_delta.empty());
}

TEST_CASE("Monitor/PendingAndElapsed") {
    KnowledgeSnapshot k = knowledge_at(MissionState::Collecting);
    k.orders = {
        order("A", {8, 1}, OrderStatus::Pending, 100.0),
        order("B", {8, 8}, OrderStatus::Pending, 90.0),
        order("C", {1, 8}, OrderStatus::Delivered, 10.0),
    };
    const Facts f = Monitor::derive(k, environment_with({1, 1}), std::nullopt, 130.0, 1);
    CHECK(f.initialized);
    CHECK(f.pending_count == 2);
    CHECK(f.elapsed_since_first_pending == doctest::Approx(40.0));
    CHECK(f.capacity == 3);
    CHECK(f.timeout_s == doctest::Approx(30.0));
    CHECK(f.robot_at_base);
}

TEST_CASE("Monitor/ObstacleDelta") {
    const auto k = knowledge_at(MissionState::Idle);
    const auto e = environment_with({1, 1}, {{4, 4}, {6, 2}});

    const Facts first = Monitor::derive(k, e, std::nullopt, 0.0, 1);
    CHECK(first.obstacle_delta.empty());

    const std::vector<Coord> previous{{3, 3}, {6, 2}};
    const Facts f = Monitor::derive(k, e, previous, 0.0, 2);
    CHECK(f.obstacle_delta.added == std::vector<Coord>{{4, 4}});
    CHECK(f.obstacle_delta.removed == std::vector<Coord>{{3, 3}});
}

TEST_CASE("Monitor/PathBlockedLooksAtCurrentLeg") {
    const auto k = active_mission();

    const Facts clear = Monitor::derive(k, environment_with({3, 1}), std::nullopt, 0.0, 1);
    CHECK_FALSE(clear.path_blocked);
    CHECK(clear.route_viable);
    CHECK_FALSE(clear.all_delivered);

    const Facts ahead =
        Monitor::derive(k, environment_with({3, 1}, {{6, 1}}), std::nullopt, 0.0, 2);
    CHECK(ahead.path_blocked);
    CHECK(ahead.route_viable);
    CHECK_FALSE(ahead.robot_stuck);

    // Already walked past it.
    const Facts behind =
        Monitor::derive(k, environment_with({3, 1}, {{2, 1}}), std::nullopt, 0.0, 3);
    CHECK_FALSE(behind.path_blocked);
}

TEST_CASE("Monitor/ReturnLegIsNotCheckedDuringDelivery") {
    // Return leg runs along y = 2; an obstacle there is not on the current leg.
    KnowledgeSnapshot k = active_mission();
    Plan p;
    p.sequence     = {"A"};
    p.destinations = {{8, 1}};
    for (int x = 1; x <= 8; ++x) p.path.push_back({{x, 1}, LegKind::Delivery});
    p.path.push_back({{8, 2}, LegKind::Return});
    for (int x = 7; x >= 1; --x) p.path.push_back({{x, 2}, LegKind::Return});
    p.path.push_back({{1, 1}, LegKind::Return});
    k.plan = p;

    const Facts f = Monitor::derive(k, environment_with({3, 1}, {{5, 2}}), std::nullopt, 0.0, 1);
    CHECK_FALSE(f.path_blocked);
}

TEST_CASE("Monitor/StuckWhenBoxedIn") {
    KnowledgeSnapshot k = active_mission();
    const auto e = environment_with({5, 5}, {{5, 4}, {5, 6}, {4, 5}, {6, 5}});
    k.plan_index = 1;

    const Facts f = Monitor::derive(k, e, std::nullopt, 0.0, 1);
    CHECK_FALSE(f.route_viable);
    CHECK(f.robot_stuck);
}

TEST_CASE("Monitor/StuckStateUsesResumeState") {
    KnowledgeSnapshot k = active_mission();
    k.mission_state = MissionState::Stuck;
    k.resume_state  = MissionState::Active;

    const Facts boxed = Monitor::derive(k, environment_with({5, 5}, {{5, 4}, {5, 6}, {4, 5}, {6, 5}}),
                                        std::nullopt, 0.0, 1);
    CHECK_FALSE(boxed.route_viable);
    CHECK_FALSE(boxed.robot_stuck);   // already stuck

    const Facts open = Monitor::derive(k, environment_with({5, 5}, {{5, 4}, {5, 6}, {4, 5}}),
                                       std::nullopt, 0.0, 2);
    CHECK(open.route_viable);
}

TEST_CASE("Monitor/AllDeliveredAndAtBase") {
    KnowledgeSnapshot k = knowledge_at(MissionState::Active);
    k.orders  = {order("A", {8, 1}, OrderStatus::Delivered, 0.0)};
    k.carried = {};
    CHECK(Monitor::derive(k, environment_with({8, 1}), std::nullopt, 0.0, 1).all_delivered);

    k.mission_state = MissionState::Returning;
    const Facts home = Monitor::derive(k, environment_with({1, 1}), std::nullopt, 0.0, 2);
    CHECK(home.robot_at_base);
    CHECK_FALSE(home.all_delivered);
}

TEST_CASE("Monitor/WaitsForBothFreshSamples") {
    InProcessBus   bus;
    const Config   cfg = test::open_config();
    KnowledgeStore knowledge(bus, cfg);
    Environment    environment(bus, cfg);
    Monitor        monitor(bus);
    test::Recorder results(bus, channel::kMonitorResult);

    bus.publish(channel::kSystemInit, json{{"floor_seq", 0}});
    bus.pump(std::chrono::milliseconds(0));
    CHECK(results.seen.empty());   // init broadcasts are not samples

    bus.publish(channel::kMonitorRequest, json{{"seq", 1}});
    bus.pump(std::chrono::milliseconds(0));
    REQUIRE(results.seen.size() == 1u);

    const auto r = results.seen[0].get<MonitorResult>();
    CHECK(r.facts.seq == 1u);
    CHECK(r.facts.initialized);
    CHECK(r.knowledge.sample_seq == 1u);
    CHECK(r.environment.sample_seq == 1u);
    CHECK(r.environment.robot.position == Coord{1, 1});

    // An obstacle placed between samples shows up as a delta.
    environment.toggle_obstacle({4, 4});
    bus.publish(channel::kMonitorRequest, json{{"seq", 2}});
    bus.pump(std::chrono::milliseconds(0));
    REQUIRE(results.seen.size() == 2u);
    const auto r2 = results.seen[1].get<MonitorResult>();
    CHECK(r2.facts.obstacle_delta.added == std::vector<Coord>{{4, 4}});
}
