#include <doctest/doctest.h>

#include "bus/in_process_bus.h"
#include "errors/errors.h"
#include "fixtures.h"
#include "knowledge/knowledge.h"
#include "messages/messages.h"

using namespace courier;
using nlohmann::json;

namespace {

struct KnowledgeFixture {
    InProcessBus   bus;
    Config         cfg = test::open_config(2);
    double         now = 100.0;
    KnowledgeStore store{bus, cfg, [this] { return now; }};
    test::Recorder updates{bus, channel::kKnowledgeUpdate};

    KnowledgeFixture() {
        store.reset();
        bus.pump(std::chrono::milliseconds(0));
        updates.seen.clear();
    }
};

} // namespace

TEST_CASE("Knowledge/StartsUninitialised") {
    InProcessBus bus;
    KnowledgeStore store(bus, test::open_config());
    CHECK_FALSE(store.snapshot().initialized);
    CHECK_THROWS_AS(store.add_order("ORD_001", {8, 1}, 0.0), ValidationError);
    CHECK_THROWS_AS(store.apply_update(json{{"carried", json::array()}}), ValidationError);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/ResetInitialises") {
    const auto k = store.snapshot();
    CHECK(k.initialized);
    CHECK(k.base == Coord{1, 1});
    CHECK(k.capacity == 2);
    CHECK(k.mission_state == MissionState::Idle);
    CHECK(k.orders.empty());
    CHECK(k.metrics.total_deliveries == 0);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/AddOrder") {
    store.add_order("ORD_001", {8, 8}, 50.0);
    auto k = store.snapshot();
    REQUIRE(k.orders.size() == 1u);
    CHECK(k.orders[0].status == OrderStatus::Pending);
    CHECK(k.orders[0].created_at == doctest::Approx(50.0));
    CHECK(k.mission_state == MissionState::Idle);   // Execute moves it on

    CHECK_THROWS_AS(store.add_order("ORD_001", {8, 1}, 51.0), ValidationError);
    CHECK_THROWS_AS(store.add_order("ORD_002", {3, 3}, 51.0), ValidationError);   // not a house
    CHECK_THROWS_AS(store.add_order("", {8, 1}, 51.0), ValidationError);
    CHECK(store.snapshot().orders.size() == 1u);

    bus.pump(std::chrono::milliseconds(0));
    CHECK(updates.seen.size() == 1u);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/AddOrderOverBus") {
    bus.publish(channel::kUserAddOrder,
                json{{"order_id", "ORD_007"}, {"destination", Coord{1, 8}}});
    bus.publish(channel::kUserAddOrder,
                json{{"order_id", "ORD_008"}, {"destination", Coord{5, 5}}});
    bus.pump(std::chrono::milliseconds(0));

    const auto k = store.snapshot();
    REQUIRE(k.orders.size() == 1u);
    CHECK(k.orders[0].id == "ORD_007");
    CHECK(k.orders[0].created_at == doctest::Approx(100.0));
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/PatchValidation") {
    store.add_order("ORD_001", {8, 1}, 0.0);
    const auto before = store.snapshot();

    CHECK_THROWS_AS(store.apply_update(json{{"colour", "red"}}), ValidationError);
    CHECK_THROWS_AS(store.apply_update(json{{"capacity", 9}}), ValidationError);
    CHECK_THROWS_AS(store.apply_update(json{{"mission_state", 5}}), ValidationError);
    CHECK_THROWS_AS(store.apply_update(json{{"mission_state", "flying"}}), ValidationError);
    CHECK_THROWS_AS(store.apply_update(json{{"plan_index", -1}}), ValidationError);
    CHECK_THROWS_AS(store.apply_update(json::array()), ValidationError);
    CHECK_THROWS_AS(store.apply_update(json{{"carried", {"ORD_404"}}}), ValidationError);

    // All-or-nothing: the valid field is not applied either.
    CHECK_THROWS_AS(store.apply_update(json{{"mission_state", "active"}, {"colour", 1}}),
                    ValidationError);

    CHECK(json(store.snapshot()) == json(before));
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/CarriedNeverExceedsCapacity") {
    store.add_order("A", {8, 1}, 0.0);
    store.add_order("B", {8, 8}, 0.0);
    store.add_order("C", {1, 8}, 0.0);

    CHECK_THROWS_AS(store.apply_update(json{{"carried", {"A", "B", "C"}}}), ValidationError);
    CHECK_THROWS_AS(store.apply_update(json{{"carried", {"A", "A"}}}), ValidationError);
    store.apply_update(json{{"carried", {"A", "B"}}});
    CHECK(store.snapshot().carried.size() == 2u);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/MetricsNeverDecrease") {
    Metrics m;
    m.total_distance = 4;
    store.apply_update(json{{"metrics", m}});
    m.total_distance = 3;
    CHECK_THROWS_AS(store.apply_update(json{{"metrics", m}}), ValidationError);
    CHECK(store.snapshot().metrics.total_distance == 4);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/PatchIsIdempotent") {
    store.add_order("A", {8, 1}, 0.0);
    Order loaded = store.snapshot().orders[0];
    loaded.status = OrderStatus::Loaded;

    const json patch = {
        {"orders", {loaded}},
        {"carried", {"A"}},
        {"mission_state", "active"},
        {"mission_started_at", 12.5},
    };
    store.apply_update(patch);
    const auto once = store.snapshot();
    store.apply_update(patch);
    const auto twice = store.snapshot();

    CHECK(json(once) == json(twice));
    CHECK(once.mission_state == MissionState::Active);
    // Both applications broadcast, even the one that changed nothing.
    bus.pump(std::chrono::milliseconds(0));
    CHECK(updates.seen.size() == 3u);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/OrdersPatchKeepsUnmentionedOrders") {
    store.add_order("A", {8, 1}, 0.0);
    Order a = store.snapshot().orders[0];
    store.add_order("B", {8, 8}, 1.0);   // arrives after the writer read its view

    a.status = OrderStatus::Loaded;
    store.apply_update(json{{"orders", {a}}, {"carried", {"A"}}});

    const auto k = store.snapshot();
    REQUIRE(k.orders.size() == 2u);
    CHECK(k.find_order("A")->status == OrderStatus::Loaded);
    CHECK(k.find_order("B")->status == OrderStatus::Pending);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/MissionStateIsStoredAsWritten") {
    store.add_order("A", {8, 1}, 0.0);
    CHECK(store.snapshot().mission_state == MissionState::Idle);

    store.apply_update(json{{"mission_state", "collecting"}});
    CHECK(store.snapshot().mission_state == MissionState::Collecting);

    // Idle with a waiting order is kept as Idle.
    store.apply_update(json{{"mission_state", "idle"}});
    CHECK(store.snapshot().mission_state == MissionState::Idle);

    store.add_order("B", {8, 8}, 1.0);
    CHECK(store.snapshot().mission_state == MissionState::Idle);
    CHECK(store.snapshot().pending_count() == 2);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/PlanAndIndex") {
    Plan plan;
    plan.path = {{{1, 1}, LegKind::Delivery}, {{2, 1}, LegKind::Delivery},
                 {{1, 1}, LegKind::Return}};
    plan.cost = 2;
    store.apply_update(json{{"plan", plan}, {"plan_index", size_t{3}}});
    CHECK(store.snapshot().plan_index == 3u);
    CHECK_THROWS_AS(store.apply_update(json{{"plan_index", size_t{4}}}), ValidationError);

    store.apply_update(json{{"plan", nullptr}, {"plan_index", size_t{0}}});
    CHECK_FALSE(store.snapshot().plan.has_value());
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/VersionMovesOnlyOnChange") {
    const uint64_t v0 = store.snapshot().version;
    store.apply_update(json{{"mission_state", "collecting"}});
    const uint64_t v1 = store.snapshot().version;
    CHECK(v1 == v0 + 1);
    store.apply_update(json{{"mission_state", "collecting"}});
    CHECK(store.snapshot().version == v1);

    store.reset();
    CHECK(store.snapshot().version == v1 + 1);
    CHECK(store.snapshot().mission_state == MissionState::Idle);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/AnswersMonitorRequest") {
    bus.publish(channel::kMonitorRequest, json{{"seq", 42}});
    bus.pump(std::chrono::milliseconds(0));
    REQUIRE(updates.seen.size() == 1u);
    CHECK(updates.seen[0].at("sample_seq").get<uint64_t>() == 42u);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/PatchEnvelopes") {
    PatchEnvelope good;
    good.seq      = 3;
    good.patch_id = 7;
    good.fields   = json{{"mission_state", "collecting"}};
    bus.publish(channel::kKnowledgeSet, good);

    PatchEnvelope bad;
    bad.seq      = 3;
    bad.patch_id = 8;
    bad.fields   = json{{"capacity", 1}};
    bus.publish(channel::kKnowledgeSet, bad);
    bus.pump(std::chrono::milliseconds(0));

    const auto k = store.snapshot();
    CHECK(k.mission_state == MissionState::Collecting);
    CHECK(k.capacity == 2);
    CHECK(k.applied_patch == 8u);   // rejected, but processed
    CHECK(updates.seen.size() == 2u);
}

TEST_CASE_FIXTURE(KnowledgeFixture, "Knowledge/DropsPatchesFromBeforeReset") {
    bus.publish(channel::kSystemReset, json{{"floor_seq", 10}});
    bus.pump(std::chrono::milliseconds(0));

    PatchEnvelope stale;
    stale.seq      = 9;
    stale.patch_id = 4;
    stale.fields   = json{{"mission_state", "collecting"}};
    bus.publish(channel::kKnowledgeSet, stale);
    bus.pump(std::chrono::milliseconds(0));

    const auto k = store.snapshot();
    CHECK(k.mission_state == MissionState::Idle);
    CHECK(k.applied_patch == 4u);
}
