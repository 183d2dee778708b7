#include <doctest/doctest.h>

#include "bus/in_process_bus.h"
#include "errors/errors.h"
#include "ipc/zmq_bus.h"
#include "messages/messages.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace courier;
using nlohmann::json;

TEST_CASE("Bus/FifoPerChannel") {
    InProcessBus bus;
    std::vector<int> seen;
    bus.subscribe("a", [&](const json& p) { seen.push_back(p.at("n").get<int>()); });

    for (int n = 0; n < 5; ++n) bus.publish("a", json{{"n", n}});
    CHECK(bus.queued() == 5u);
    CHECK(bus.pump(std::chrono::milliseconds(0)) == 5u);
    CHECK(seen == std::vector<int>{0, 1, 2, 3, 4});
    CHECK(bus.queued() == 0u);
}

TEST_CASE("Bus/ResetOvertakesQueuedTraffic") {
    InProcessBus bus;
    std::vector<std::string> order;
    for (const char* c : {channel::kMonitorRequest, channel::kSystemReset, channel::kPlanResult}) {
        bus.subscribe(c, [&order, c](const json&) { order.emplace_back(c); });
    }

    bus.publish(channel::kMonitorRequest, json{{"seq", 1}});
    bus.publish(channel::kPlanResult, json::object());
    bus.publish(channel::kSystemReset, json{{"floor_seq", 1}});
    bus.pump(std::chrono::milliseconds(0));

    const std::vector<std::string> expected{channel::kSystemReset, channel::kMonitorRequest,
                                            channel::kPlanResult};
    CHECK(order == expected);
    CHECK(is_priority_channel(channel::kSystemInit));
    CHECK_FALSE(is_priority_channel(channel::kKnowledgeSet));
}

TEST_CASE("Bus/HandlersRunInCausalOrder") {
    InProcessBus bus;
    std::vector<std::string> order;
    bus.subscribe("first", [&](const json&) {
        order.emplace_back("first");
        bus.publish("second", json::object());
    });
    bus.subscribe("second", [&](const json&) { order.emplace_back("second"); });

    bus.publish("first", json::object());
    CHECK(bus.pump(std::chrono::milliseconds(0)) == 2u);
    CHECK(order == std::vector<std::string>{"first", "second"});
}

TEST_CASE("Bus/ThrowingHandlerIsContained") {
    InProcessBus bus;
    int after = 0;
    bus.subscribe("x", [](const json&) { throw std::runtime_error("boom"); });
    bus.subscribe("x", [&](const json&) { ++after; });
    bus.subscribe("y", [](const json& p) { p.at("missing").get<int>(); });
    bus.subscribe("y", [&](const json&) { ++after; });

    bus.publish("x", json::object());
    bus.publish("y", json::object());
    CHECK(bus.pump(std::chrono::milliseconds(0)) == 2u);
    CHECK(after == 2);
}

TEST_CASE("Bus/PumpIsNotReentrant") {
    InProcessBus bus;
    size_t inner = 99;
    bus.subscribe("outer", [&](const json&) { inner = bus.pump(std::chrono::milliseconds(0)); });
    bus.publish("outer", json::object());
    bus.pump(std::chrono::milliseconds(0));
    CHECK(inner == 0u);
}

TEST_CASE("Bus/PumpWaitsForTimeout") {
    InProcessBus bus;
    const auto t0 = std::chrono::steady_clock::now();
    CHECK(bus.pump(std::chrono::milliseconds(20)) == 0u);
    CHECK(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(15));
}

TEST_CASE("Bus/DeriveSubEndpoint") {
    CHECK(derive_sub_endpoint("tcp://127.0.0.1:5555") == "tcp://127.0.0.1:5556");
    CHECK(derive_sub_endpoint("tcp://*:7000") == "tcp://*:7001");
    CHECK_THROWS_AS(derive_sub_endpoint("ipc:///tmp/courier"), TransportError);
}
