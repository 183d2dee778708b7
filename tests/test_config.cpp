#include <doctest/doctest.h>

#include "config/config.h"
#include "errors/errors.h"

#include <cstdlib>

using namespace courier;
using nlohmann::json;

TEST_CASE("Config/Defaults") {
    const Config cfg = config_from_json(json::object());
    CHECK(cfg.capacity == 3);
    CHECK(cfg.mission_timeout_s == doctest::Approx(30.0));
    CHECK(cfg.tick_interval_ms == 400);
    CHECK(cfg.layout.width == 22);
    CHECK(cfg.layout.height == 15);
    CHECK(cfg.layout.houses.size() == 12u);
    CHECK(cfg.broker_pub == "tcp://127.0.0.1:5555");
    CHECK(cfg.broker_sub == "tcp://127.0.0.1:5556");
}

TEST_CASE("Config/Overrides") {
    const json j = {
        {"grid", {{"width", 12}, {"height", 6}, {"base", {{"x", 1}, {"y", 1}}},
                  {"houses", {{{"x", 10}, {"y", 4}}}},
                  {"static_obstacles", {{{"x", 5}, {"y", 3}}}}}},
        {"robot", {{"capacity", 2}}},
        {"mission", {{"timeout_s", 5.0}}},
        {"loop", {{"tick_interval_ms", 50}, {"ack_timeout_ms", 300}}},
        {"broker", {{"pub", "tcp://10.0.0.2:6000"}}},
    };
    const Config cfg = config_from_json(j);
    CHECK(cfg.layout.width == 12);
    CHECK(cfg.layout.houses == std::vector<Coord>{{10, 4}});
    CHECK(cfg.layout.static_obstacles == std::vector<Coord>{{5, 3}});
    CHECK(cfg.capacity == 2);
    CHECK(cfg.mission_timeout_s == doctest::Approx(5.0));
    CHECK(cfg.tick_interval_ms == 50);
    CHECK(cfg.ack_timeout_ms == 300);
    CHECK(cfg.broker_pub == "tcp://10.0.0.2:6000");
    CHECK(cfg.broker_sub == "tcp://127.0.0.1:5556");
}

TEST_CASE("Config/RejectsBadValues") {
    CHECK_THROWS_AS(config_from_json(json{{"robot", {{"capacity", 0}}}}), ValidationError);
    CHECK_THROWS_AS(config_from_json(json{{"robot", {{"capacity", "three"}}}}), ValidationError);
    CHECK_THROWS_AS(config_from_json(json{{"mission", {{"timeout_s", -1.0}}}}), ValidationError);
    CHECK_THROWS_AS(config_from_json(json{{"loop", {{"tick_interval_ms", 0}}}}), ValidationError);

    // A house on the base, and one off the grid.
    CHECK_THROWS_AS(config_from_json(json{{"grid", {{"houses", {{{"x", 1}, {"y", 1}}}}}}}),
                    ValidationError);
    CHECK_THROWS_AS(config_from_json(json{{"grid", {{"houses", {{{"x", 40}, {"y", 1}}}}}}}),
                    ValidationError);
}

TEST_CASE("Config/LoadFile") {
    const Config cfg = load_config(COURIER_TEST_DATA_DIR "/courier.json");
    CHECK(cfg.capacity == 3);
    CHECK(cfg.layout.houses.size() == 12u);
    CHECK(cfg.layout.static_obstacles.size() == 72u);   // city default kept

    CHECK_THROWS_AS(load_config(COURIER_TEST_DATA_DIR "/missing.json"), ValidationError);
}

TEST_CASE("Config/Environment") {
    ::unsetenv("COURIER_CONFIG");
    ::unsetenv("COURIER_BROKER_SUB");
    ::setenv("COURIER_BROKER_PUB", "tcp://10.0.0.2:7000", 1);
    Config cfg = load_config_from_env();
    CHECK(cfg.broker_pub == "tcp://10.0.0.2:7000");
    CHECK(cfg.broker_sub == "tcp://10.0.0.2:7001");

    ::setenv("COURIER_BROKER_SUB", "tcp://10.0.0.3:9000", 1);
    ::setenv("COURIER_CONFIG", COURIER_TEST_DATA_DIR "/courier.json", 1);
    cfg = load_config_from_env();
    CHECK(cfg.broker_sub == "tcp://10.0.0.3:9000");
    CHECK(cfg.capacity == 3);

    ::unsetenv("COURIER_CONFIG");
    ::unsetenv("COURIER_BROKER_PUB");
    ::unsetenv("COURIER_BROKER_SUB");
}
