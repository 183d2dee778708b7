#include "config/config.h"

#include "errors/errors.h"
#include "ipc/zmq_bus.h"
#include "messages/messages.h"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace courier {

Config config_from_json(const nlohmann::json& j) {
    Config cfg;
    try {
        if (j.contains("grid")) {
            const auto& g = j.at("grid");
            cfg.layout.width  = g.value("width", cfg.layout.width);
            cfg.layout.height = g.value("height", cfg.layout.height);
            if (g.contains("base"))             g.at("base").get_to(cfg.layout.base);
            if (g.contains("houses"))           g.at("houses").get_to(cfg.layout.houses);
            if (g.contains("static_obstacles")) g.at("static_obstacles").get_to(cfg.layout.static_obstacles);
        }
        if (j.contains("robot")) {
            cfg.capacity = j.at("robot").value("capacity", cfg.capacity);
        }
        if (j.contains("mission")) {
            cfg.mission_timeout_s = j.at("mission").value("timeout_s", cfg.mission_timeout_s);
        }
        if (j.contains("loop")) {
            const auto& l = j.at("loop");
            cfg.tick_interval_ms = l.value("tick_interval_ms", cfg.tick_interval_ms);
            cfg.ack_timeout_ms   = l.value("ack_timeout_ms", cfg.ack_timeout_ms);
        }
        if (j.contains("broker")) {
            const auto& b = j.at("broker");
            cfg.broker_pub = b.value("pub", cfg.broker_pub);
            cfg.broker_sub = b.value("sub", cfg.broker_sub);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("config: ") + e.what());
    }

    if (cfg.capacity < 1) {
        throw ValidationError("config: robot.capacity must be at least 1");
    }
    if (cfg.mission_timeout_s < 0.0) {
        throw ValidationError("config: mission.timeout_s must not be negative");
    }
    if (cfg.tick_interval_ms < 1) {
        throw ValidationError("config: loop.tick_interval_ms must be positive");
    }
    // Let the Grid constructor vet dimensions and the base.
    const Grid grid(cfg.layout);
    for (const auto& h : cfg.layout.houses) {
        if (!grid.is_house(h)) {
            throw ValidationError("config: house " + to_string(h) +
                                  " overlaps the base or lies outside the grid");
        }
    }
    return cfg;
}

Config load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw ValidationError("config: cannot open " + path);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("config: " + path + ": " + e.what());
    }
    std::cout << "[COURIER] Loaded config from " << path << "\n";
    return config_from_json(j);
}

Config load_config_from_env() {
    Config cfg;
    if (const char* path = std::getenv("COURIER_CONFIG")) {
        cfg = load_config(path);
    }

    const char* pub = std::getenv("COURIER_BROKER_PUB");
    const char* sub = std::getenv("COURIER_BROKER_SUB");
    if (pub) cfg.broker_pub = pub;
    if (sub) {
        cfg.broker_sub = sub;
    } else if (pub) {
        cfg.broker_sub = derive_sub_endpoint(cfg.broker_pub);
    }
    return cfg;
}

} // namespace courier
