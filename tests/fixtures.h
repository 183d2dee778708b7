#pragma once

#include "bus/message_bus.h"
#include "config/config.h"
#include "grid/grid.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace courier::test {

// 10x10, no obstacles, base (1,1), three houses.
inline Config open_config(int capacity = 3) {
    Config cfg;
    cfg.layout        = GridLayout{};
    cfg.layout.width  = 10;
    cfg.layout.height = 10;
    cfg.layout.base   = {1, 1};
    cfg.layout.houses = {{8, 1}, {8, 8}, {1, 8}};
    cfg.capacity        = capacity;
    cfg.ack_timeout_ms  = 500;
    return cfg;
}

// Empty w x h grid; the base sits in the corner so its footprint is one cell.
inline Grid open_grid(int w, int h) {
    GridLayout layout;
    layout.width  = w;
    layout.height = h;
    layout.base   = {0, 0};
    return Grid(layout);
}

// Keeps every payload seen on one channel.
struct Recorder {
    std::vector<nlohmann::json> seen;

    Recorder(MessageBus& bus, const std::string& channel) {
        bus.subscribe(channel, [this](const nlohmann::json& p) { seen.push_back(p); });
    }
};

} // namespace courier::test
