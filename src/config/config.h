#pragma once

#include "grid/grid.h"

#include <nlohmann/json.hpp>

#include <string>

namespace courier {

// Startup configuration. Read once; every component gets a copy.
struct Config {
    GridLayout  layout = GridLayout::city();
    int         capacity{3};
    double      mission_timeout_s{30.0};
    int         tick_interval_ms{400};
    int         ack_timeout_ms{2000};   // pacer waits this long for execute.result

    // Forwarder endpoints: publishers connect to the XSUB side,
    // subscribers to the XPUB side.
    std::string broker_pub{"tcp://127.0.0.1:5555"};
    std::string broker_sub{"tcp://127.0.0.1:5556"};
};

// Missing keys keep their defaults. Throws ValidationError on bad values.
Config config_from_json(const nlohmann::json& j);

// Throws ValidationError if the file cannot be read or parsed.
Config load_config(const std::string& path);

// COURIER_CONFIG names the file (defaults apply when unset). Then
// COURIER_BROKER_PUB / COURIER_BROKER_SUB override the endpoints; if only
// the PUB endpoint is given, SUB is derived as its port + 1.
Config load_config_from_env();

} // namespace courier
