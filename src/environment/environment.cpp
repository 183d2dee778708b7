#include "environment/environment.h"

#include "errors/errors.h"
#include "messages/messages.h"

#include <algorithm>
#include <iostream>

namespace courier {

Grid EnvironmentSnapshot::grid() const {
    Grid g(layout);
    g.set_dynamic_obstacles(dynamic_obstacles);
    return g;
}

Environment::Environment(MessageBus& bus, const Config& config)
    : bus_(bus)
    , config_(config)
    , grid_(config.layout)
    , robot_(config.layout.base, config.capacity)
{
    bus_.subscribe(channel::kEnvironmentMove,    [this](const auto& p) { on_move(p); });
    bus_.subscribe(channel::kEnvironmentLoad,    [this](const auto& p) { on_load(p); });
    bus_.subscribe(channel::kEnvironmentDeliver, [this](const auto& p) { on_deliver(p); });
    bus_.subscribe(channel::kEnvironmentClear,   [this](const auto& p) { on_clear(p); });
    bus_.subscribe(channel::kEnvironmentStatus,  [this](const auto& p) { on_status(p); });
    bus_.subscribe(channel::kUserToggleObstacle, [this](const auto& p) { on_toggle(p); });
    bus_.subscribe(channel::kMonitorRequest,     [this](const auto& p) { on_request(p); });
    bus_.subscribe(channel::kSystemInit,         [this](const auto& p) { on_reset(p); });
    bus_.subscribe(channel::kSystemReset,        [this](const auto& p) { on_reset(p); });
}

EnvironmentSnapshot Environment::snapshot() const {
    std::lock_guard lock(mu_);
    EnvironmentSnapshot snap;
    snap.version     = version_;
    snap.initialized = initialized_;
    if (!initialized_) return snap;

    snap.layout            = grid_.layout();
    snap.dynamic_obstacles = grid_.dynamic_obstacles();
    snap.robot             = robot_.state();
    snap.last_ack          = last_ack_;
    return snap;
}

Terrain Environment::toggle_obstacle(const Coord& cell) {
    Terrain now;
    {
        std::lock_guard lock(mu_);
        if (!initialized_) throw ValidationError("environment not initialised");
        now = grid_.toggle_obstacle(cell, robot_.state().position);
        ++version_;
    }
    std::cout << "[ENVIRONMENT] " << to_string(cell) << " is now "
              << to_string(now) << "\n";
    broadcast(0);
    return now;
}

void Environment::reset() {
    {
        std::lock_guard lock(mu_);
        grid_        = Grid(config_.layout);
        robot_       = Robot(config_.layout.base, config_.capacity);
        last_ack_    = CommandAck{};
        initialized_ = true;
        ++version_;
    }
    std::cout << "[ENVIRONMENT] Reset: " << config_.layout.width << "x"
              << config_.layout.height << " grid, robot at "
              << to_string(config_.layout.base) << "\n";
    broadcast(0);
}

// ── Commands ────────────────────────────────────────────────────

template <typename Fn>
void Environment::run_command(const char* command, const nlohmann::json& payload,
                              Fn&& apply) {
    const uint64_t intent = payload.value("intent", uint64_t{0});
    {
        std::lock_guard lock(mu_);
        if (!initialized_) {
            std::cerr << "[ENVIRONMENT] Ignoring " << command << " before init\n";
            return;
        }
        if (intent != 0 && intent <= floor_seq_) {
            std::cerr << "[ENVIRONMENT] Dropping " << command << " from tick "
                      << intent << " (before reset)\n";
            return;
        }

        CommandAck ack;
        ack.intent  = intent;
        ack.command = command;
        try {
            apply();
        } catch (const Error& e) {
            ack.ok    = false;
            ack.error = e.what();
            std::cerr << "[ENVIRONMENT] " << command << " failed: " << e.what() << "\n";
        }
        last_ack_ = ack;
        ++version_;
    }
    broadcast(0);
}

void Environment::on_move(const nlohmann::json& payload) {
    const Coord target = payload.at("target").get<Coord>();
    run_command("move", payload, [&] {
        const Direction dir = direction_between(robot_.state().position, target);
        robot_.move_one_step(grid_, dir);
    });
}

void Environment::on_load(const nlohmann::json& payload) {
    const std::string id = payload.at("order_id").get<std::string>();
    run_command("load", payload, [&] { robot_.load_order(id); });
}

void Environment::on_deliver(const nlohmann::json& payload) {
    const std::string id = payload.at("order_id").get<std::string>();
    run_command("deliver", payload, [&] {
        if (!robot_.deliver_order(id)) {
            throw ValidationError("order " + id + " is not aboard");
        }
        if (robot_.state().cargo.empty()) {
            robot_.set_status(RobotState::Status::Idle);
        }
    });
}

void Environment::on_clear(const nlohmann::json& payload) {
    run_command("clear", payload, [&] { robot_.clear_cargo(); });
}

void Environment::on_status(const nlohmann::json& payload) {
    const auto status = parse_robot_status(payload.at("status").get<std::string>());
    run_command("status", payload, [&] { robot_.set_status(status); });
}

// ── User / system ───────────────────────────────────────────────

void Environment::on_toggle(const nlohmann::json& payload) {
    const Coord cell = payload.at("position").get<Coord>();
    try {
        toggle_obstacle(cell);
    } catch (const InvalidCellError& e) {
        std::cerr << "[ENVIRONMENT] Toggle rejected: " << e.what() << "\n";
    } catch (const ValidationError& e) {
        std::cerr << "[ENVIRONMENT] Toggle rejected: " << e.what() << "\n";
    }
}

void Environment::on_request(const nlohmann::json& payload) {
    broadcast(payload.at("seq").get<uint64_t>());
}

void Environment::on_reset(const nlohmann::json& payload) {
    {
        std::lock_guard lock(mu_);
        floor_seq_ = std::max(floor_seq_, payload.value("floor_seq", uint64_t{0}));
    }
    reset();
}

void Environment::broadcast(uint64_t sample_seq) {
    EnvironmentSnapshot snap = snapshot();
    if (!snap.initialized && sample_seq == 0) return;
    snap.sample_seq = sample_seq;
    bus_.publish(channel::kEnvironmentUpdate, snap);
}

} // namespace courier
