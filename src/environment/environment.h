#pragma once

#include "bus/message_bus.h"
#include "config/config.h"
#include "environment/state.h"
#include "grid/grid.h"
#include "robot/robot.h"

#include <mutex>

namespace courier {

// The world: one Grid and one Robot. Applies commands from Execute and
// obstacle toggles from the user, and broadcasts a snapshot after each.
//
//   environment.move     {intent, target}     one step to an adjacent cell
//   environment.load     {intent, order_id}
//   environment.deliver  {intent, order_id}
//   environment.clear    {intent}
//   environment.status   {intent, status}
//   user.toggle_obstacle {position}
//   monitor.request      {seq}                 snapshot tagged with seq
//   system.init / reset  {floor_seq}
//
// Every command result lands in the snapshot's last_ack so Execute can tell
// whether its move happened.
class Environment {
public:
    Environment(MessageBus& bus, const Config& config);

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    EnvironmentSnapshot snapshot() const;

    // Throws InvalidCellError for an illegal cell, ValidationError before init.
    Terrain toggle_obstacle(const Coord& cell);

    void reset();

private:
    void on_move(const nlohmann::json& payload);
    void on_load(const nlohmann::json& payload);
    void on_deliver(const nlohmann::json& payload);
    void on_clear(const nlohmann::json& payload);
    void on_status(const nlohmann::json& payload);
    void on_toggle(const nlohmann::json& payload);
    void on_request(const nlohmann::json& payload);
    void on_reset(const nlohmann::json& payload);

    // Runs `apply` under the lock and records its outcome as the last ack.
    // Commands older than the reset floor, or sent before init, are dropped.
    template <typename Fn>
    void run_command(const char* command, const nlohmann::json& payload, Fn&& apply);

    void broadcast(uint64_t sample_seq);

    MessageBus& bus_;
    Config      config_;

    mutable std::mutex mu_;
    bool       initialized_{false};
    Grid       grid_;
    Robot      robot_;
    CommandAck last_ack_;
    uint64_t   version_{0};
    uint64_t   floor_seq_{0};
};

} // namespace courier
