#pragma once

#include "grid/grid.h"
#include "robot/robot.h"

#include <cstdint>
#include <string>
#include <vector>

namespace courier {

// Acknowledgement of the last environment.* command, matched by intent.
struct CommandAck {
    uint64_t    intent{0};
    std::string command;
    bool        ok{true};
    std::string error;
};

struct EnvironmentSnapshot {
    uint64_t version{0};
    uint64_t sample_seq{0};
    bool     initialized{false};

    GridLayout         layout;
    std::vector<Coord> dynamic_obstacles;
    RobotState         robot;
    CommandAck         last_ack;

    // Rebuild the grid as it stood when the snapshot was taken.
    Grid grid() const;
};

} // namespace courier
