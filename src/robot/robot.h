#pragma once

#include "grid/grid.h"

#include <string>
#include <vector>

namespace courier {

struct RobotState {
    enum class Status : uint8_t {
        Idle,
        Moving,
        Stuck,
    };

    Coord                    position;
    std::vector<std::string> cargo;       // order ids, size <= capacity
    int                      capacity{3};
    Status                   status{Status::Idle};
};

const char* to_string(RobotState::Status s);
RobotState::Status parse_robot_status(const std::string& s);   // throws ValidationError

// The physical robot. Holds no business logic: every mutator either
// applies or throws and leaves the state unchanged.
class Robot {
public:
    Robot(const Coord& start, int capacity);

    const RobotState& state() const { return state_; }

    // Move one cell. Throws BlockedError if the target is impassable.
    const RobotState& move_one_step(const Grid& grid, Direction dir);

    // Throws ValidationError when full or the id is already aboard.
    const RobotState& load_order(const std::string& order_id);

    // Returns false when the id is not aboard.
    bool deliver_order(const std::string& order_id);

    void clear_cargo();
    void set_status(RobotState::Status s) { state_.status = s; }

private:
    RobotState state_;
};

} // namespace courier
