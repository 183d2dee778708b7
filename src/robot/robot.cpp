#include "robot/robot.h"

#include "errors/errors.h"

#include <algorithm>

namespace courier {

const char* to_string(RobotState::Status s) {
    switch (s) {
    case RobotState::Status::Idle:   return "idle";
    case RobotState::Status::Moving: return "moving";
    case RobotState::Status::Stuck:  return "stuck";
    }
    return "unknown";
}

RobotState::Status parse_robot_status(const std::string& s) {
    if (s == "idle")   return RobotState::Status::Idle;
    if (s == "moving") return RobotState::Status::Moving;
    if (s == "stuck")  return RobotState::Status::Stuck;
    throw ValidationError("unknown robot status '" + s + "'");
}

Robot::Robot(const Coord& start, int capacity) {
    state_.position = start;
    state_.capacity = capacity;
}

const RobotState& Robot::move_one_step(const Grid& grid, Direction dir) {
    const Coord target = step(state_.position, dir);
    if (!grid.is_passable(target)) {
        throw BlockedError("move " + std::string(to_string(dir)) + " from " +
                           to_string(state_.position) + " blocked at " +
                           to_string(target));
    }
    state_.position = target;
    state_.status   = RobotState::Status::Moving;
    return state_;
}

const RobotState& Robot::load_order(const std::string& order_id) {
    if (std::find(state_.cargo.begin(), state_.cargo.end(), order_id) !=
        state_.cargo.end()) {
        throw ValidationError("order " + order_id + " already aboard");
    }
    if (static_cast<int>(state_.cargo.size()) >= state_.capacity) {
        throw ValidationError("robot at capacity (" +
                              std::to_string(state_.capacity) + ")");
    }
    state_.cargo.push_back(order_id);
    return state_;
}

bool Robot::deliver_order(const std::string& order_id) {
    auto it = std::find(state_.cargo.begin(), state_.cargo.end(), order_id);
    if (it == state_.cargo.end()) return false;
    state_.cargo.erase(it);
    return true;
}

void Robot::clear_cargo() {
    state_.cargo.clear();
    state_.status = RobotState::Status::Idle;
}

} // namespace courier
