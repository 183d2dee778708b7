#pragma once

#include <stdexcept>
#include <string>

namespace courier {

// Base of every recoverable failure in the control loop. None of these is
// fatal to the process.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed Knowledge patch or command payload. Nothing is applied.
class ValidationError : public Error {
public:
    using Error::Error;
};

// A single move attempt hit an impassable cell.
class BlockedError : public Error {
public:
    using Error::Error;
};

// No feasible route between two cells. Surfaces as MissionState::Stuck.
class NoPathError : public Error {
public:
    using Error::Error;
};

// Illegal obstacle toggle (base, house, robot cell, static obstacle, bounds).
class InvalidCellError : public Error {
public:
    using Error::Error;
};

// ZeroMQ socket setup failed.
class TransportError : public Error {
public:
    using Error::Error;
};

} // namespace courier
