#pragma once

#include <chrono>
#include <functional>

namespace courier {

// Seconds since the Unix epoch. Timestamps cross process boundaries,
// so every component reads the same wall clock.
using Clock = std::function<double()>;

inline double wall_clock() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(
        system_clock::now().time_since_epoch()).count();
}

} // namespace courier
