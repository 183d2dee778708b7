#pragma once

#include "grid/grid.h"

#include <cstddef>
#include <vector>

namespace courier {
namespace pathfinder {

// Above this many destinations the exhaustive search gives way to the
// nearest-neighbour heuristic (5! = 120 evaluations at most).
constexpr size_t kExhaustiveLimit = 5;

using Path = std::vector<Coord>;

// A* over 4-connected cells with unit cost and a Manhattan heuristic.
// The open set is ordered by f, then h, then insertion order, so equal
// inputs always give the same path. Returns start..goal inclusive.
// Throws NoPathError if either end is impassable or no route exists.
Path find_path(const Coord& start, const Coord& goal, const Grid& grid);

// Number of steps in a path (cells - 1).
int path_cost(const Path& path);

// Append `leg` to `path`, dropping the shared junction cell.
void append_leg(Path& path, const Path& leg);

struct Sequence {
    std::vector<size_t> order;   // indices into the destination list
    Path                path;    // start → every destination, in order
    int                 cost{0};
};

// Order `destinations` to minimise the summed find_path cost from `start`.
// Exhaustive (ties → first permutation in lexicographic index order) up to
// kExhaustiveLimit destinations, greedy nearest-neighbour (ties → input
// order) above it. Throws NoPathError if any required leg is unreachable.
Sequence optimize_sequence(const Coord& start,
                           const std::vector<Coord>& destinations,
                           const Grid& grid);

} // namespace pathfinder
} // namespace courier
