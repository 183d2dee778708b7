#include "grid/grid.h"

#include "errors/errors.h"

#include <algorithm>

namespace courier {

std::string to_string(const Coord& c) {
    return "(" + std::to_string(c.x) + "," + std::to_string(c.y) + ")";
}

const char* to_string(Terrain t) {
    switch (t) {
    case Terrain::Road:            return "road";
    case Terrain::StaticObstacle:  return "static_obstacle";
    case Terrain::DynamicObstacle: return "dynamic_obstacle";
    case Terrain::Base:            return "base";
    case Terrain::House:           return "house";
    }
    return "unknown";
}

const char* to_string(Direction d) {
    switch (d) {
    case Direction::North: return "north";
    case Direction::South: return "south";
    case Direction::West:  return "west";
    case Direction::East:  return "east";
    }
    return "unknown";
}

Coord step(const Coord& from, Direction d) {
    switch (d) {
    case Direction::North: return {from.x, from.y - 1};
    case Direction::South: return {from.x, from.y + 1};
    case Direction::West:  return {from.x - 1, from.y};
    case Direction::East:  return {from.x + 1, from.y};
    }
    return from;
}

Direction direction_between(const Coord& from, const Coord& to) {
    const int dx = to.x - from.x;
    const int dy = to.y - from.y;
    if (dx == 0 && dy == -1) return Direction::North;
    if (dx == 0 && dy == 1)  return Direction::South;
    if (dx == -1 && dy == 0) return Direction::West;
    if (dx == 1 && dy == 0)  return Direction::East;
    throw BlockedError("cells " + to_string(from) + " and " + to_string(to) +
                       " are not adjacent");
}

// ── Default city ────────────────────────────────────────────────

GridLayout GridLayout::city() {
    GridLayout g;
    g.width  = 22;
    g.height = 15;
    g.base   = {1, 1};
    g.houses = {
        {4, 4}, {2, 8}, {4, 12}, {10, 2}, {12, 6}, {10, 10},
        {12, 13}, {15, 0}, {2, 14}, {18, 14}, {19, 3}, {20, 11},
    };
    g.static_obstacles = {
        {0, 4},   {0, 5},   {3, 0},   {4, 0},   {3, 2},   {3, 3},   {2, 5},   {2, 6},
        {6, 2},   {6, 3},   {5, 6},   {5, 7},   {6, 7},   {1, 9},   {1, 10},  {2, 10},
        {4, 9},   {5, 9},   {1, 12},  {1, 13},  {6, 11},  {6, 12},  {7, 5},   {7, 6},
        {4, 14},  {5, 14},  {9, 0},   {9, 1},   {9, 3},   {9, 4},   {13, 0},  {13, 1},
        {13, 3},  {13, 4},  {9, 7},   {9, 8},   {14, 7},  {14, 8},  {10, 5},  {11, 5},
        {12, 9},  {13, 9},  {8, 11},  {8, 12},  {14, 11}, {14, 12}, {9, 14},  {10, 14},
        {13, 14}, {14, 14}, {15, 6},  {16, 6},  {15, 10}, {16, 10}, {17, 0},  {17, 1},
        {21, 0},  {21, 1},  {17, 2},  {18, 2},  {20, 4},  {21, 4},  {18, 6},  {19, 6},
        {17, 8},  {17, 9},  {21, 8},  {21, 9},  {17, 12}, {18, 12}, {20, 12}, {21, 12},
    };
    return g;
}

// ── Grid ────────────────────────────────────────────────────────

Grid::Grid(const GridLayout& layout)
    : layout_(layout)
    , cells_(static_cast<size_t>(layout.width) * static_cast<size_t>(layout.height),
             Terrain::Road)
{
    if (layout_.width <= 0 || layout_.height <= 0) {
        throw ValidationError("grid dimensions must be positive");
    }
    if (!in_bounds(layout_.base)) {
        throw ValidationError("base " + to_string(layout_.base) + " outside grid");
    }

    for (int dy = -1; dy <= 0; ++dy) {
        for (int dx = -1; dx <= 0; ++dx) {
            Coord c{layout_.base.x + dx, layout_.base.y + dy};
            if (in_bounds(c)) cells_[index(c)] = Terrain::Base;
        }
    }

    // Houses win over obstacles; neither may land on the base footprint.
    for (const auto& h : layout_.houses) {
        if (in_bounds(h) && cells_[index(h)] == Terrain::Road) {
            cells_[index(h)] = Terrain::House;
        }
    }
    for (const auto& o : layout_.static_obstacles) {
        if (in_bounds(o) && cells_[index(o)] == Terrain::Road) {
            cells_[index(o)] = Terrain::StaticObstacle;
        }
    }
}

bool Grid::in_bounds(const Coord& c) const {
    return c.x >= 0 && c.y >= 0 && c.x < layout_.width && c.y < layout_.height;
}

bool Grid::in_base(const Coord& c) const {
    return in_bounds(c) && cells_[index(c)] == Terrain::Base;
}

bool Grid::is_house(const Coord& c) const {
    return in_bounds(c) && cells_[index(c)] == Terrain::House;
}

Terrain Grid::terrain(const Coord& c) const {
    if (!in_bounds(c)) {
        throw InvalidCellError("cell " + to_string(c) + " outside grid");
    }
    return cells_[index(c)];
}

bool Grid::is_passable(const Coord& c) const {
    if (!in_bounds(c)) return false;
    const Terrain t = cells_[index(c)];
    return t != Terrain::StaticObstacle && t != Terrain::DynamicObstacle;
}

Terrain Grid::toggle_obstacle(const Coord& c, const Coord& robot) {
    if (!in_bounds(c)) {
        throw InvalidCellError("cell " + to_string(c) + " outside grid");
    }
    Terrain& t = cells_[index(c)];
    switch (t) {
    case Terrain::DynamicObstacle:
        t = Terrain::Road;
        return t;
    case Terrain::Road:
        if (c == robot) {
            throw InvalidCellError("cell " + to_string(c) + " holds the robot");
        }
        t = Terrain::DynamicObstacle;
        return t;
    case Terrain::Base:
        throw InvalidCellError("cell " + to_string(c) + " is part of the base");
    case Terrain::House:
        throw InvalidCellError("cell " + to_string(c) + " is a house");
    case Terrain::StaticObstacle:
        throw InvalidCellError("cell " + to_string(c) + " is a static obstacle");
    }
    throw InvalidCellError("cell " + to_string(c) + " has unknown terrain");
}

void Grid::set_dynamic_obstacles(const std::vector<Coord>& cells) {
    for (auto& t : cells_) {
        if (t == Terrain::DynamicObstacle) t = Terrain::Road;
    }
    for (const auto& c : cells) {
        if (in_bounds(c) && cells_[index(c)] == Terrain::Road) {
            cells_[index(c)] = Terrain::DynamicObstacle;
        }
    }
}

std::vector<Coord> Grid::dynamic_obstacles() const {
    std::vector<Coord> out;
    for (int y = 0; y < layout_.height; ++y) {
        for (int x = 0; x < layout_.width; ++x) {
            if (cells_[index({x, y})] == Terrain::DynamicObstacle) {
                out.push_back({x, y});
            }
        }
    }
    return out;
}

} // namespace courier
