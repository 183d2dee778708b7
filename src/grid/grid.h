#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace courier {

struct Coord {
    int x{0};
    int y{0};

    bool operator==(const Coord& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Coord& o) const { return !(*this == o); }
    bool operator<(const Coord& o) const {
        return y != o.y ? y < o.y : x < o.x;
    }
};

std::string to_string(const Coord& c);

inline int manhattan(const Coord& a, const Coord& b) {
    return (a.x > b.x ? a.x - b.x : b.x - a.x) +
           (a.y > b.y ? a.y - b.y : b.y - a.y);
}

enum class Terrain : uint8_t {
    Road,
    StaticObstacle,
    DynamicObstacle,
    Base,
    House,
};

const char* to_string(Terrain t);

// 4-connected moves. North is y - 1.
enum class Direction : uint8_t {
    North,
    South,
    West,
    East,
};

const char* to_string(Direction d);
Coord step(const Coord& from, Direction d);

// Direction that takes `from` to the adjacent cell `to`.
// Throws BlockedError when the cells are not 4-neighbours.
Direction direction_between(const Coord& from, const Coord& to);

// Everything a Grid is built from. Read-only after startup.
struct GridLayout {
    int width{22};
    int height{15};
    Coord base{1, 1};
    std::vector<Coord> houses;
    std::vector<Coord> static_obstacles;

    // The 12-house, 72-obstacle city used when no layout is configured.
    static GridLayout city();
};

// Fixed-size cell matrix. Only dynamic obstacles change after construction.
class Grid {
public:
    explicit Grid(const GridLayout& layout);

    int width() const { return layout_.width; }
    int height() const { return layout_.height; }
    const Coord& base() const { return layout_.base; }
    const GridLayout& layout() const { return layout_; }

    bool in_bounds(const Coord& c) const;
    bool in_base(const Coord& c) const;
    bool is_house(const Coord& c) const;

    Terrain terrain(const Coord& c) const;

    // False for any obstacle and for out-of-bounds coordinates.
    bool is_passable(const Coord& c) const;

    // Flip a dynamic obstacle on `c`; `robot` is the robot's current cell.
    // Returns the new terrain. Throws InvalidCellError on illegal cells.
    Terrain toggle_obstacle(const Coord& c, const Coord& robot);

    // Replace the dynamic obstacle set wholesale (snapshot reconstruction).
    void set_dynamic_obstacles(const std::vector<Coord>& cells);

    // Sorted, row-major.
    std::vector<Coord> dynamic_obstacles() const;

private:
    size_t index(const Coord& c) const {
        return static_cast<size_t>(c.y) * static_cast<size_t>(layout_.width) +
               static_cast<size_t>(c.x);
    }

    GridLayout layout_;
    std::vector<Terrain> cells_;
};

} // namespace courier
