#include "pathfinder/pathfinder.h"

#include "errors/errors.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <numeric>
#include <queue>

namespace courier {
namespace pathfinder {

namespace {

constexpr Direction kNeighbourOrder[] = {
    Direction::North, Direction::South, Direction::West, Direction::East,
};

struct OpenNode {
    int      f;
    int      h;
    uint64_t order;   // insertion counter, FIFO among equal (f, h)
    size_t   id;

    // std::priority_queue is a max-heap; invert every key.
    bool operator<(const OpenNode& o) const {
        if (f != o.f) return f > o.f;
        if (h != o.h) return h > o.h;
        return order > o.order;
    }
};

} // namespace

Path find_path(const Coord& start, const Coord& goal, const Grid& grid) {
    if (!grid.is_passable(start)) {
        throw NoPathError("start " + to_string(start) + " is impassable");
    }
    if (!grid.is_passable(goal)) {
        throw NoPathError("goal " + to_string(goal) + " is impassable");
    }
    if (start == goal) return {start};

    const int    w = grid.width();
    const size_t n = static_cast<size_t>(w) * static_cast<size_t>(grid.height());
    auto to_id   = [w](const Coord& c) { return static_cast<size_t>(c.y) * w + c.x; };
    auto from_id = [w](size_t id) {
        return Coord{static_cast<int>(id % w), static_cast<int>(id / w)};
    };

    constexpr int    kUnseen  = std::numeric_limits<int>::max();
    constexpr size_t kNoParent = std::numeric_limits<size_t>::max();
    std::vector<int>    g(n, kUnseen);
    std::vector<size_t> parent(n, kNoParent);
    std::vector<bool>   closed(n, false);

    std::priority_queue<OpenNode> open;
    uint64_t counter = 0;

    const size_t sid = to_id(start);
    const size_t gid = to_id(goal);
    g[sid] = 0;
    const int h0 = manhattan(start, goal);
    open.push({h0, h0, counter++, sid});

    while (!open.empty()) {
        const OpenNode cur = open.top();
        open.pop();
        if (closed[cur.id]) continue;   // stale entry
        closed[cur.id] = true;

        if (cur.id == gid) {
            Path path;
            for (size_t id = gid; id != kNoParent; id = parent[id]) {
                path.push_back(from_id(id));
            }
            std::reverse(path.begin(), path.end());
            return path;
        }

        const Coord c = from_id(cur.id);
        for (Direction d : kNeighbourOrder) {
            const Coord nb = step(c, d);
            if (!grid.is_passable(nb)) continue;
            const size_t nid = to_id(nb);
            if (closed[nid]) continue;

            const int g_new = g[cur.id] + 1;
            if (g_new < g[nid]) {
                g[nid]      = g_new;
                parent[nid] = cur.id;
                const int h = manhattan(nb, goal);
                open.push({g_new + h, h, counter++, nid});
            }
        }
    }

    throw NoPathError("no path from " + to_string(start) + " to " + to_string(goal));
}

int path_cost(const Path& path) {
    return path.empty() ? 0 : static_cast<int>(path.size()) - 1;
}

void append_leg(Path& path, const Path& leg) {
    if (leg.empty()) return;
    auto first = leg.begin();
    if (!path.empty() && path.back() == leg.front()) ++first;
    path.insert(path.end(), first, leg.end());
}

// ── Sequencing ──────────────────────────────────────────────────

namespace {

Sequence exhaustive(const Coord& start,
                    const std::vector<Coord>& dests,
                    const Grid& grid) {
    // Point 0 is the start, point i + 1 is destination i.
    std::vector<Coord> points;
    points.reserve(dests.size() + 1);
    points.push_back(start);
    points.insert(points.end(), dests.begin(), dests.end());

    const size_t m = points.size();
    std::vector<std::vector<Path>> legs(m, std::vector<Path>(m));
    for (size_t i = 0; i < m; ++i) {
        for (size_t j = 1; j < m; ++j) {
            if (i == j) continue;
            legs[i][j] = find_path(points[i], points[j], grid);
        }
    }

    std::vector<size_t> perm(dests.size());
    std::iota(perm.begin(), perm.end(), 0);

    std::vector<size_t> best;
    int best_cost = std::numeric_limits<int>::max();
    do {
        int    cost = 0;
        size_t at   = 0;
        for (size_t idx : perm) {
            cost += path_cost(legs[at][idx + 1]);
            at = idx + 1;
        }
        if (cost < best_cost) {
            best_cost = cost;
            best      = perm;
        }
    } while (std::next_permutation(perm.begin(), perm.end()));

    Sequence seq;
    seq.order = best;
    seq.cost  = best_cost;
    seq.path  = {start};
    size_t at = 0;
    for (size_t idx : best) {
        append_leg(seq.path, legs[at][idx + 1]);
        at = idx + 1;
    }
    return seq;
}

Sequence nearest_neighbour(const Coord& start,
                           const std::vector<Coord>& dests,
                           const Grid& grid) {
    std::vector<bool> visited(dests.size(), false);

    Sequence seq;
    seq.path = {start};
    Coord here = start;

    for (size_t round = 0; round < dests.size(); ++round) {
        size_t best_idx  = dests.size();
        Path   best_leg;
        for (size_t i = 0; i < dests.size(); ++i) {
            if (visited[i]) continue;
            Path leg = find_path(here, dests[i], grid);
            if (best_idx == dests.size() || path_cost(leg) < path_cost(best_leg)) {
                best_idx = i;
                best_leg = std::move(leg);
            }
        }
        visited[best_idx] = true;
        seq.order.push_back(best_idx);
        seq.cost += path_cost(best_leg);
        append_leg(seq.path, best_leg);
        here = dests[best_idx];
    }
    return seq;
}

} // namespace

Sequence optimize_sequence(const Coord& start,
                           const std::vector<Coord>& destinations,
                           const Grid& grid) {
    if (destinations.empty()) {
        if (!grid.is_passable(start)) {
            throw NoPathError("start " + to_string(start) + " is impassable");
        }
        Sequence seq;
        seq.path = {start};
        return seq;
    }
    if (destinations.size() <= kExhaustiveLimit) {
        return exhaustive(start, destinations, grid);
    }
    return nearest_neighbour(start, destinations, grid);
}

} // namespace pathfinder
} // namespace courier
