#include <doctest/doctest.h>

#include "errors/errors.h"
#include "fixtures.h"
#include "pathfinder/pathfinder.h"

#include <algorithm>
#include <limits>
#include <numeric>
#include <random>

using namespace courier;
using namespace courier::pathfinder;

namespace {

bool contiguous(const Path& p, const Grid& g) {
    for (size_t i = 0; i < p.size(); ++i) {
        if (!g.is_passable(p[i])) return false;
        if (i > 0 && manhattan(p[i - 1], p[i]) != 1) return false;
    }
    return true;
}

} // namespace

TEST_CASE("Pathfinder/StraightLine") {
    Grid g = test::open_grid(10, 10);
    const Path p = find_path({0, 0}, {5, 0}, g);
    REQUIRE(p.size() == 6u);
    CHECK(path_cost(p) == 5);
    for (int x = 0; x <= 5; ++x) CHECK(p[static_cast<size_t>(x)] == Coord{x, 0});
}

TEST_CASE("Pathfinder/StartIsGoal") {
    Grid g = test::open_grid(4, 4);
    const Path p = find_path({2, 2}, {2, 2}, g);
    CHECK(p == Path{{2, 2}});
    CHECK(path_cost(p) == 0);
}

TEST_CASE("Pathfinder/Detour") {
    // Wall on x = 4 with a single gap at the bottom row.
    Grid g = test::open_grid(10, 10);
    std::vector<Coord> wall;
    for (int y = 0; y < 9; ++y) wall.push_back({4, y});
    g.set_dynamic_obstacles(wall);

    const Path p = find_path({0, 0}, {8, 0}, g);
    CHECK(path_cost(p) == 8 + 2 * 9);
    CHECK(p.front() == Coord{0, 0});
    CHECK(p.back() == Coord{8, 0});
    CHECK(contiguous(p, g));
    CHECK(std::find(p.begin(), p.end(), Coord{4, 9}) != p.end());
}

TEST_CASE("Pathfinder/Deterministic") {
    Grid g = test::open_grid(12, 12);
    g.set_dynamic_obstacles({{5, 5}, {5, 6}, {6, 5}, {3, 8}});
    CHECK(find_path({1, 1}, {10, 10}, g) == find_path({1, 1}, {10, 10}, g));
}

TEST_CASE("Pathfinder/NoPath") {
    Grid g = test::open_grid(8, 8);
    std::vector<Coord> wall;
    for (int y = 0; y < 8; ++y) wall.push_back({4, y});
    g.set_dynamic_obstacles(wall);

    CHECK_THROWS_AS(find_path({1, 1}, {6, 1}, g), NoPathError);
    CHECK_THROWS_AS(find_path({1, 1}, {4, 1}, g), NoPathError);    // goal blocked
    CHECK_THROWS_AS(find_path({4, 2}, {1, 1}, g), NoPathError);    // start blocked
    CHECK_THROWS_AS(find_path({1, 1}, {9, 9}, g), NoPathError);    // out of bounds
}

TEST_CASE("Pathfinder/AppendLeg") {
    Path p{{0, 0}, {1, 0}};
    append_leg(p, Path{{1, 0}, {2, 0}, {3, 0}});
    CHECK(p == Path{{0, 0}, {1, 0}, {2, 0}, {3, 0}});
    append_leg(p, Path{{3, 0}});
    CHECK(p.size() == 4u);
    CHECK(path_cost(Path{}) == 0);
}

TEST_CASE("Sequence/Empty") {
    Grid g = test::open_grid(5, 5);
    const Sequence s = optimize_sequence({2, 2}, {}, g);
    CHECK(s.order.empty());
    CHECK(s.path == Path{{2, 2}});
    CHECK(s.cost == 0);
}

TEST_CASE("Sequence/TiesKeepInputOrder") {
    Grid g = test::open_grid(11, 11);
    // Both orders cost 2 + 4.
    const Sequence s = optimize_sequence({5, 5}, {{5, 3}, {5, 7}}, g);
    CHECK(s.order == std::vector<size_t>{0, 1});
    CHECK(s.cost == 6);
    CHECK(s.path.front() == Coord{5, 5});
    CHECK(s.path.back() == Coord{5, 7});
}

TEST_CASE("Sequence/VisitsNearFirst") {
    Grid g = test::open_grid(20, 3);
    const Sequence s = optimize_sequence({0, 1}, {{15, 1}, {3, 1}}, g);
    CHECK(s.order == std::vector<size_t>{1, 0});
    CHECK(s.cost == 15);
    CHECK(path_cost(s.path) == s.cost);
}

TEST_CASE("Sequence/NearestNeighbourAboveLimit") {
    Grid g = test::open_grid(20, 3);
    const std::vector<Coord> dests{{10, 1}, {2, 1}, {6, 1}, {4, 1}, {8, 1}, {12, 1}};
    REQUIRE(dests.size() > kExhaustiveLimit);

    const Sequence s = optimize_sequence({0, 1}, dests, g);
    CHECK(s.order == std::vector<size_t>{1, 3, 2, 4, 0, 5});
    CHECK(s.cost == 12);
    CHECK(s.path.back() == Coord{12, 1});
}

TEST_CASE("Sequence/UnreachableDestination") {
    Grid g = test::open_grid(8, 8);
    g.set_dynamic_obstacles({{6, 5}, {7, 6}, {6, 7}, {5, 6}});   // (6,6) boxed in
    CHECK_THROWS_AS(optimize_sequence({0, 0}, {{2, 2}, {6, 6}}, g), NoPathError);
}

TEST_CASE("Sequence/MatchesBruteForce") {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> coord(0, 11);
    std::bernoulli_distribution wall(0.18);

    int checked = 0;
    for (int trial = 0; trial < 40; ++trial) {
        Grid g = test::open_grid(12, 12);
        std::vector<Coord> obstacles;
        for (int y = 0; y < 12; ++y)
            for (int x = 0; x < 12; ++x)
                if ((x != 0 || y != 0) && wall(rng)) obstacles.push_back({x, y});
        g.set_dynamic_obstacles(obstacles);

        const Coord start{0, 0};
        std::vector<Coord> dests;
        while (dests.size() < 4) {
            const Coord c{coord(rng), coord(rng)};
            if (g.is_passable(c) && c != start) dests.push_back(c);
        }

        // Pairwise costs; skip layouts where anything is cut off.
        std::vector<Coord> points{start};
        points.insert(points.end(), dests.begin(), dests.end());
        std::vector<std::vector<int>> cost(points.size(), std::vector<int>(points.size(), 0));
        bool ok = true;
        for (size_t i = 0; i < points.size() && ok; ++i) {
            for (size_t j = 0; j < points.size() && ok; ++j) {
                try {
                    cost[i][j] = path_cost(find_path(points[i], points[j], g));
                } catch (const NoPathError&) {
                    ok = false;
                }
            }
        }
        if (!ok) {
            CHECK_THROWS_AS(optimize_sequence(start, dests, g), NoPathError);
            continue;
        }

        std::vector<size_t> perm(dests.size());
        std::iota(perm.begin(), perm.end(), 0);
        int best = std::numeric_limits<int>::max();
        do {
            int c = 0;
            size_t at = 0;
            for (size_t idx : perm) {
                c += cost[at][idx + 1];
                at = idx + 1;
            }
            best = std::min(best, c);
        } while (std::next_permutation(perm.begin(), perm.end()));

        const Sequence s = optimize_sequence(start, dests, g);
        CHECK(s.cost == best);
        CHECK(path_cost(s.path) == s.cost);
        CHECK(contiguous(s.path, g));
        ++checked;
    }
    CHECK(checked > 10);
}
