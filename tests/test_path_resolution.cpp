// tests/test_path_resolution.cpp
#include <doctest/doctest.h>

#include "herd/nav/NavigationContext.h"
#include "herd/nav/PathResolver.h"
#include "test_support/nav_test_grids.h"

#include <utility>
#include <variant>

using namespace herd::nav;
using herd_test::At;

namespace herd_path_resolution_test {

struct Built {
    CostGrid grid;
    NavigationContext ctx;

    explicit Built(CostGrid g) : grid(std::move(g)), ctx(herd_test::SmallClusters(10)) {
        ok = ctx.BuildGraphSync(grid);
    }
    bool ok = false;
};

Node CellOf(const CostGrid& g, const FixedVec2& p)
{
    return g.WorldToGrid(p).value_or(Node{ -1, -1 });
}

} // namespace herd_path_resolution_test

using namespace herd_path_resolution_test;

TEST_CASE("PathResolver: clear line of sight resolves to a direct path")
{
    Built b{ CostGrid(50, 50) };
    REQUIRE(b.ok);

    const auto path = ResolvePath(b.ctx, b.grid, At(b.grid, 2, 2), At(b.grid, 40, 40));
    REQUIRE(path.has_value());
    const auto* direct = std::get_if<DirectPath>(&*path);
    REQUIRE(direct != nullptr);
    CHECK(direct->goal == At(b.grid, 40, 40));
}

TEST_CASE("PathResolver: open start and goal in one cluster is a straight segment")
{
    Built b{ CostGrid(50, 50) };
    REQUIRE(b.ok);

    const FixedVec2 start = At(b.grid, 21, 22);
    const FixedVec2 goal = At(b.grid, 27, 25);
    REQUIRE(b.ctx.Graph()->KeyFor({ 21, 22 }) == b.ctx.Graph()->KeyFor({ 27, 25 }));

    const auto path = ResolvePath(b.ctx, b.grid, start, goal);
    REQUIRE(path.has_value());
    REQUIRE(std::holds_alternative<DirectPath>(*path));
    CHECK(std::get<DirectPath>(*path).goal == goal);
}

TEST_CASE("PathResolver: blocked line inside one cluster uses local A*")
{
    CostGrid g(50, 50);
    herd_test::BlockColumn(g, 5, 0, 8);
    Built b{ std::move(g) };
    REQUIRE(b.ok);

    const auto path = ResolvePath(b.ctx, b.grid, At(b.grid, 2, 2), At(b.grid, 8, 2));
    REQUIRE(path.has_value());
    const auto* local = std::get_if<LocalAStarPath>(&*path);
    REQUIRE(local != nullptr);
    REQUIRE_FALSE(local->waypoints.empty());
    CHECK(local->cursor == 0u);
    CHECK(local->waypoints.back() == At(b.grid, 8, 2));
    CHECK(CellOf(b.grid, local->waypoints.front()) != Node{ 2, 2 });

    for (const FixedVec2& w : local->waypoints) {
        const Node c = CellOf(b.grid, w);
        CHECK(b.grid.IsWalkable(c));
        CHECK(c.x <= 9); // stayed inside the cluster
        CHECK(c.y <= 9);
    }
}

TEST_CASE("PathResolver: nearby goal in the next cluster uses a widened local search")
{
    CostGrid g(50, 50);
    herd_test::BlockColumn(g, 12, 0, 8);
    Built b{ std::move(g) };
    REQUIRE(b.ok);

    const auto path = ResolvePath(b.ctx, b.grid, At(b.grid, 8, 2), At(b.grid, 16, 2));
    REQUIRE(path.has_value());
    const auto* local = std::get_if<LocalAStarPath>(&*path);
    REQUIRE(local != nullptr);
    CHECK(local->waypoints.back() == At(b.grid, 16, 2));
}

TEST_CASE("PathResolver: distant goal becomes a hierarchical path")
{
    Built b{ herd_test::Serpentine50() };
    REQUIRE(b.ok);

    const auto path = ResolvePath(b.ctx, b.grid, At(b.grid, 2, 2), At(b.grid, 2, 47));
    REQUIRE(path.has_value());
    const auto* h = std::get_if<HierarchicalPath>(&*path);
    REQUIRE(h != nullptr);
    CHECK(h->goal == At(b.grid, 2, 47));
    CHECK(h->goalNode == Node{ 2, 47 });
    CHECK(h->goalCluster == ClusterKey{ 0, 4 });
    CHECK(h->generation == b.ctx.Generation());
}

TEST_CASE("PathResolver: a short hop behind a long wall falls through to hierarchical")
{
    // Both cells are in cluster (0,1) but the wall only opens at x >= 45.
    Built b{ herd_test::Serpentine50() };
    REQUIRE(b.ok);

    const auto path = ResolvePath(b.ctx, b.grid, At(b.grid, 2, 10), At(b.grid, 2, 14));
    REQUIRE(path.has_value());
    CHECK(std::holds_alternative<HierarchicalPath>(*path));
}

TEST_CASE("PathResolver: unreachable goal is retargeted to a fallback portal")
{
    Built b{ herd_test::SplitByWall50() };
    REQUIRE(b.ok);

    const auto path = ResolvePath(b.ctx, b.grid, At(b.grid, 2, 2), At(b.grid, 45, 45));
    REQUIRE(path.has_value());
    const Node target = CellOf(b.grid, herd_test::FinalTarget(*path));
    CHECK(target.x < 25);
    CHECK(b.ctx.AreConnected(Node{ 2, 2 }, target));

    const auto& fallback = b.ctx.Data()->components.GetFallbackPortals(0u, 1u);
    REQUIRE_FALSE(fallback.empty());
    CHECK(target == b.ctx.Graph()->GetPortal(fallback.front()).node);
}

TEST_CASE("PathResolver: sealed start with no portals has no path")
{
    CostGrid g(30, 30);
    for (int32_t y = 4; y <= 6; ++y)
        for (int32_t x = 4; x <= 6; ++x)
            if (x != 5 || y != 5) g.SetObstacle(x, y);
    Built b{ std::move(g) };
    REQUIRE(b.ok);

    CHECK_FALSE(ResolvePath(b.ctx, b.grid, At(b.grid, 5, 5), At(b.grid, 25, 25)).has_value());
}

TEST_CASE("PathResolver: blocked goal snaps to the nearest walkable cell")
{
    CostGrid g(50, 50);
    g.SetObstacle(30, 30);
    Built b{ std::move(g) };
    REQUIRE(b.ok);

    const auto path = ResolvePath(b.ctx, b.grid, At(b.grid, 2, 2), At(b.grid, 30, 30));
    REQUIRE(path.has_value());
    const auto* direct = std::get_if<DirectPath>(&*path);
    REQUIRE(direct != nullptr);
    CHECK(direct->goal == At(b.grid, 29, 29));
}

TEST_CASE("PathResolver: no graph, wrong grid or off-grid positions give no path")
{
    const CostGrid g(50, 50);
    NavigationContext empty(herd_test::SmallClusters(10));
    CHECK_FALSE(ResolvePath(empty, g, At(g, 1, 1), At(g, 40, 40)).has_value());

    Built b{ CostGrid(50, 50) };
    REQUIRE(b.ok);
    const FixedVec2 outside{ Fixed::FromInt(-3), Fixed::FromInt(4) };
    CHECK_FALSE(ResolvePath(b.ctx, b.grid, outside, At(b.grid, 4, 4)).has_value());
    CHECK_FALSE(ResolvePath(b.ctx, b.grid, At(b.grid, 4, 4), FixedVec2::FromInts(50, 10)).has_value());

    const CostGrid other(60, 50);
    CHECK_FALSE(ResolvePath(b.ctx, other, At(other, 1, 1), At(other, 40, 40)).has_value());
}
