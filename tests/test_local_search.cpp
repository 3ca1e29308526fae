// tests/test_local_search.cpp
#include <doctest/doctest.h>

#include "herd/nav/LocalSearch.h"
#include "test_support/nav_test_grids.h"

#include <cstdlib>

using namespace herd::nav;

namespace herd_local_search_test {

LocalSearchOptions Whole(const CostGrid& g)
{
    LocalSearchOptions opt;
    opt.bounds = { 0, 0, g.Width() - 1, g.Height() - 1 };
    return opt;
}

bool IsContiguous(const std::vector<Node>& cells)
{
    for (std::size_t i = 1; i < cells.size(); ++i) {
        const int d = std::abs(cells[i].x - cells[i - 1].x) + std::abs(cells[i].y - cells[i - 1].y);
        if (d != 1) return false;
    }
    return true;
}

} // namespace herd_local_search_test

using namespace herd_local_search_test;

TEST_CASE("LocalSearch: open grid path has Manhattan cost")
{
    const CostGrid g(16, 16);
    const auto p = FindPathLocal(g, { 1, 2 }, { 12, 9 }, Whole(g));
    REQUIRE(p.has_value());
    CHECK(p->cells.front() == Node{ 1, 2 });
    CHECK(p->cells.back() == Node{ 12, 9 });
    CHECK(p->cost == 18u);
    CHECK(p->cells.size() == 19u);
    CHECK(IsContiguous(p->cells));
}

TEST_CASE("LocalSearch: expensive cells are avoided when a cheaper detour exists")
{
    CostGrid g(5, 3);
    for (int x = 1; x <= 3; ++x) g.SetCost(x, 1, 10);

    const auto p = FindPathLocal(g, { 0, 1 }, { 4, 1 }, Whole(g));
    REQUIRE(p.has_value());
    CHECK(p->cost == 6u); // around via row 0 or row 2
    for (const Node& c : p->cells)
        CHECK((c.y != 1 || c.x == 0 || c.x == 4));
}

TEST_CASE("LocalSearch: search never leaves its bounds")
{
    CostGrid g(10, 10);
    herd_test::BlockColumn(g, 5, 0, 8); // gap only at y = 9

    LocalSearchOptions box;
    box.bounds = { 0, 0, 9, 7 };
    CHECK_FALSE(FindPathLocal(g, { 2, 2 }, { 8, 2 }, box).has_value());

    const auto full = FindPathLocal(g, { 2, 2 }, { 8, 2 }, Whole(g));
    REQUIRE(full.has_value());
    CHECK(IsContiguous(full->cells));

    // Goal outside the rectangle.
    CHECK_FALSE(FindPathLocal(g, { 2, 2 }, { 9, 9 }, box).has_value());
}

TEST_CASE("LocalSearch: iteration cap gives up")
{
    const CostGrid g(32, 32);
    LocalSearchOptions opt = Whole(g);
    opt.maxIterations = 3;
    CHECK_FALSE(FindPathLocal(g, { 0, 0 }, { 31, 31 }, opt).has_value());
}

TEST_CASE("LocalSearch: blocked endpoints and trivial paths")
{
    CostGrid g(4, 4);
    g.SetObstacle(3, 3);
    CHECK_FALSE(FindPathLocal(g, { 0, 0 }, { 3, 3 }, Whole(g)).has_value());

    const auto same = FindPathLocal(g, { 1, 1 }, { 1, 1 }, Whole(g));
    REQUIRE(same.has_value());
    CHECK(same->cost == 0u);
    CHECK(same->cells.size() == 1u);
}

TEST_CASE("LocalSearch: line of sight")
{
    CostGrid g(10, 10);
    CHECK(HasLineOfSight(g, { 0, 0 }, { 9, 6 }));
    CHECK(HasLineOfSight(g, { 9, 6 }, { 0, 0 }));

    g.SetObstacle(4, 4);
    CHECK_FALSE(HasLineOfSight(g, { 0, 4 }, { 9, 4 }));
    CHECK(HasLineOfSight(g, { 0, 5 }, { 9, 5 }));

    // Diagonal step may not squeeze past a blocked corner.
    CostGrid corner(3, 3);
    corner.SetObstacle(1, 0);
    CHECK_FALSE(HasLineOfSight(corner, { 0, 0 }, { 1, 1 }));
    CHECK(HasLineOfSight(corner, { 0, 1 }, { 1, 2 }));

    // Endpoints must be walkable.
    CHECK_FALSE(HasLineOfSight(g, { 4, 4 }, { 0, 0 }));
}

TEST_CASE("LocalSearch: nearest walkable is deterministic")
{
    CostGrid g(11, 11);
    g.FillRect({ 4, 4, 6, 6 }, kBlockedCost);

    CHECK(FindNearestWalkable(g, { 1, 1 }, 5) == Node{ 1, 1 });

    const auto n = FindNearestWalkable(g, { 5, 5 }, 5);
    REQUIRE(n.has_value());
    CHECK(*n == Node{ 3, 3 });
    CHECK(FindNearestWalkable(g, { 5, 5 }, 5) == n);

    // Radius too small to leave the block.
    CHECK_FALSE(FindNearestWalkable(g, { 5, 5 }, 1).has_value());

    g.Fill(kBlockedCost);
    CHECK_FALSE(FindNearestWalkable(g, { 5, 5 }, 50).has_value());
}

TEST_CASE("LocalSearch: integration field descends to the seed run")
{
    CostGrid g(6, 6);
    herd_test::BlockColumn(g, 3, 0, 5); // right half unreachable
    g.SetCost(0, 2, 4);

    const CellRect bounds{ 0, 0, 5, 5 };
    const IntegrationField f = BuildIntegrationField(g, bounds, { 0, 0 }, { 2, 0 });

    CHECK(f.At({ 0, 0 }) == 0u);
    CHECK(f.At({ 2, 0 }) == 0u);
    CHECK(f.At({ 1, 1 }) == 1u);
    CHECK(f.At({ 0, 2 }) == 6u); // 1 + (1 + 4)
    CHECK_FALSE(f.Reachable({ 4, 4 }));
    CHECK_FALSE(f.Reachable({ 3, 3 }));
    CHECK_FALSE(f.Reachable({ 40, 40 }));

    Node cur{ 2, 5 };
    int steps = 0;
    while (f.At(cur) != 0 && steps < 32) {
        const auto next = f.NextStep(cur);
        REQUIRE(next.has_value());
        CHECK(f.At(*next) < f.At(cur));
        cur = *next;
        ++steps;
    }
    CHECK(f.At(cur) == 0u);
    CHECK(steps == 5);
    CHECK_FALSE(f.NextStep(cur).has_value());
}
