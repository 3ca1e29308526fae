// tests/test_cost_grid.cpp
#include <doctest/doctest.h>

#include "herd/math/Fixed.h"
#include "herd/nav/CostGrid.h"

using herd::math::Fixed;
using herd::math::FixedVec2;
using herd::nav::CostGrid;
using herd::nav::Node;

TEST_CASE("Fixed: arithmetic is exact and floors toward negative infinity")
{
    const Fixed quarter = Fixed::FromFraction(1, 4);
    CHECK(quarter * Fixed::FromInt(4) == Fixed::One());
    CHECK(Fixed::FromInt(7) / Fixed::FromInt(2) == Fixed::FromFraction(7, 2));
    CHECK(Fixed::FromFraction(7, 2).ToIntFloor() == 3);
    CHECK((-Fixed::FromFraction(1, 2)).ToIntFloor() == -1);
    CHECK(Fixed::FromFraction(5, 2).ToIntRound() == 3);

    const FixedVec2 a = FixedVec2::FromInts(1, 2);
    const FixedVec2 b = FixedVec2::FromInts(4, 6);
    CHECK(a.DistanceSquared(b) == Fixed::FromInt(25));
}

TEST_CASE("CostGrid: world/grid conversion honours origin and cell size")
{
    const CostGrid g(8, 4, Fixed::FromInt(2), FixedVec2::FromInts(10, 20));

    CHECK(g.GridToWorld({ 3, 1 }) == FixedVec2::FromInts(17, 23));

    const auto cell = g.WorldToGrid(FixedVec2::FromInts(17, 23));
    REQUIRE(cell.has_value());
    CHECK(*cell == Node{ 3, 1 });

    // Left of / below the origin.
    CHECK_FALSE(g.WorldToGrid(FixedVec2::FromInts(9, 21)).has_value());
    CHECK_FALSE(g.WorldToGrid(FixedVec2::FromInts(11, 19)).has_value());
    // Past the far edge (origin + width * cell size).
    CHECK_FALSE(g.WorldToGrid(FixedVec2::FromInts(26, 21)).has_value());
    CHECK(g.WorldToGrid(FixedVec2{ Fixed::FromInt(26) - Fixed::FromRaw(1), Fixed::FromInt(21) }).has_value());
}

TEST_CASE("CostGrid: out-of-bounds cells are blocked and edits are bounds-checked")
{
    CostGrid g(4, 3);
    CHECK(g.GetIndex(3, 2) == 11u);
    CHECK(g.IsWalkable(0, 0));
    CHECK_FALSE(g.IsWalkable(-1, 0));
    CHECK_FALSE(g.IsWalkable(4, 0));
    CHECK(g.Cost(9, 9) == herd::nav::kBlockedCost);

    CHECK(g.SetObstacle(1, 1));
    CHECK_FALSE(g.IsWalkable(1, 1));
    CHECK_FALSE(g.SetCost(5, 5, 3));

    CHECK(g.ClearObstacle(1, 1));
    CHECK(g.IsWalkable(1, 1));

    g.FillRect({ -2, -2, 1, 0 }, 9);
    CHECK(g.Cost(0, 0) == 9);
    CHECK(g.Cost(1, 0) == 9);
    CHECK(g.Cost(2, 0) == 0);
}

TEST_CASE("CostGrid: Resize discards every cost")
{
    CostGrid g(3, 3);
    g.Fill(herd::nav::kBlockedCost);
    g.Resize(5, 2);
    CHECK(g.Width() == 5);
    CHECK(g.Height() == 2);
    CHECK(g.Costs().size() == 10u);
    CHECK(g.IsWalkable(4, 1));
}
