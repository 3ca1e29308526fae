#pragma once
//
// Grid builders shared by the navigation tests.
// Header-only and inline so unity builds don't see duplicate definitions.
//
#include "herd/nav/CostGrid.h"
#include "herd/nav/NavConfig.h"
#include "herd/nav/NavigationContext.h"
#include "herd/nav/Path.h"

#include <cstdint>
#include <variant>

namespace herd_test {

using herd::nav::CostGrid;
using herd::nav::FixedVec2;
using herd::nav::NavConfig;
using herd::nav::Node;

inline NavConfig SmallClusters(int32_t clusterSize = 10)
{
    NavConfig cfg;
    cfg.clusterSize = clusterSize;
    return cfg;
}

// Blocks x = column for y in [y0, y1].
inline void BlockColumn(CostGrid& g, int32_t column, int32_t y0, int32_t y1)
{
    for (int32_t y = y0; y <= y1; ++y) g.SetObstacle(column, y);
}

// Blocks y = row for x in [x0, x1].
inline void BlockRow(CostGrid& g, int32_t row, int32_t x0, int32_t x1)
{
    for (int32_t x = x0; x <= x1; ++x) g.SetObstacle(x, row);
}

// 50x50 with horizontal walls that force a zig-zag:
// y=12 open only at x>=45, y=24 open only at x<=4, y=36 open only at x>=45.
inline CostGrid Serpentine50()
{
    CostGrid g(50, 50);
    BlockRow(g, 12, 0, 44);
    BlockRow(g, 24, 5, 49);
    BlockRow(g, 36, 0, 44);
    return g;
}

// 50x50 split in two by a full-height wall at x = 25.
inline CostGrid SplitByWall50()
{
    CostGrid g(50, 50);
    BlockColumn(g, 25, 0, 49);
    return g;
}

// Deterministic scatter (LCG, identical on every platform).
inline CostGrid Scatter(int32_t w, int32_t h, uint32_t seed, uint32_t blockedPercent)
{
    CostGrid g(w, h);
    uint32_t s = seed;
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            s = s * 1664525u + 1013904223u;
            const uint32_t roll = (s >> 16) % 100u;
            if (roll < blockedPercent) g.SetObstacle(x, y);
            else if (roll < blockedPercent + 10u) g.SetCost(x, y, static_cast<uint8_t>(roll % 7u));
        }
    }
    return g;
}

inline FixedVec2 At(const CostGrid& g, int32_t x, int32_t y) { return g.GridToWorld({ x, y }); }

// Where a freshly resolved path is heading.
inline FixedVec2 FinalTarget(const herd::nav::Path& p)
{
    if (const auto* d = std::get_if<herd::nav::DirectPath>(&p)) return d->goal;
    if (const auto* l = std::get_if<herd::nav::LocalAStarPath>(&p)) return l->waypoints.back();
    return std::get<herd::nav::HierarchicalPath>(p).goal;
}

} // namespace herd_test
