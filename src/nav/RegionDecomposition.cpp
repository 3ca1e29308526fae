#include "herd/nav/RegionDecomposition.h"

#include "herd/nav/NavError.h"

#include <queue>

namespace herd::nav {

bool DecomposeRegions(const CostGrid& grid, const CellRect& bounds, RegionMap& out, std::error_code& ec)
{
    out.bounds = bounds;
    out.labels.assign(bounds.Area(), kNoRegion);
    out.regionCount = 0;

    constexpr int kDirs4[4][2] = { {1,0}, {-1,0}, {0,1}, {0,-1} };
    std::queue<Node> frontier;

    for (int32_t y = bounds.minY; y <= bounds.maxY; ++y) {
        for (int32_t x = bounds.minX; x <= bounds.maxX; ++x) {
            const Node seed{ x, y };
            if (!grid.IsWalkable(seed) || out.labels[bounds.LocalIndex(seed)] != kNoRegion)
                continue;

            if (out.regionCount >= kMaxRegions) {
                ec = NavErrc::TooManyRegions;
                return false;
            }
            const uint8_t label = out.regionCount++;

            out.labels[bounds.LocalIndex(seed)] = label;
            frontier.push(seed);
            while (!frontier.empty()) {
                const Node c = frontier.front(); frontier.pop();
                for (const auto& d : kDirs4) {
                    const Node n{ c.x + d[0], c.y + d[1] };
                    if (!bounds.Contains(n) || !grid.IsWalkable(n)) continue;
                    auto& l = out.labels[bounds.LocalIndex(n)];
                    if (l != kNoRegion) continue;
                    l = label;
                    frontier.push(n);
                }
            }
        }
    }
    return true;
}

} // namespace herd::nav
