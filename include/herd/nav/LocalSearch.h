#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

#include "CostGrid.h"
#include "GridTypes.h"

namespace herd::nav {

// Entering a cell costs one unit plus its cost byte.
[[nodiscard]] inline uint32_t StepCost(const CostGrid& grid, const Node& to) noexcept {
    return 1u + grid.Cost(to);
}

struct LocalSearchOptions {
    CellRect bounds;                 // search never leaves this rectangle
    int32_t maxIterations = 10000;   // node expansions before giving up
};

struct LocalPath {
    std::vector<Node> cells;  // start..goal inclusive
    uint32_t cost = 0;        // sum of StepCost over cells[1..]
};

// 4-connected A* with a Manhattan heuristic, confined to opt.bounds.
// Open-list ties break on cell index so results never depend on insertion order.
std::optional<LocalPath> FindPathLocal(const CostGrid& grid, const Node& start, const Node& goal,
                                       const LocalSearchOptions& opt);

// Bresenham walk; every visited cell must be walkable and diagonal steps may
// not squeeze past a blocked orthogonal neighbour.
bool HasLineOfSight(const CostGrid& grid, const Node& a, const Node& b) noexcept;

// Breadth-first ring search (8 neighbours, fixed order) out to maxRadius cells.
std::optional<Node> FindNearestWalkable(const CostGrid& grid, const Node& target, int32_t maxRadius);

// Dijkstra distance-to-portal field for one cluster.
struct IntegrationField {
    static constexpr uint32_t kUnreachable = std::numeric_limits<uint32_t>::max();

    CellRect bounds;
    std::vector<uint32_t> cost;  // row-major over bounds

    [[nodiscard]] uint32_t At(const Node& n) const noexcept {
        return bounds.Contains(n) ? cost[bounds.LocalIndex(n)] : kUnreachable;
    }
    [[nodiscard]] bool Reachable(const Node& n) const noexcept { return At(n) != kUnreachable; }

    // Lowest strictly-downhill 4-neighbour; nullopt on the seed cells or when unreachable.
    [[nodiscard]] std::optional<Node> NextStep(const Node& from) const noexcept;

    bool operator==(const IntegrationField&) const = default;
};

// Seeds every walkable cell of the inclusive run [runMin, runMax] with zero.
IntegrationField BuildIntegrationField(const CostGrid& grid, const CellRect& bounds,
                                       const Node& runMin, const Node& runMax);

} // namespace herd::nav
