#include "herd/nav/PathResolver.h"

#include "herd/logging/Log.h"
#include "herd/nav/LocalSearch.h"
#include "herd/prof/Zone.h"

#include <algorithm>

namespace herd::nav {

namespace {

LocalAStarPath ToWaypoints(const CostGrid& grid, const LocalPath& path) {
    LocalAStarPath out;
    out.waypoints.reserve(path.cells.size());
    for (std::size_t i = 1; i < path.cells.size(); ++i)
        out.waypoints.push_back(grid.GridToWorld(path.cells[i]));
    return out;
}

CellRect Expanded(const Node& a, const Node& b, int32_t margin) {
    return {
        std::min(a.x, b.x) - margin, std::min(a.y, b.y) - margin,
        std::max(a.x, b.x) + margin, std::max(a.y, b.y) + margin,
    };
}

} // namespace

std::optional<Path> ResolvePath(const NavigationContext& ctx, const CostGrid& grid,
                                const FixedVec2& startWorld, const FixedVec2& goalWorld)
{
    HERD_TRACY_ZONE("ResolvePath");
    const NavData* data = ctx.Data();
    if (!data) {
        logsys::get()->debug("Path request dropped: navigation graph not built");
        return std::nullopt;
    }
    const HierarchicalGraph& graph = data->graph;
    if (graph.GridWidth() != grid.Width() || graph.GridHeight() != grid.Height()) {
        logsys::get()->warn("Path request dropped: graph was built for a {}x{} grid, grid is {}x{}",
                            graph.GridWidth(), graph.GridHeight(), grid.Width(), grid.Height());
        return std::nullopt;
    }

    const NavConfig& cfg = ctx.Config();
    const auto startCell = grid.WorldToGrid(startWorld);
    const auto goalCell = grid.WorldToGrid(goalWorld);
    if (!startCell || !goalCell) {
        logsys::get()->warn("Path request outside the grid ({:.2f}, {:.2f}) -> ({:.2f}, {:.2f})",
                            startWorld.x.ToDouble(), startWorld.y.ToDouble(),
                            goalWorld.x.ToDouble(), goalWorld.y.ToDouble());
        return std::nullopt;
    }

    // Agents pushed onto a fresh obstacle plan from the closest free cell.
    const auto start = FindNearestWalkable(grid, *startCell, cfg.nearestWalkableRadius);
    if (!start) return std::nullopt;

    Node goal = *goalCell;
    FixedVec2 goalPos = goalWorld;
    if (!grid.IsWalkable(goal)) {
        const auto free = FindNearestWalkable(grid, goal, cfg.nearestWalkableRadius);
        if (!free) {
            logsys::get()->debug("No walkable cell within {} of goal ({}, {})", cfg.nearestWalkableRadius, goal.x, goal.y);
            return std::nullopt;
        }
        goal = *free;
        goalPos = grid.GridToWorld(goal);
    }

    if (HasLineOfSight(grid, *start, goal))
        return DirectPath{ goalPos };

    const auto& comps = data->components;
    const auto startComp = comps.ComponentAt(graph, *start);
    const auto goalComp = comps.ComponentAt(graph, goal);
    if (!startComp || !goalComp) return std::nullopt;

    if (*startComp != *goalComp) {
        const auto& fallback = comps.GetFallbackPortals(*startComp, *goalComp);
        if (fallback.empty()) {
            logsys::get()->debug("Goal ({}, {}) unreachable from ({}, {}), no fallback", goal.x, goal.y, start->x, start->y);
            return std::nullopt;
        }
        const Portal& p = graph.GetPortal(fallback.front());
        logsys::get()->debug("Goal ({}, {}) unreachable, heading for fallback portal {}", goal.x, goal.y, p.id.id);
        goal = p.node;
        goalPos = p.worldPos;
        if (HasLineOfSight(grid, *start, goal))
            return DirectPath{ goalPos };
    }

    const ClusterKey startKey = graph.KeyFor(*start);
    const ClusterKey goalKey = graph.KeyFor(goal);

    LocalSearchOptions opt;
    opt.maxIterations = cfg.localSearchMaxIterations;

    if (startKey == goalKey) {
        if (const Cluster* c = graph.GetCluster(startKey)) {
            opt.bounds = c->bounds;
            if (const auto p = FindPathLocal(grid, *start, goal, opt))
                return ToWaypoints(grid, *p);
        }
    }

    const int64_t near = static_cast<int64_t>(cfg.nearDistanceClusters) * graph.ClusterSize();
    const int64_t dx = goal.x - start->x, dy = goal.y - start->y;
    if (dx * dx + dy * dy < near * near) {
        opt.bounds = Expanded(*start, goal, graph.ClusterSize());
        if (const auto p = FindPathLocal(grid, *start, goal, opt))
            return ToWaypoints(grid, *p);
    }

    return HierarchicalPath{ goalPos, goal, goalKey, ctx.Generation() };
}

} // namespace herd::nav
