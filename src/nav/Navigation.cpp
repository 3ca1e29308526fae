#include "herd/nav/Navigation.h"

#include "herd/nav/LocalSearch.h"

#include <cstdlib>
#include <memory>

namespace herd::nav {

namespace {

bool Adjacent(const ClusterKey& a, const ClusterKey& b) noexcept {
    return std::abs(a.cx - b.cx) + std::abs(a.cy - b.cy) == 1;
}

// Lowest-id portal of `region` whose partner lands in `entry` of cluster `to`.
std::optional<PortalId> PortalInto(const HierarchicalGraph& g, const Cluster& from, LocalRegionId region,
                                   const ClusterKey& to, LocalRegionId entry) {
    for (const PortalId id : from.portals) {
        const Portal& p = g.GetPortal(id);
        if (p.region != region) continue;
        const Portal& q = g.GetPortal(p.partner);
        if (q.cluster == to && q.region == entry) return id;
    }
    return std::nullopt;
}

NavigationTarget StepHierarchical(const NavigationContext& ctx, const CostGrid& grid, const FixedVec2& position,
                                  HierarchicalPath& h, Fixed arrivalRadius) {
    const NavData* data = ctx.Data();
    if (!data || h.generation != ctx.Generation())
        return { TargetKind::Blocked, position };

    if (position.DistanceSquared(h.goal) <= arrivalRadius * arrivalRadius)
        return { TargetKind::Arrived, h.goal };

    const auto cell = grid.WorldToGrid(position);
    if (!cell) return { TargetKind::Blocked, position };

    const HierarchicalGraph& g = data->graph;
    const ClusterKey key = g.KeyFor(*cell);
    const Cluster* cluster = g.GetCluster(key);
    const Cluster* goalCluster = g.GetCluster(h.goalCluster);
    if (!cluster || !goalCluster) return { TargetKind::Blocked, position };

    const auto region = cluster->RegionAt(*cell);
    const auto goalRegion = goalCluster->RegionAt(h.goalNode);
    if (!region || !goalRegion) return { TargetKind::Blocked, position };

    if (key == h.goalCluster && *region == *goalRegion) {
        if (HasLineOfSight(grid, *cell, h.goalNode))
            return { TargetKind::Direct, h.goal };
        // Regions are flood-filled, not convex: walk the goal field around the wall.
        if (!h.goalField)
            h.goalField = std::make_shared<const IntegrationField>(
                BuildIntegrationField(grid, goalCluster->bounds, h.goalNode, h.goalNode));
        const auto step = h.goalField->NextStep(*cell);
        if (!step) return { TargetKind::Blocked, position };
        return { TargetKind::LocalWaypoint, grid.GridToWorld(*step) };
    }

    // Next to the goal cluster with a direct crossing into the goal region:
    // take it. Anything longer goes through the island table.
    std::optional<PortalId> exit;
    if (Adjacent(key, h.goalCluster)) {
        const auto entry = data->routing.regionRouting.GetNextRegion(g.IndexOf(key), g.IndexOf(h.goalCluster),
                                                                     *region, *goalRegion);
        if (entry && *entry == *goalRegion)
            exit = PortalInto(g, *cluster, *region, h.goalCluster, *entry);
    }
    if (!exit) {
        const auto src = g.IslandIndexAt(*cell);
        const auto dst = g.IslandIndexAt(h.goalNode);
        if (src && dst) exit = data->routing.islandRouting.FindNextPortal(*src, *dst);
    }
    if (!exit) return { TargetKind::Blocked, position };

    const IntegrationField* field = cluster->GetField(*exit);
    if (!field || !field->Reachable(*cell)) return { TargetKind::Blocked, position };

    if (field->At(*cell) == 0) {
        // Standing on the portal run: cross the border.
        const Portal& p = g.GetPortal(*exit);
        const Portal& q = g.GetPortal(p.partner);
        const Node across{ cell->x + (q.node.x - p.node.x), cell->y + (q.node.y - p.node.y) };
        return { TargetKind::InterClusterPortal, grid.IsWalkable(across) ? grid.GridToWorld(across) : q.worldPos };
    }

    const auto step = field->NextStep(*cell);
    if (!step) return { TargetKind::Blocked, position };
    return { TargetKind::InterClusterPortal, grid.GridToWorld(*step) };
}

} // namespace

NavigationTarget NextNavigationTarget(const NavigationContext& ctx, const CostGrid& grid,
                                      const FixedVec2& position, Path& path, Fixed arrivalRadius)
{
    const Fixed r2 = arrivalRadius * arrivalRadius;

    if (const auto* direct = std::get_if<DirectPath>(&path)) {
        if (position.DistanceSquared(direct->goal) <= r2)
            return { TargetKind::Arrived, direct->goal };
        return { TargetKind::Direct, direct->goal };
    }

    if (auto* local = std::get_if<LocalAStarPath>(&path)) {
        while (local->cursor < local->waypoints.size()
               && position.DistanceSquared(local->waypoints[local->cursor]) <= r2)
            ++local->cursor;
        if (local->cursor >= local->waypoints.size())
            return { TargetKind::Arrived, local->waypoints.empty() ? position : local->waypoints.back() };
        return { TargetKind::LocalWaypoint, local->waypoints[local->cursor] };
    }

    return StepHierarchical(ctx, grid, position, std::get<HierarchicalPath>(path), arrivalRadius);
}

} // namespace herd::nav
