#include "herd/nav/HierarchicalGraph.h"

#include "herd/logging/Log.h"
#include "herd/nav/NavError.h"

#include <algorithm>

namespace herd::nav {

void HierarchicalGraph::Clear() {
    nodes.clear();
    edges.clear();
    clusters.clear();
    initialized = false;
    clustersX_ = clustersY_ = 0;
    gridW_ = gridH_ = 0;
}

bool HierarchicalGraph::InitializeClusters(const CostGrid& grid, int32_t clusterSize, std::error_code& ec) {
    Clear();
    if (clusterSize < 1) { ec = NavErrc::InvalidClusterSize; return false; }
    if (grid.Width() <= 0 || grid.Height() <= 0) { ec = NavErrc::EmptyGrid; return false; }

    clusterSize_ = clusterSize;
    gridW_ = grid.Width();
    gridH_ = grid.Height();
    clustersX_ = (gridW_ + clusterSize_ - 1) / clusterSize_;
    clustersY_ = (gridH_ + clusterSize_ - 1) / clusterSize_;

    for (int32_t cy = 0; cy < clustersY_; ++cy) {
        for (int32_t cx = 0; cx < clustersX_; ++cx) {
            Cluster c;
            c.key = { cx, cy };
            c.bounds.minX = cx * clusterSize_;
            c.bounds.minY = cy * clusterSize_;
            c.bounds.maxX = std::min(c.bounds.minX + clusterSize_ - 1, gridW_ - 1);
            c.bounds.maxY = std::min(c.bounds.minY + clusterSize_ - 1, gridH_ - 1);
            clusters.emplace(c.key, std::move(c));
        }
    }
    return true;
}

bool HierarchicalGraph::DecomposeCluster(const CostGrid& grid, const ClusterKey& key, std::error_code& ec) {
    Cluster* c = GetCluster(key);
    if (!c) return true;
    if (!DecomposeRegions(grid, c->bounds, c->regions, ec)) {
        logsys::get()->error("Cluster ({}, {}): {} (limit {})", key.cx, key.cy, ec.message(), kMaxRegions);
        return false;
    }
    return true;
}

void HierarchicalGraph::AddPortalPair(const CostGrid& grid, const Node& aMin, const Node& aMax,
                                      const Node& bMin, const Node& bMax) {
    const Node aMid{ (aMin.x + aMax.x) / 2, (aMin.y + aMax.y) / 2 };
    const Node bMid{ (bMin.x + bMax.x) / 2, (bMin.y + bMax.y) / 2 };

    Cluster* ca = GetCluster(KeyFor(aMid));
    Cluster* cb = GetCluster(KeyFor(bMid));
    if (!ca || !cb) return;

    const PortalId ida{ static_cast<int32_t>(nodes.size()) };
    const PortalId idb{ ida.id + 1 };

    Portal pa;
    pa.id = ida; pa.node = aMid; pa.rangeMin = aMin; pa.rangeMax = aMax;
    pa.cluster = ca->key; pa.region = ca->RegionAt(aMid).value_or(LocalRegionId{});
    pa.partner = idb; pa.worldPos = grid.GridToWorld(aMid);

    Portal pb;
    pb.id = idb; pb.node = bMid; pb.rangeMin = bMin; pb.rangeMax = bMax;
    pb.cluster = cb->key; pb.region = cb->RegionAt(bMid).value_or(LocalRegionId{});
    pb.partner = ida; pb.worldPos = grid.GridToWorld(bMid);

    nodes.push_back(pa);
    nodes.push_back(pb);
    ca->portals.push_back(ida);
    cb->portals.push_back(idb);

    // Cross edge: one step into the neighbour cell.
    edges[ida].push_back({ idb, Fixed::FromInt(StepCost(grid, bMid)) });
    edges[idb].push_back({ ida, Fixed::FromInt(StepCost(grid, aMid)) });
}

void HierarchicalGraph::FindVerticalBorderPortals(const CostGrid& grid, int32_t cx) {
    if (cx < 0 || cx + 1 >= clustersX_) return;
    const int32_t xR = (cx + 1) * clusterSize_; // first column of the right cluster

    for (int32_t cy = 0; cy < clustersY_; ++cy) {
        const int32_t y0 = cy * clusterSize_;
        const int32_t y1 = std::min(y0 + clusterSize_ - 1, gridH_ - 1);

        int32_t runStart = -1;
        for (int32_t y = y0; y <= y1 + 1; ++y) {
            const bool open = y <= y1 && grid.IsWalkable(xR - 1, y) && grid.IsWalkable(xR, y);
            if (open && runStart < 0) {
                runStart = y;
            } else if (!open && runStart >= 0) {
                AddPortalPair(grid, { xR - 1, runStart }, { xR - 1, y - 1 }, { xR, runStart }, { xR, y - 1 });
                runStart = -1;
            }
        }
    }
}

void HierarchicalGraph::FindHorizontalBorderPortals(const CostGrid& grid, int32_t cy) {
    if (cy < 0 || cy + 1 >= clustersY_) return;
    const int32_t yB = (cy + 1) * clusterSize_; // first row of the lower cluster

    for (int32_t cx = 0; cx < clustersX_; ++cx) {
        const int32_t x0 = cx * clusterSize_;
        const int32_t x1 = std::min(x0 + clusterSize_ - 1, gridW_ - 1);

        int32_t runStart = -1;
        for (int32_t x = x0; x <= x1 + 1; ++x) {
            const bool open = x <= x1 && grid.IsWalkable(x, yB - 1) && grid.IsWalkable(x, yB);
            if (open && runStart < 0) {
                runStart = x;
            } else if (!open && runStart >= 0) {
                AddPortalPair(grid, { runStart, yB - 1 }, { x - 1, yB - 1 }, { runStart, yB }, { x - 1, yB });
                runStart = -1;
            }
        }
    }
}

void HierarchicalGraph::ConnectIntraCluster(const CostGrid& grid, const ClusterKey& key, int32_t maxIterations) {
    Cluster* c = GetCluster(key);
    if (!c) return;

    LocalSearchOptions opt;
    opt.bounds = c->bounds;
    // Same-region portals always meet inside the cluster; never let the cap cut that search short.
    opt.maxIterations = std::max<int32_t>(maxIterations, static_cast<int32_t>(c->bounds.Area()));

    const auto& plist = c->portals;
    for (std::size_t i = 0; i < plist.size(); ++i) {
        for (std::size_t j = i + 1; j < plist.size(); ++j) {
            const Portal& pa = nodes[static_cast<std::size_t>(plist[i].id)];
            const Portal& pb = nodes[static_cast<std::size_t>(plist[j].id)];
            if (pa.region != pb.region) continue; // cannot meet inside the cluster

            const auto path = FindPathLocal(grid, pa.node, pb.node, opt);
            if (!path) {
                logsys::get()->warn("Cluster ({}, {}): no local path between portals {} and {}",
                                     key.cx, key.cy, pa.id.id, pb.id.id);
                continue;
            }
            const Fixed w = Fixed::FromInt(path->cost);
            edges[pa.id].push_back({ pb.id, w });
            edges[pb.id].push_back({ pa.id, w });
        }
    }

    for (const PortalId p : plist) {
        auto& list = edges[p];
        std::stable_sort(list.begin(), list.end(),
                         [](const Edge& a, const Edge& b) { return a.to < b.to; });
    }
}

void HierarchicalGraph::RegenerateClusterFields(const CostGrid& grid, const ClusterKey& key) {
    Cluster* c = GetCluster(key);
    if (!c) return;
    c->ClearCache();
    for (const PortalId p : c->portals) {
        const Portal& portal = nodes[static_cast<std::size_t>(p.id)];
        c->fieldCache.emplace(p, BuildIntegrationField(grid, c->bounds, portal.rangeMin, portal.rangeMax));
    }
}

const Cluster* HierarchicalGraph::GetCluster(const ClusterKey& k) const noexcept {
    const auto it = clusters.find(k);
    return it == clusters.end() ? nullptr : &it->second;
}

Cluster* HierarchicalGraph::GetCluster(const ClusterKey& k) noexcept {
    const auto it = clusters.find(k);
    return it == clusters.end() ? nullptr : &it->second;
}

const std::vector<Edge>& HierarchicalGraph::EdgesOf(PortalId id) const noexcept {
    static const std::vector<Edge> kNone;
    const auto it = edges.find(id);
    return it == edges.end() ? kNone : it->second;
}

std::size_t HierarchicalGraph::EdgeCount() const noexcept {
    std::size_t n = 0;
    for (const auto& [id, list] : edges) n += list.size();
    return n;
}

std::optional<IslandArenaIdx> HierarchicalGraph::IslandIndexAt(const Node& n) const noexcept {
    if (n.x < 0 || n.y < 0 || n.x >= gridW_ || n.y >= gridH_) return std::nullopt;
    const ClusterKey key = KeyFor(n);
    const Cluster* c = GetCluster(key);
    if (!c) return std::nullopt;
    const auto island = c->IslandAt(n);
    if (!island || island->value == kNoIsland) return std::nullopt;
    return MakeIslandIdx(IndexOf(key), *island);
}

std::optional<IslandArenaIdx> HierarchicalGraph::IslandOfPortal(PortalId id) const noexcept {
    if (id.id < 0 || static_cast<std::size_t>(id.id) >= nodes.size()) return std::nullopt;
    return IslandIndexAt(nodes[static_cast<std::size_t>(id.id)].node);
}

} // namespace herd::nav
