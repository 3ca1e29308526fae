#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <system_error>
#include <vector>

#include "Cluster.h"
#include "CostGrid.h"
#include "GridTypes.h"

namespace herd::nav {

// Abstract graph over the cost grid: clusters, their regions, and portals on
// cluster borders linked by cross edges (between clusters) and intra edges
// (within one region of a cluster).
//
// Every container is ordered, so two builds from the same grid produce the same
// node ids, edge lists and cluster order.
class HierarchicalGraph {
public:
    std::vector<Portal> nodes;                     // index == PortalId::id
    std::map<PortalId, std::vector<Edge>> edges;   // each list ascending by Edge::to
    std::map<ClusterKey, Cluster> clusters;        // row-major
    bool initialized = false;

    void Clear();

    // Creates empty clusters covering the grid. Edge clusters are clipped.
    bool InitializeClusters(const CostGrid& grid, int32_t clusterSize, std::error_code& ec);

    // Region labels for one cluster.
    bool DecomposeCluster(const CostGrid& grid, const ClusterKey& key, std::error_code& ec);

    // Portal discovery across the border between cluster column `cx` and `cx + 1`
    // (all cluster rows), or between cluster row `cy` and `cy + 1` (all columns).
    // One portal pair per maximal run of cells walkable on both sides.
    void FindVerticalBorderPortals(const CostGrid& grid, int32_t cx);
    void FindHorizontalBorderPortals(const CostGrid& grid, int32_t cy);

    // Intra edges between every same-region portal pair of the cluster, then
    // sorts the cluster's adjacency lists. The search cap is raised to the
    // cluster area when maxIterations is smaller.
    void ConnectIntraCluster(const CostGrid& grid, const ClusterKey& key, int32_t maxIterations);

    // (Re)computes the cached integration field of every portal in the cluster.
    void RegenerateClusterFields(const CostGrid& grid, const ClusterKey& key);

    [[nodiscard]] int32_t ClusterSize() const noexcept { return clusterSize_; }
    [[nodiscard]] int32_t ClustersX() const noexcept { return clustersX_; }
    [[nodiscard]] int32_t ClustersY() const noexcept { return clustersY_; }
    [[nodiscard]] std::size_t ClusterCount() const noexcept {
        return static_cast<std::size_t>(clustersX_) * static_cast<std::size_t>(clustersY_);
    }
    [[nodiscard]] int32_t GridWidth() const noexcept { return gridW_; }
    [[nodiscard]] int32_t GridHeight() const noexcept { return gridH_; }

    [[nodiscard]] ClusterKey KeyFor(const Node& n) const noexcept {
        return { n.x / clusterSize_, n.y / clusterSize_ };
    }
    [[nodiscard]] ClusterArenaIdx IndexOf(const ClusterKey& k) const noexcept {
        return { static_cast<uint32_t>(k.cy * clustersX_ + k.cx) };
    }
    [[nodiscard]] ClusterKey KeyAt(ClusterArenaIdx idx) const noexcept {
        const auto cx = static_cast<int32_t>(idx.value % static_cast<uint32_t>(clustersX_));
        const auto cy = static_cast<int32_t>(idx.value / static_cast<uint32_t>(clustersX_));
        return { cx, cy };
    }
    [[nodiscard]] bool ContainsKey(const ClusterKey& k) const noexcept {
        return k.cx >= 0 && k.cy >= 0 && k.cx < clustersX_ && k.cy < clustersY_;
    }

    [[nodiscard]] const Cluster* GetCluster(const ClusterKey& k) const noexcept;
    [[nodiscard]] Cluster* GetCluster(const ClusterKey& k) noexcept;
    [[nodiscard]] const Portal& GetPortal(PortalId id) const { return nodes.at(static_cast<std::size_t>(id.id)); }
    [[nodiscard]] const std::vector<Edge>& EdgesOf(PortalId id) const noexcept;

    [[nodiscard]] std::size_t NodeCount() const noexcept { return nodes.size(); }
    [[nodiscard]] std::size_t EdgeCount() const noexcept; // directed

    // Island of the cell / of a portal; nullopt for blocked cells or before island detection.
    [[nodiscard]] std::optional<IslandArenaIdx> IslandIndexAt(const Node& n) const noexcept;
    [[nodiscard]] std::optional<IslandArenaIdx> IslandOfPortal(PortalId id) const noexcept;

    bool operator==(const HierarchicalGraph&) const = default;

private:
    int32_t clusterSize_ = kDefaultClusterSize;
    int32_t clustersX_ = 0;
    int32_t clustersY_ = 0;
    int32_t gridW_ = 0;
    int32_t gridH_ = 0;

    // a and b are the inclusive runs on either side of the border.
    void AddPortalPair(const CostGrid& grid, const Node& aMin, const Node& aMax,
                       const Node& bMin, const Node& bMax);
};

} // namespace herd::nav
