#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include "HierarchicalGraph.h"

namespace herd::nav {

// Groups a cluster's regions into local islands: each region that carries a
// portal is its own island (ascending region order); all portal-less pockets
// share one trailing island. Fails with NavErrc::TooManyIslands past kMaxIslands.
bool AssignLocalIslands(Cluster& cluster, const std::vector<Portal>& nodes, std::error_code& ec);

// Global reachability over (cluster, region) pairs joined through portals.
// Component ids ascend in cluster-scan order.
class ConnectedComponents {
public:
    static constexpr uint32_t kNoComponent = 0xFFFFFFFFu;

    bool initialized = false;

    void Clear();

    // Union-find pass. Regions must be labelled and portals discovered.
    void Build(const HierarchicalGraph& graph);

    // Fallback portals from `from` toward every other component: up to `keep`
    // portals of `from` closest (squared cell distance) to any portal of the
    // target, ties by ascending id.
    void ComputeFallbackRow(const HierarchicalGraph& graph, uint32_t from, std::size_t keep);

    [[nodiscard]] std::size_t ComponentCount() const noexcept { return componentPortals_.size(); }

    [[nodiscard]] std::optional<uint32_t> ComponentOf(ClusterArenaIdx cluster, LocalRegionId region) const noexcept;
    [[nodiscard]] std::optional<uint32_t> ComponentAt(const HierarchicalGraph& graph, const Node& n) const noexcept;

    // Cell-exact: both cells walkable and in the same component.
    [[nodiscard]] bool AreConnected(const HierarchicalGraph& graph, const Node& a, const Node& b) const noexcept;
    // Cluster-level: some region of `a` shares a component with some region of `b`.
    [[nodiscard]] bool AreConnected(ClusterArenaIdx a, ClusterArenaIdx b) const noexcept;

    [[nodiscard]] const std::vector<PortalId>& GetFallbackPortals(uint32_t from, uint32_t to) const noexcept;
    // Cluster-level: merges the rows of every (component of a, component of b)
    // pair, re-ranked by squared distance to the target component then id, and
    // capped at the per-pair count. Empty when the clusters are connected.
    [[nodiscard]] std::vector<PortalId> GetFallbackPortals(const HierarchicalGraph& graph, ClusterArenaIdx a,
                                                           ClusterArenaIdx b) const;

    [[nodiscard]] const std::vector<PortalId>& ComponentPortals(uint32_t comp) const noexcept;

    bool operator==(const ConnectedComponents&) const = default;

private:
    std::vector<uint32_t> regionComponent_;                 // clusterIdx * kMaxRegions + region
    std::vector<std::vector<uint32_t>> clusterComponents_;  // ascending, unique
    std::vector<std::vector<PortalId>> componentPortals_;   // ascending id
    std::map<std::pair<uint32_t, uint32_t>, std::vector<PortalId>> fallback_;
    std::size_t fallbackKeep_ = 0;

    [[nodiscard]] int64_t SquaredDistanceTo(const HierarchicalGraph& graph, PortalId from, uint32_t comp) const;
};

} // namespace herd::nav
