#include "herd/nav/IslandDetection.h"

#include "herd/logging/Log.h"
#include "herd/nav/NavError.h"

#include <algorithm>
#include <numeric>

namespace herd::nav {

bool AssignLocalIslands(Cluster& cluster, const std::vector<Portal>& nodes, std::error_code& ec)
{
    const std::size_t regionCount = cluster.regions.regionCount;
    std::vector<uint8_t> hasPortal(regionCount, 0);
    for (const PortalId p : cluster.portals) {
        const uint8_t r = nodes[static_cast<std::size_t>(p.id)].region.value;
        if (r < regionCount) hasPortal[r] = 1;
    }

    const std::size_t sides = static_cast<std::size_t>(std::count(hasPortal.begin(), hasPortal.end(), uint8_t{1}));
    const bool pockets = sides < regionCount;
    const std::size_t islands = sides + (pockets ? 1 : 0);
    if (islands > kMaxIslands) {
        ec = NavErrc::TooManyIslands;
        logsys::get()->error("Cluster ({}, {}): {} islands (limit {})",
                             cluster.key.cx, cluster.key.cy, islands, kMaxIslands);
        return false;
    }

    cluster.regionIsland.assign(regionCount, LocalIslandId{});
    uint8_t next = 0;
    for (std::size_t r = 0; r < regionCount; ++r)
        if (hasPortal[r]) cluster.regionIsland[r] = LocalIslandId{ next++ };
    for (std::size_t r = 0; r < regionCount; ++r)
        if (!hasPortal[r]) cluster.regionIsland[r] = LocalIslandId{ next };
    cluster.islandCount = static_cast<uint8_t>(islands);
    return true;
}

namespace {

struct DisjointSet {
    std::vector<uint32_t> parent;

    explicit DisjointSet(std::size_t n) : parent(n) { std::iota(parent.begin(), parent.end(), 0u); }

    uint32_t Find(uint32_t v) {
        while (parent[v] != v) {
            parent[v] = parent[parent[v]];
            v = parent[v];
        }
        return v;
    }

    // Smaller root wins so the result does not depend on union order.
    void Unite(uint32_t a, uint32_t b) {
        a = Find(a); b = Find(b);
        if (a == b) return;
        if (b < a) std::swap(a, b);
        parent[b] = a;
    }
};

inline uint32_t RegionSlot(uint32_t clusterIdx, uint8_t region) noexcept {
    return clusterIdx * static_cast<uint32_t>(kMaxRegions) + region;
}

} // namespace

void ConnectedComponents::Clear()
{
    initialized = false;
    regionComponent_.clear();
    clusterComponents_.clear();
    componentPortals_.clear();
    fallback_.clear();
    fallbackKeep_ = 0;
}

void ConnectedComponents::Build(const HierarchicalGraph& graph)
{
    Clear();
    const std::size_t clusterCount = graph.ClusterCount();
    DisjointSet sets(clusterCount * kMaxRegions);

    for (const Portal& p : graph.nodes) {
        if (p.partner.id < p.id.id) continue; // each pair once
        const Portal& q = graph.GetPortal(p.partner);
        sets.Unite(RegionSlot(graph.IndexOf(p.cluster).value, p.region.value),
                   RegionSlot(graph.IndexOf(q.cluster).value, q.region.value));
    }

    regionComponent_.assign(clusterCount * kMaxRegions, kNoComponent);
    clusterComponents_.assign(clusterCount, {});
    std::map<uint32_t, uint32_t> rootToComponent;

    for (const auto& [key, cluster] : graph.clusters) {
        const uint32_t ci = graph.IndexOf(key).value;
        for (uint8_t r = 0; r < cluster.regions.regionCount; ++r) {
            const uint32_t root = sets.Find(RegionSlot(ci, r));
            const auto it = rootToComponent.emplace(root, static_cast<uint32_t>(rootToComponent.size())).first;
            regionComponent_[RegionSlot(ci, r)] = it->second;
            auto& comps = clusterComponents_[ci];
            if (std::find(comps.begin(), comps.end(), it->second) == comps.end())
                comps.push_back(it->second);
        }
        std::sort(clusterComponents_[ci].begin(), clusterComponents_[ci].end());
    }

    componentPortals_.assign(rootToComponent.size(), {});
    for (const Portal& p : graph.nodes) {
        const uint32_t comp = regionComponent_[RegionSlot(graph.IndexOf(p.cluster).value, p.region.value)];
        if (comp != kNoComponent) componentPortals_[comp].push_back(p.id);
    }

    initialized = true;
    logsys::get()->debug("Connected components: {} over {} clusters", componentPortals_.size(), clusterCount);
}

int64_t ConnectedComponents::SquaredDistanceTo(const HierarchicalGraph& graph, PortalId from, uint32_t comp) const
{
    const Node na = graph.GetPortal(from).node;
    int64_t best = INT64_MAX;
    for (const PortalId b : componentPortals_[comp]) {
        const Node nb = graph.GetPortal(b).node;
        const int64_t dx = na.x - nb.x, dy = na.y - nb.y;
        best = std::min(best, dx * dx + dy * dy);
    }
    return best;
}

void ConnectedComponents::ComputeFallbackRow(const HierarchicalGraph& graph, uint32_t from, std::size_t keep)
{
    fallbackKeep_ = keep;
    if (from >= componentPortals_.size() || keep == 0) return;
    const auto& fromPortals = componentPortals_[from];
    if (fromPortals.empty()) return;

    for (uint32_t to = 0; to < componentPortals_.size(); ++to) {
        if (to == from || componentPortals_[to].empty()) continue;

        std::vector<std::pair<int64_t, PortalId>> ranked;
        ranked.reserve(fromPortals.size());
        for (const PortalId a : fromPortals)
            ranked.emplace_back(SquaredDistanceTo(graph, a, to), a);

        const std::size_t n = std::min(keep, ranked.size());
        std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(n), ranked.end());
        auto& out = fallback_[{ from, to }];
        out.clear();
        for (std::size_t i = 0; i < n; ++i) out.push_back(ranked[i].second);
    }
}

std::optional<uint32_t> ConnectedComponents::ComponentOf(ClusterArenaIdx cluster, LocalRegionId region) const noexcept
{
    if (region.value >= kMaxRegions) return std::nullopt;
    const std::size_t slot = RegionSlot(cluster.value, region.value);
    if (slot >= regionComponent_.size() || regionComponent_[slot] == kNoComponent) return std::nullopt;
    return regionComponent_[slot];
}

std::optional<uint32_t> ConnectedComponents::ComponentAt(const HierarchicalGraph& graph, const Node& n) const noexcept
{
    if (n.x < 0 || n.y < 0 || n.x >= graph.GridWidth() || n.y >= graph.GridHeight()) return std::nullopt;
    const ClusterKey key = graph.KeyFor(n);
    const Cluster* c = graph.GetCluster(key);
    if (!c) return std::nullopt;
    const auto region = c->RegionAt(n);
    if (!region) return std::nullopt;
    return ComponentOf(graph.IndexOf(key), *region);
}

bool ConnectedComponents::AreConnected(const HierarchicalGraph& graph, const Node& a, const Node& b) const noexcept
{
    const auto ca = ComponentAt(graph, a);
    const auto cb = ComponentAt(graph, b);
    return ca && cb && *ca == *cb;
}

bool ConnectedComponents::AreConnected(ClusterArenaIdx a, ClusterArenaIdx b) const noexcept
{
    if (a.value >= clusterComponents_.size() || b.value >= clusterComponents_.size()) return false;
    const auto& ca = clusterComponents_[a.value];
    const auto& cb = clusterComponents_[b.value];
    for (const uint32_t c : ca)
        if (std::binary_search(cb.begin(), cb.end(), c)) return true;
    return false;
}

const std::vector<PortalId>& ConnectedComponents::GetFallbackPortals(uint32_t from, uint32_t to) const noexcept
{
    static const std::vector<PortalId> kNone;
    const auto it = fallback_.find({ from, to });
    return it == fallback_.end() ? kNone : it->second;
}

std::vector<PortalId> ConnectedComponents::GetFallbackPortals(const HierarchicalGraph& graph, ClusterArenaIdx a,
                                                              ClusterArenaIdx b) const
{
    if (a.value >= clusterComponents_.size() || b.value >= clusterComponents_.size()) return {};
    if (AreConnected(a, b)) return {};

    // A portal can head several rows; it keeps its best distance.
    std::map<PortalId, int64_t> best;
    for (const uint32_t from : clusterComponents_[a.value]) {
        for (const uint32_t to : clusterComponents_[b.value]) {
            for (const PortalId p : GetFallbackPortals(from, to)) {
                const int64_t d = SquaredDistanceTo(graph, p, to);
                const auto [it, inserted] = best.emplace(p, d);
                if (!inserted) it->second = std::min(it->second, d);
            }
        }
    }

    std::vector<std::pair<int64_t, PortalId>> ranked;
    ranked.reserve(best.size());
    for (const auto& [id, d] : best) ranked.emplace_back(d, id);
    std::sort(ranked.begin(), ranked.end());

    std::vector<PortalId> out;
    const std::size_t n = std::min(fallbackKeep_, ranked.size());
    for (std::size_t i = 0; i < n; ++i) out.push_back(ranked[i].second);
    return out;
}

const std::vector<PortalId>& ConnectedComponents::ComponentPortals(uint32_t comp) const noexcept
{
    static const std::vector<PortalId> kNone;
    return comp < componentPortals_.size() ? componentPortals_[comp] : kNone;
}

} // namespace herd::nav
