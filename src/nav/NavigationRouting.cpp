#include "herd/nav/NavigationRouting.h"

#include "herd/prof/Zone.h"

#include <algorithm>
#include <queue>

namespace herd::nav {

void IslandRoutingArena::Resize(std::size_t numClusters) {
    capacity_ = numClusters * kMaxIslands;
    routes_.assign(capacity_ * capacity_, kNoRoute);
}

void IslandRoutingArena::Clear() noexcept {
    std::fill(routes_.begin(), routes_.end(), kNoRoute);
}

bool IslandRoutingArena::SetRoute(IslandArenaIdx src, IslandArenaIdx dst, PortalId next) noexcept {
    if (src.value >= capacity_ || dst.value >= capacity_) return false;
    routes_[static_cast<std::size_t>(src.value) * capacity_ + dst.value] = next.id;
    return true;
}

void RegionRoutingArena::Resize(std::size_t numClusters) {
    numClusters_ = numClusters;
    routes_.assign(numClusters * numClusters * kMaxRegions * kMaxRegions, kNoRegion);
}

void RegionRoutingArena::Clear() noexcept {
    std::fill(routes_.begin(), routes_.end(), kNoRegion);
}

bool RegionRoutingArena::SetRoute(ClusterArenaIdx sc, ClusterArenaIdx ec, LocalRegionId sr, LocalRegionId er,
                                  LocalRegionId next) noexcept {
    if (!InRange(sc, ec, sr, er)) return false;
    routes_[Index(sc, ec, sr, er)] = next.value;
    return true;
}

namespace {

struct QueueRec {
    Fixed cost;
    int32_t id = 0;
};

// Min-heap on (cost, portal id).
struct QueueSort {
    bool operator()(const QueueRec& a, const QueueRec& b) const noexcept {
        return a.cost != b.cost ? a.cost > b.cost : a.id > b.id;
    }
};

} // namespace

void BuildIslandRoutingRow(IslandRoutingArena& arena, const HierarchicalGraph& graph, IslandArenaIdx source)
{
    HERD_TRACY_ZONE("BuildIslandRoutingRow");
    const ClusterArenaIdx clusterIdx{ source.value / static_cast<uint32_t>(kMaxIslands) };
    if (clusterIdx.value >= graph.ClusterCount()) return;
    const Cluster* cluster = graph.GetCluster(graph.KeyAt(clusterIdx));
    if (!cluster) return;

    const std::size_t n = graph.nodes.size();
    std::vector<IslandArenaIdx> islandOf(n);
    std::vector<uint8_t> hasIsland(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
        if (const auto isl = graph.IslandOfPortal(PortalId{ static_cast<int32_t>(i) })) {
            islandOf[i] = *isl;
            hasIsland[i] = 1;
        }
    }

    std::vector<Fixed> dist(n, Fixed::Max());
    std::vector<int32_t> first(n, -1);
    std::priority_queue<QueueRec, std::vector<QueueRec>, QueueSort> open;

    // Every portal of the source island starts at zero.
    for (const PortalId p : cluster->portals) {
        const auto i = static_cast<std::size_t>(p.id);
        if (!hasIsland[i] || islandOf[i] != source) continue;
        dist[i] = Fixed::Zero();
        first[i] = p.id;
        open.push({ Fixed::Zero(), p.id });
    }

    while (!open.empty()) {
        const QueueRec cur = open.top(); open.pop();
        const auto ci = static_cast<std::size_t>(cur.id);
        if (cur.cost != dist[ci]) continue; // stale entry

        if (hasIsland[ci] && islandOf[ci] != source && !arena.FindNextPortal(source, islandOf[ci]))
            arena.SetRoute(source, islandOf[ci], PortalId{ first[ci] });

        for (const Edge& e : graph.EdgesOf(PortalId{ cur.id })) {
            const auto ni = static_cast<std::size_t>(e.to.id);
            const Fixed next = cur.cost + e.cost;
            if (next < dist[ni]) {
                dist[ni] = next;
                first[ni] = first[ci];
                open.push({ next, e.to.id });
            }
        }
    }
}

void BuildRegionRoutingRows(RegionRoutingArena& arena, const HierarchicalGraph& graph, const ClusterKey& source)
{
    const Cluster* a = graph.GetCluster(source);
    if (!a) return;
    const ClusterArenaIdx ai = graph.IndexOf(source);
    const uint8_t nA = a->regions.regionCount;

    for (uint8_t r = 0; r < nA; ++r)
        arena.SetRoute(ai, ai, LocalRegionId{ r }, LocalRegionId{ r }, LocalRegionId{ r });

    const ClusterKey neighbours[4] = {
        { source.cx - 1, source.cy }, { source.cx + 1, source.cy },
        { source.cx, source.cy - 1 }, { source.cx, source.cy + 1 },
    };

    for (const ClusterKey& bk : neighbours) {
        const Cluster* b = graph.GetCluster(bk);
        if (!b) continue;
        const ClusterArenaIdx bi = graph.IndexOf(bk);
        const uint8_t nB = b->regions.regionCount;

        // Region graph over A's regions [0, nA) and B's regions [nA, nA + nB).
        std::vector<std::vector<int32_t>> adj(static_cast<std::size_t>(nA) + nB);
        for (const PortalId p : a->portals) {
            const Portal& pa = graph.GetPortal(p);
            const Portal& pb = graph.GetPortal(pa.partner);
            if (pb.cluster != bk) continue;
            const int32_t u = pa.region.value;
            const int32_t v = nA + pb.region.value;
            adj[static_cast<std::size_t>(u)].push_back(v);
            adj[static_cast<std::size_t>(v)].push_back(u);
        }
        for (auto& list : adj) {
            std::sort(list.begin(), list.end());
            list.erase(std::unique(list.begin(), list.end()), list.end());
        }

        for (uint8_t ra = 0; ra < nA; ++ra) {
            std::vector<int32_t> firstHop(adj.size(), -1);
            std::vector<uint8_t> seen(adj.size(), 0);
            std::queue<int32_t> frontier;
            frontier.push(ra);
            seen[ra] = 1;

            while (!frontier.empty()) {
                const int32_t u = frontier.front(); frontier.pop();
                for (const int32_t v : adj[static_cast<std::size_t>(u)]) {
                    const auto vi = static_cast<std::size_t>(v);
                    if (seen[vi]) continue;
                    seen[vi] = 1;
                    firstHop[vi] = (u == ra) ? v : firstHop[static_cast<std::size_t>(u)];
                    frontier.push(v);
                }
            }

            for (uint8_t rb = 0; rb < nB; ++rb) {
                const int32_t hop = firstHop[static_cast<std::size_t>(nA) + rb];
                if (hop < nA) continue; // unreached (-1); a first hop always lands in B
                arena.SetRoute(ai, bi, LocalRegionId{ ra }, LocalRegionId{ rb },
                               LocalRegionId{ static_cast<uint8_t>(hop - nA) });
            }
        }
    }
}

} // namespace herd::nav
