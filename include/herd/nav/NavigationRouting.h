#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "GridTypes.h"
#include "HierarchicalGraph.h"

namespace herd::nav {

// island x island -> first portal to take out of the source island.
class IslandRoutingArena {
public:
    static constexpr int32_t kNoRoute = -1;

    explicit IslandRoutingArena(std::size_t numClusters = 0) { Resize(numClusters); }

    void Resize(std::size_t numClusters);
    void Clear() noexcept;

    [[nodiscard]] std::size_t Capacity() const noexcept { return capacity_; }

    [[nodiscard]] std::optional<PortalId> FindNextPortal(IslandArenaIdx src, IslandArenaIdx dst) const noexcept {
        if (src.value >= capacity_ || dst.value >= capacity_) return std::nullopt;
        const int32_t v = routes_[static_cast<std::size_t>(src.value) * capacity_ + dst.value];
        if (v == kNoRoute) return std::nullopt;
        return PortalId{ v };
    }

    bool SetRoute(IslandArenaIdx src, IslandArenaIdx dst, PortalId next) noexcept;

    bool operator==(const IslandRoutingArena&) const = default;

private:
    std::size_t capacity_ = 0;    // numClusters * kMaxIslands
    std::vector<int32_t> routes_; // capacity_ * capacity_
};

// (src cluster, dst cluster, src region, dst region) -> region to enter next.
class RegionRoutingArena {
public:
    explicit RegionRoutingArena(std::size_t numClusters = 0) { Resize(numClusters); }

    void Resize(std::size_t numClusters);
    void Clear() noexcept;

    [[nodiscard]] std::size_t NumClusters() const noexcept { return numClusters_; }

    [[nodiscard]] std::optional<LocalRegionId> GetNextRegion(ClusterArenaIdx sc, ClusterArenaIdx ec,
                                                             LocalRegionId sr, LocalRegionId er) const noexcept {
        if (!InRange(sc, ec, sr, er)) return std::nullopt;
        const uint8_t v = routes_[Index(sc, ec, sr, er)];
        if (v == kNoRegion) return std::nullopt;
        return LocalRegionId{ v };
    }

    bool SetRoute(ClusterArenaIdx sc, ClusterArenaIdx ec, LocalRegionId sr, LocalRegionId er,
                  LocalRegionId next) noexcept;

    bool operator==(const RegionRoutingArena&) const = default;

private:
    std::size_t numClusters_ = 0;
    std::vector<uint8_t> routes_;

    [[nodiscard]] bool InRange(ClusterArenaIdx sc, ClusterArenaIdx ec, LocalRegionId sr, LocalRegionId er) const noexcept {
        return sc.value < numClusters_ && ec.value < numClusters_ && sr.value < kMaxRegions && er.value < kMaxRegions;
    }
    [[nodiscard]] std::size_t Index(ClusterArenaIdx sc, ClusterArenaIdx ec, LocalRegionId sr, LocalRegionId er) const noexcept {
        constexpr std::size_t kR = kMaxRegions;
        return static_cast<std::size_t>(sc.value) * (numClusters_ * kR * kR)
             + static_cast<std::size_t>(ec.value) * (kR * kR)
             + static_cast<std::size_t>(sr.value) * kR
             + er.value;
    }
};

struct NavigationRouting {
    IslandRoutingArena islandRouting;
    RegionRoutingArena regionRouting;

    [[nodiscard]] bool IsSizedCorrectly(std::size_t numClusters) const noexcept {
        return islandRouting.Capacity() == numClusters * kMaxIslands
            && regionRouting.NumClusters() == numClusters;
    }

    // Destructive: every route is forgotten.
    void Resize(std::size_t numClusters) {
        islandRouting.Resize(numClusters);
        regionRouting.Resize(numClusters);
    }

    bool operator==(const NavigationRouting&) const = default;
};

// One row of the island arena: every island reachable from `source`.
void BuildIslandRoutingRow(IslandRoutingArena& arena, const HierarchicalGraph& graph, IslandArenaIdx source);

// Region rows from cluster `source` to itself and its four neighbours.
void BuildRegionRoutingRows(RegionRoutingArena& arena, const HierarchicalGraph& graph, const ClusterKey& source);

} // namespace herd::nav
