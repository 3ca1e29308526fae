#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>

#include "herd/math/Fixed.h"

namespace herd::nav {

using math::Fixed;
using math::FixedVec2;

inline constexpr int32_t kDefaultClusterSize = 25;
inline constexpr std::size_t kMaxRegions = 32; // per cluster
inline constexpr std::size_t kMaxIslands = 16; // per cluster

inline constexpr uint8_t kBlockedCost = 255;
inline constexpr uint8_t kNoRegion = 255;
inline constexpr uint8_t kNoIsland = 255;

// Grid cell. Ordered row-major.
struct Node {
    int32_t x = 0, y = 0;
    constexpr bool operator==(const Node& o) const noexcept { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Node& o) const noexcept { return !(*this == o); }
    constexpr bool operator<(const Node& o) const noexcept { return y != o.y ? y < o.y : x < o.x; }
};

// Cluster coordinate (cx, cy). Ordered row-major so std::map iteration is the scan order.
struct ClusterKey {
    int32_t cx = 0, cy = 0;
    constexpr bool operator==(const ClusterKey& o) const noexcept { return cx == o.cx && cy == o.cy; }
    constexpr bool operator!=(const ClusterKey& o) const noexcept { return !(*this == o); }
    constexpr bool operator<(const ClusterKey& o) const noexcept { return cy != o.cy ? cy < o.cy : cx < o.cx; }
};

struct PortalId {
    int32_t id = -1;
    [[nodiscard]] constexpr bool Valid() const noexcept { return id >= 0; }
    constexpr bool operator==(const PortalId& o) const noexcept { return id == o.id; }
    constexpr bool operator!=(const PortalId& o) const noexcept { return id != o.id; }
    constexpr bool operator<(const PortalId& o) const noexcept { return id < o.id; }
};

// Dense cluster index: cy * clustersX + cx.
struct ClusterArenaIdx {
    uint32_t value = 0;
    constexpr bool operator==(const ClusterArenaIdx& o) const noexcept { return value == o.value; }
};

// Dense island index: clusterIdx * kMaxIslands + local island.
struct IslandArenaIdx {
    uint32_t value = 0;
    constexpr bool operator==(const IslandArenaIdx& o) const noexcept { return value == o.value; }
    constexpr bool operator!=(const IslandArenaIdx& o) const noexcept { return value != o.value; }
    constexpr bool operator<(const IslandArenaIdx& o) const noexcept { return value < o.value; }
};

struct LocalRegionId {
    uint8_t value = kNoRegion;
    constexpr bool operator==(const LocalRegionId& o) const noexcept { return value == o.value; }
    constexpr bool operator!=(const LocalRegionId& o) const noexcept { return value != o.value; }
};

struct LocalIslandId {
    uint8_t value = kNoIsland;
    constexpr bool operator==(const LocalIslandId& o) const noexcept { return value == o.value; }
};

[[nodiscard]] constexpr IslandArenaIdx MakeIslandIdx(ClusterArenaIdx cluster, LocalIslandId island) noexcept {
    return { cluster.value * static_cast<uint32_t>(kMaxIslands) + island.value };
}

// Inclusive cell rectangle.
struct CellRect {
    int32_t minX = 0, minY = 0, maxX = -1, maxY = -1;

    [[nodiscard]] constexpr int32_t Width() const noexcept { return maxX - minX + 1; }
    [[nodiscard]] constexpr int32_t Height() const noexcept { return maxY - minY + 1; }
    [[nodiscard]] constexpr bool Empty() const noexcept { return maxX < minX || maxY < minY; }
    [[nodiscard]] constexpr bool Contains(const Node& n) const noexcept {
        return n.x >= minX && n.x <= maxX && n.y >= minY && n.y <= maxY;
    }
    // Row-major index relative to the rectangle origin. Caller guarantees Contains(n).
    [[nodiscard]] constexpr std::size_t LocalIndex(const Node& n) const noexcept {
        return static_cast<std::size_t>(n.y - minY) * static_cast<std::size_t>(Width())
             + static_cast<std::size_t>(n.x - minX);
    }
    [[nodiscard]] constexpr std::size_t Area() const noexcept {
        return Empty() ? 0 : static_cast<std::size_t>(Width()) * static_cast<std::size_t>(Height());
    }
    constexpr bool operator==(const CellRect&) const noexcept = default;
};

struct Portal {
    PortalId id;
    Node node;             // centre cell of the boundary run
    Node rangeMin;         // inclusive run along the border, on this portal's side
    Node rangeMax;
    ClusterKey cluster;
    LocalRegionId region;  // region of every cell in the run
    PortalId partner;      // matching portal on the other side of the border
    FixedVec2 worldPos;    // cached GridToWorld(node)

    bool operator==(const Portal&) const = default;
};

struct Edge {
    PortalId to;
    Fixed cost;
    constexpr bool operator==(const Edge& o) const noexcept { return to == o.to && cost == o.cost; }
};

} // namespace herd::nav
