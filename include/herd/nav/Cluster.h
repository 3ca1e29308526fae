#pragma once
#include <map>
#include <optional>
#include <vector>

#include "GridTypes.h"
#include "LocalSearch.h"
#include "RegionDecomposition.h"

namespace herd::nav {

struct Cluster {
    ClusterKey key;
    CellRect bounds;
    std::vector<PortalId> portals;          // ascending id
    RegionMap regions;
    std::vector<LocalIslandId> regionIsland; // indexed by region
    uint8_t islandCount = 0;
    std::map<PortalId, IntegrationField> fieldCache;

    [[nodiscard]] std::optional<LocalRegionId> RegionAt(const Node& n) const noexcept {
        return regions.RegionAt(n);
    }

    [[nodiscard]] std::optional<LocalIslandId> IslandAt(const Node& n) const noexcept {
        const auto r = RegionAt(n);
        if (!r || r->value >= regionIsland.size()) return std::nullopt;
        return regionIsland[r->value];
    }

    [[nodiscard]] const IntegrationField* GetField(PortalId id) const noexcept {
        const auto it = fieldCache.find(id);
        return it == fieldCache.end() ? nullptr : &it->second;
    }

    void ClearCache() noexcept { fieldCache.clear(); }

    bool operator==(const Cluster&) const = default;
};

} // namespace herd::nav
