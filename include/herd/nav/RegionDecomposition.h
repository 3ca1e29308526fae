#pragma once
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

#include "CostGrid.h"
#include "GridTypes.h"

namespace herd::nav {

// Region labels of one cluster. Blocked cells carry kNoRegion.
struct RegionMap {
    CellRect bounds;
    std::vector<uint8_t> labels; // row-major over bounds
    uint8_t regionCount = 0;

    [[nodiscard]] std::optional<LocalRegionId> RegionAt(const Node& n) const noexcept {
        if (!bounds.Contains(n)) return std::nullopt;
        const uint8_t v = labels[bounds.LocalIndex(n)];
        if (v == kNoRegion) return std::nullopt;
        return LocalRegionId{ v };
    }

    bool operator==(const RegionMap&) const = default;
};

// Labels the 4-connected walkable components of `bounds`. Seeds are taken in
// row-major order, so region 0 owns the first walkable cell of the scan.
// Fails with NavErrc::TooManyRegions instead of truncating.
bool DecomposeRegions(const CostGrid& grid, const CellRect& bounds, RegionMap& out, std::error_code& ec);

} // namespace herd::nav
