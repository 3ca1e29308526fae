#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "GridTypes.h"

namespace herd::nav {

struct NavConfig {
    int32_t clusterSize = kDefaultClusterSize;
    // Units of work per build tick (clusters, border lines or routing rows).
    int32_t buildBatchSize = 1;
    int32_t localSearchMaxIterations = 10000;
    int32_t nearestWalkableRadius = 50;
    // Requests closer than this many clusters use a widened local search.
    int32_t nearDistanceClusters = 2;
    std::size_t fallbackPortalCount = 3;
    // Applied to the "herd" logger by NavigationContext; empty leaves it alone.
    std::string logLevel;
};

// Best-effort: false when the file is missing or not a JSON object; `out` is
// only written on success. Out-of-range values are clamped, unknown keys ignored.
bool LoadNavConfig(NavConfig& out, const std::filesystem::path& file) noexcept;
bool SaveNavConfig(const NavConfig& cfg, const std::filesystem::path& file) noexcept;

} // namespace herd::nav
