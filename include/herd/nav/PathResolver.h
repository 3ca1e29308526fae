#pragma once
#include <optional>

#include "CostGrid.h"
#include "NavigationContext.h"
#include "Path.h"

namespace herd::nav {

// Chooses the cheapest path representation for one request:
// direct line of sight, a bounded local search, or a hierarchical route that
// is expanded lazily by NextNavigationTarget. Unreachable goals are redirected
// to the nearest fallback portal; nullopt means "no path this tick".
std::optional<Path> ResolvePath(const NavigationContext& ctx, const CostGrid& grid,
                                const FixedVec2& startWorld, const FixedVec2& goalWorld);

} // namespace herd::nav
