#pragma once
#include "CostGrid.h"
#include "NavigationContext.h"
#include "Path.h"

namespace herd::nav {

// Per-tick steering lookup. Advances LocalAStarPath cursors in place; for
// hierarchical paths it reads the routing tables and the cached integration
// field of the chosen exit portal, so the cost is O(1) per agent. Inside the
// goal region it steers straight only with line of sight; otherwise it descends
// a goal-seeded field cached on the path.
NavigationTarget NextNavigationTarget(const NavigationContext& ctx, const CostGrid& grid,
                                      const FixedVec2& position, Path& path, Fixed arrivalRadius);

} // namespace herd::nav
