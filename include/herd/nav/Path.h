#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

#include "GridTypes.h"

namespace herd::nav {

struct IntegrationField;

// Clear straight line to the goal.
struct DirectPath {
    FixedVec2 goal;
};

// Cell-centre waypoints from a bounded local search; `cursor` is the next one to reach.
struct LocalAStarPath {
    std::vector<FixedVec2> waypoints;
    std::size_t cursor = 0;
};

// Long-range route resolved per tick from the routing tables. Only valid on
// the graph generation it was planned against.
struct HierarchicalPath {
    FixedVec2 goal;
    Node goalNode;
    ClusterKey goalCluster;
    uint64_t generation = 0;
    // Goal-seeded field over the goal cluster, built the first time the agent
    // stands in the goal region without line of sight to the goal.
    std::shared_ptr<const IntegrationField> goalField;
};

// "No path" is an empty std::optional<Path>.
using Path = std::variant<DirectPath, LocalAStarPath, HierarchicalPath>;

enum class TargetKind : uint8_t {
    Direct,             // steer straight at `position` (the goal)
    LocalWaypoint,      // next waypoint of a local path
    InterClusterPortal, // next cell toward / across a portal
    Arrived,
    Blocked,            // no usable route; re-request
};

struct NavigationTarget {
    TargetKind kind = TargetKind::Blocked;
    FixedVec2 position;
};

} // namespace herd::nav
