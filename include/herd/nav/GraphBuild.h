#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include "CostGrid.h"
#include "HierarchicalGraph.h"
#include "IslandDetection.h"
#include "NavConfig.h"
#include "NavigationRouting.h"

namespace herd::nav {

enum class GraphBuildStep : uint8_t {
    NotStarted,
    Clustering,
    RegionDecomposition,
    IslandDetection,
    PortalGraph,
    RoutingTables,
    Done,
    Failed,
};

const char* ToString(GraphBuildStep step) noexcept;

// Sink for UI/loading screens. `progress` never decreases during one build.
struct BuildProgress {
    float progress = 0.0f;
    std::string task;
};

// Everything a build produces. Published as a unit.
struct NavData {
    HierarchicalGraph graph;
    ConnectedComponents components;
    NavigationRouting routing;

    void Clear() {
        graph.Clear();
        components.Clear();
    }

    bool operator==(const NavData&) const = default;
};

struct GraphBuildState {
    GraphBuildStep step = GraphBuildStep::NotStarted;
    uint32_t phase = 0;      // sub-phase inside `step`
    std::size_t cursor = 0;  // next unit inside `phase`
    float progress = 0.0f;
    std::error_code error;

    int32_t gridW = 0;
    int32_t gridH = 0;
    std::vector<ClusterKey> clusterOrder;
    std::vector<IslandArenaIdx> islandOrder;

    void Reset() { *this = GraphBuildState{}; }
};

// Does at most one chunk of work (cfg.buildBatchSize units of the current
// phase) and reports progress. Returns the step reached after the chunk.
// Driving this to Done is exactly what a synchronous build does.
GraphBuildStep AdvanceGraphBuild(GraphBuildState& state, const CostGrid& grid, NavData& data,
                                 BuildProgress& progress, const NavConfig& cfg);

} // namespace herd::nav
