#include "herd/nav/GraphBuild.h"

#include "herd/logging/Log.h"
#include "herd/nav/NavError.h"
#include "herd/prof/Zone.h"

#include <algorithm>
#include <iterator>

namespace herd::nav {

const char* ToString(GraphBuildStep step) noexcept {
    switch (step) {
    case GraphBuildStep::NotStarted:          return "NotStarted";
    case GraphBuildStep::Clustering:          return "Clustering";
    case GraphBuildStep::RegionDecomposition: return "RegionDecomposition";
    case GraphBuildStep::IslandDetection:     return "IslandDetection";
    case GraphBuildStep::PortalGraph:         return "PortalGraph";
    case GraphBuildStep::RoutingTables:       return "RoutingTables";
    case GraphBuildStep::Done:                return "Done";
    case GraphBuildStep::Failed:              return "Failed";
    }
    return "?";
}

namespace {

// Progress span [base, base + span) of each sub-phase.
struct PhaseSpan { float base; float span; const char* task; };

constexpr PhaseSpan kRegionPhases[] = {
    { 0.05f, 0.15f, "Labelling regions" },
    { 0.20f, 0.05f, "Finding vertical portals" },
    { 0.25f, 0.05f, "Finding horizontal portals" },
};
constexpr PhaseSpan kIslandPhases[] = {
    { 0.30f, 0.04f, "Assigning islands" },
    { 0.34f, 0.01f, "Connecting components" },
    { 0.35f, 0.05f, "Computing fallback portals" },
};
constexpr PhaseSpan kPortalPhases[] = {
    { 0.40f, 0.40f, "Connecting portals" },
};
constexpr PhaseSpan kRoutingPhases[] = {
    { 0.80f, 0.01f, "Sizing routing tables" },
    { 0.81f, 0.11f, "Island routing" },
    { 0.92f, 0.07f, "Region routing" },
};

void Report(GraphBuildState& st, BuildProgress& out, float value, const char* task) {
    st.progress = std::max(st.progress, std::min(value, 1.0f));
    out.progress = st.progress;
    out.task = task;
}

void ReportPhase(GraphBuildState& st, BuildProgress& out, const PhaseSpan& ph, std::size_t total) {
    const float frac = total == 0 ? 1.0f : static_cast<float>(st.cursor) / static_cast<float>(total);
    Report(st, out, ph.base + ph.span * frac, ph.task);
}

void Fail(GraphBuildState& st, std::error_code ec) {
    st.step = GraphBuildStep::Failed;
    st.error = ec;
    logsys::get()->error("Navigation build failed: {}", ec.message());
}

void Enter(GraphBuildState& st, GraphBuildStep step) {
    st.step = step;
    st.phase = 0;
    st.cursor = 0;
    logsys::get()->debug("Navigation build: {}", ToString(step));
}

std::size_t Batch(const NavConfig& cfg) {
    return static_cast<std::size_t>(std::max(cfg.buildBatchSize, 1));
}

} // namespace

GraphBuildStep AdvanceGraphBuild(GraphBuildState& st, const CostGrid& grid, NavData& data,
                                 BuildProgress& progress, const NavConfig& cfg)
{
    HERD_TRACY_ZONE("AdvanceGraphBuild");
    if (st.step == GraphBuildStep::Done || st.step == GraphBuildStep::Failed)
        return st.step;

    if (st.step != GraphBuildStep::NotStarted && (grid.Width() != st.gridW || grid.Height() != st.gridH)) {
        logsys::get()->warn("Grid resized during navigation build ({}x{} -> {}x{}), restarting",
                            st.gridW, st.gridH, grid.Width(), grid.Height());
        const float kept = st.progress;
        st.Reset();
        st.progress = kept;
    }

    const std::size_t batch = Batch(cfg);

    // Empty sub-phases are skipped without counting as a chunk.
    for (;;) {
        switch (st.step) {
        case GraphBuildStep::NotStarted: {
            data.Clear();
            st.gridW = grid.Width();
            st.gridH = grid.Height();
            Enter(st, GraphBuildStep::Clustering);
            Report(st, progress, 0.0f, "Starting");
            logsys::get()->info("Navigation build started ({}x{}, cluster size {})",
                                st.gridW, st.gridH, cfg.clusterSize);
            return st.step;
        }

        case GraphBuildStep::Clustering: {
            std::error_code ec;
            if (!data.graph.InitializeClusters(grid, cfg.clusterSize, ec)) {
                Fail(st, ec);
                return st.step;
            }
            st.clusterOrder.clear();
            for (const auto& [key, cluster] : data.graph.clusters)
                st.clusterOrder.push_back(key);
            Enter(st, GraphBuildStep::RegionDecomposition);
            Report(st, progress, 0.05f, "Clustering");
            return st.step;
        }

        case GraphBuildStep::RegionDecomposition: {
            const std::size_t totals[] = {
                st.clusterOrder.size(),
                static_cast<std::size_t>(std::max(data.graph.ClustersX() - 1, 0)),
                static_cast<std::size_t>(std::max(data.graph.ClustersY() - 1, 0)),
            };
            if (st.phase >= std::size(totals)) {
                Enter(st, GraphBuildStep::IslandDetection);
                continue;
            }
            const std::size_t total = totals[st.phase];
            if (st.cursor >= total) { ++st.phase; st.cursor = 0; continue; }

            const std::size_t end = std::min(total, st.cursor + batch);
            for (; st.cursor < end; ++st.cursor) {
                const auto line = static_cast<int32_t>(st.cursor);
                if (st.phase == 0) {
                    std::error_code ec;
                    if (!data.graph.DecomposeCluster(grid, st.clusterOrder[st.cursor], ec)) {
                        Fail(st, ec);
                        return st.step;
                    }
                } else if (st.phase == 1) {
                    data.graph.FindVerticalBorderPortals(grid, line);
                } else {
                    data.graph.FindHorizontalBorderPortals(grid, line);
                }
            }
            ReportPhase(st, progress, kRegionPhases[st.phase], total);
            return st.step;
        }

        case GraphBuildStep::IslandDetection: {
            const std::size_t totals[] = { st.clusterOrder.size(), 1, data.components.ComponentCount() };
            if (st.phase >= std::size(totals)) {
                Enter(st, GraphBuildStep::PortalGraph);
                continue;
            }
            const std::size_t total = totals[st.phase];
            if (st.cursor >= total) { ++st.phase; st.cursor = 0; continue; }

            if (st.phase == 0) {
                const std::size_t end = std::min(total, st.cursor + batch);
                for (; st.cursor < end; ++st.cursor) {
                    std::error_code ec;
                    Cluster* c = data.graph.GetCluster(st.clusterOrder[st.cursor]);
                    if (c && !AssignLocalIslands(*c, data.graph.nodes, ec)) {
                        Fail(st, ec);
                        return st.step;
                    }
                }
            } else if (st.phase == 1) {
                data.components.Build(data.graph);
                st.cursor = 1;
            } else {
                const std::size_t end = std::min(total, st.cursor + batch);
                for (; st.cursor < end; ++st.cursor)
                    data.components.ComputeFallbackRow(data.graph, static_cast<uint32_t>(st.cursor),
                                                       cfg.fallbackPortalCount);
            }
            ReportPhase(st, progress, kIslandPhases[st.phase], total);
            return st.step;
        }

        case GraphBuildStep::PortalGraph: {
            const std::size_t total = st.clusterOrder.size();
            if (st.cursor >= total) {
                Enter(st, GraphBuildStep::RoutingTables);
                continue;
            }
            const std::size_t end = std::min(total, st.cursor + batch);
            for (; st.cursor < end; ++st.cursor) {
                const ClusterKey key = st.clusterOrder[st.cursor];
                data.graph.ConnectIntraCluster(grid, key, cfg.localSearchMaxIterations);
                data.graph.RegenerateClusterFields(grid, key);
            }
            ReportPhase(st, progress, kPortalPhases[0], total);
            return st.step;
        }

        case GraphBuildStep::RoutingTables: {
            const std::size_t totals[] = { 1, st.islandOrder.size(), st.clusterOrder.size() };
            if (st.phase >= std::size(totals)) {
                data.graph.initialized = true;
                Enter(st, GraphBuildStep::Done);
                Report(st, progress, 1.0f, "Done");
                logsys::get()->info("Navigation build done: {} clusters, {} portals, {} edges, {} components",
                                    data.graph.ClusterCount(), data.graph.NodeCount(),
                                    data.graph.EdgeCount(), data.components.ComponentCount());
                return st.step;
            }
            const std::size_t total = totals[st.phase];
            if (st.cursor >= total) { ++st.phase; st.cursor = 0; continue; }

            if (st.phase == 0) {
                const std::size_t clusters = data.graph.ClusterCount();
                if (!data.routing.IsSizedCorrectly(clusters)) {
                    logsys::get()->info("Resizing routing tables for {} clusters", clusters);
                    data.routing.Resize(clusters);
                } else {
                    data.routing.islandRouting.Clear();
                    data.routing.regionRouting.Clear();
                }
                st.islandOrder.clear();
                for (const auto& [key, cluster] : data.graph.clusters)
                    for (uint8_t i = 0; i < cluster.islandCount; ++i)
                        st.islandOrder.push_back(MakeIslandIdx(data.graph.IndexOf(key), LocalIslandId{ i }));
                st.cursor = 1;
            } else if (st.phase == 1) {
                const std::size_t end = std::min(total, st.cursor + batch);
                for (; st.cursor < end; ++st.cursor)
                    BuildIslandRoutingRow(data.routing.islandRouting, data.graph, st.islandOrder[st.cursor]);
            } else {
                const std::size_t end = std::min(total, st.cursor + batch);
                for (; st.cursor < end; ++st.cursor)
                    BuildRegionRoutingRows(data.routing.regionRouting, data.graph, st.clusterOrder[st.cursor]);
            }
            ReportPhase(st, progress, kRoutingPhases[st.phase], total);
            return st.step;
        }

        case GraphBuildStep::Done:
        case GraphBuildStep::Failed:
            return st.step;
        }
        return st.step;
    }
}

} // namespace herd::nav
