#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

#include "CostGrid.h"
#include "GraphBuild.h"
#include "NavConfig.h"

namespace herd::nav {

// Single owner of the navigation data. A build always writes into a staging
// copy; readers only ever see a completely built graph (or nothing).
//
// Not thread-safe: build ticks and queries run on the simulation thread.
class NavigationContext {
public:
    explicit NavigationContext(NavConfig cfg = {});

    [[nodiscard]] const NavConfig& Config() const noexcept { return cfg_; }
    // Graph settings take effect with the next build; a non-empty logLevel is
    // applied to the logger right away.
    void SetConfig(const NavConfig& cfg);

    // Drops the published graph immediately and restarts the build.
    void Reset();
    // Restarts the build but keeps answering from the published graph until
    // the new one is Done.
    void RequestRebuild();

    // One chunk of the incremental build; publishes on Done.
    GraphBuildStep Tick(const CostGrid& grid, BuildProgress& progress);

    // Same state machine driven to completion in one call.
    bool BuildGraphSync(const CostGrid& grid, std::error_code* ec = nullptr);

    [[nodiscard]] bool Initialized() const noexcept { return published_ != nullptr; }
    // Incremented on every publish; paths remember the generation they were planned on.
    [[nodiscard]] uint64_t Generation() const noexcept { return generation_; }
    [[nodiscard]] GraphBuildStep Step() const noexcept { return state_.step; }
    [[nodiscard]] float Progress() const noexcept { return state_.progress; }
    [[nodiscard]] const std::error_code& BuildError() const noexcept { return state_.error; }

    // nullptr until a build has been published.
    [[nodiscard]] const NavData* Data() const noexcept { return published_.get(); }
    [[nodiscard]] const HierarchicalGraph* Graph() const noexcept {
        return published_ ? &published_->graph : nullptr;
    }

    // Read-only queries; empty / false while nothing is published.
    [[nodiscard]] std::optional<PortalId> FindNextPortal(IslandArenaIdx src, IslandArenaIdx dst) const noexcept;
    [[nodiscard]] std::optional<LocalRegionId> GetNextRegion(ClusterArenaIdx sc, ClusterArenaIdx ec,
                                                             LocalRegionId sr, LocalRegionId er) const noexcept;
    [[nodiscard]] bool AreConnected(const Node& a, const Node& b) const noexcept;
    [[nodiscard]] bool AreConnected(const ClusterKey& a, const ClusterKey& b) const noexcept;
    [[nodiscard]] std::vector<PortalId> GetFallbackPortals(const ClusterKey& from, const ClusterKey& to) const;

    [[nodiscard]] bool IsSizedCorrectly(std::size_t numClusters) const noexcept;
    // Destructive for the published routing tables.
    void Resize(std::size_t numClusters);

private:
    NavConfig cfg_;
    std::unique_ptr<NavData> published_;
    std::unique_ptr<NavData> staging_;
    GraphBuildState state_;
    uint64_t generation_ = 0;

    void Publish();
};

} // namespace herd::nav
