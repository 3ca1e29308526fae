#include "herd/nav/NavigationContext.h"

#include "herd/logging/Log.h"

#include <utility>

namespace herd::nav {

NavigationContext::NavigationContext(NavConfig cfg)
    : cfg_(std::move(cfg)), staging_(std::make_unique<NavData>())
{
    if (!cfg_.logLevel.empty()) logsys::set_level(cfg_.logLevel);
}

void NavigationContext::SetConfig(const NavConfig& cfg) {
    cfg_ = cfg;
    if (!cfg_.logLevel.empty()) logsys::set_level(cfg_.logLevel);
}

void NavigationContext::Reset() {
    if (published_)
        logsys::get()->info("Navigation graph invalidated (generation {})", generation_);
    published_.reset();
    RequestRebuild();
}

void NavigationContext::RequestRebuild() {
    state_.Reset();
    staging_ = std::make_unique<NavData>();
}

GraphBuildStep NavigationContext::Tick(const CostGrid& grid, BuildProgress& progress) {
    if (state_.step == GraphBuildStep::Done || state_.step == GraphBuildStep::Failed)
        return state_.step;

    const GraphBuildStep step = AdvanceGraphBuild(state_, grid, *staging_, progress, cfg_);
    if (step == GraphBuildStep::Done)
        Publish();
    return step;
}

bool NavigationContext::BuildGraphSync(const CostGrid& grid, std::error_code* ec) {
    RequestRebuild();
    BuildProgress progress;
    GraphBuildStep step = state_.step;
    while (step != GraphBuildStep::Done && step != GraphBuildStep::Failed)
        step = AdvanceGraphBuild(state_, grid, *staging_, progress, cfg_);

    if (step == GraphBuildStep::Failed) {
        if (ec) *ec = state_.error;
        return false;
    }
    Publish();
    if (ec) ec->clear();
    return true;
}

void NavigationContext::Publish() {
    published_ = std::move(staging_);
    staging_ = std::make_unique<NavData>();
    ++generation_;
    logsys::get()->debug("Navigation graph published (generation {})", generation_);
}

std::optional<PortalId> NavigationContext::FindNextPortal(IslandArenaIdx src, IslandArenaIdx dst) const noexcept {
    if (!published_) return std::nullopt;
    return published_->routing.islandRouting.FindNextPortal(src, dst);
}

std::optional<LocalRegionId> NavigationContext::GetNextRegion(ClusterArenaIdx sc, ClusterArenaIdx ec,
                                                              LocalRegionId sr, LocalRegionId er) const noexcept {
    if (!published_) return std::nullopt;
    return published_->routing.regionRouting.GetNextRegion(sc, ec, sr, er);
}

bool NavigationContext::AreConnected(const Node& a, const Node& b) const noexcept {
    if (!published_) return false;
    return published_->components.AreConnected(published_->graph, a, b);
}

bool NavigationContext::AreConnected(const ClusterKey& a, const ClusterKey& b) const noexcept {
    if (!published_) return false;
    const auto& g = published_->graph;
    if (!g.ContainsKey(a) || !g.ContainsKey(b)) return false;
    return published_->components.AreConnected(g.IndexOf(a), g.IndexOf(b));
}

std::vector<PortalId> NavigationContext::GetFallbackPortals(const ClusterKey& from, const ClusterKey& to) const {
    if (!published_) return {};
    const auto& g = published_->graph;
    if (!g.ContainsKey(from) || !g.ContainsKey(to)) return {};
    return published_->components.GetFallbackPortals(g, g.IndexOf(from), g.IndexOf(to));
}

bool NavigationContext::IsSizedCorrectly(std::size_t numClusters) const noexcept {
    return published_ && published_->routing.IsSizedCorrectly(numClusters);
}

void NavigationContext::Resize(std::size_t numClusters) {
    if (!published_) return;
    logsys::get()->warn("Routing tables resized to {} clusters; routes discarded until the next build", numClusters);
    published_->routing.Resize(numClusters);
}

} // namespace herd::nav
