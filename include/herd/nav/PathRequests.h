#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

#include <entt/entt.hpp>

#include "CostGrid.h"
#include "NavigationContext.h"
#include "Path.h"

namespace herd::nav {

struct PathRequest {
    entt::entity entity = entt::null;
    FixedVec2 start;
    FixedVec2 goal;
};

// Per-agent navigation component.
struct NavState {
    std::optional<Path> path;     // nullopt = no path
    uint64_t generation = 0;      // graph generation the path was resolved on
    bool repathRequested = false; // set when the path went stale
};

// FIFO of pending requests, drained once per tick in submission order.
class PathRequestQueue {
public:
    void Push(const PathRequest& r) { pending_.push_back(r); }
    [[nodiscard]] std::size_t Size() const noexcept { return pending_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return pending_.empty(); }
    void Clear() noexcept { pending_.clear(); }

private:
    friend std::size_t ProcessPathRequests(entt::registry&, PathRequestQueue&,
                                           const NavigationContext&, const CostGrid&);
    std::deque<PathRequest> pending_;
};

// Resolves every queued request and emplaces/replaces NavState on the entity.
// Requests for destroyed entities are discarded. While no graph is published
// the queue is left untouched so nothing is lost. Returns requests handled.
std::size_t ProcessPathRequests(entt::registry& registry, PathRequestQueue& queue,
                                const NavigationContext& ctx, const CostGrid& grid);

// Clears hierarchical paths planned on an older graph generation and flags
// them for re-request. Returns the number invalidated.
std::size_t InvalidateStalePaths(entt::registry& registry, const NavigationContext& ctx);

} // namespace herd::nav
