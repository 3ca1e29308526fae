#include "herd/nav/PathRequests.h"

#include "herd/logging/Log.h"
#include "herd/nav/PathResolver.h"
#include "herd/prof/Zone.h"

#include <utility>
#include <variant>

namespace herd::nav {

std::size_t ProcessPathRequests(entt::registry& registry, PathRequestQueue& queue,
                                const NavigationContext& ctx, const CostGrid& grid)
{
    HERD_TRACY_ZONE("ProcessPathRequests");
    if (!ctx.Initialized() || queue.pending_.empty())
        return 0;

    std::size_t handled = 0;
    while (!queue.pending_.empty()) {
        const PathRequest req = queue.pending_.front();
        queue.pending_.pop_front();

        if (!registry.valid(req.entity)) {
            logsys::get()->debug("Path request for destroyed entity {} dropped",
                                 static_cast<uint32_t>(entt::to_integral(req.entity)));
            continue;
        }

        NavState state;
        state.path = ResolvePath(ctx, grid, req.start, req.goal);
        state.generation = ctx.Generation();
        registry.emplace_or_replace<NavState>(req.entity, std::move(state));
        ++handled;
    }
    return handled;
}

std::size_t InvalidateStalePaths(entt::registry& registry, const NavigationContext& ctx)
{
    std::size_t count = 0;
    const auto view = registry.view<NavState>();
    for (const entt::entity e : view) {
        auto& nav = registry.get<NavState>(e);
        if (!nav.path || !std::holds_alternative<HierarchicalPath>(*nav.path)) continue;
        if (ctx.Initialized() && nav.generation == ctx.Generation()) continue;
        nav.path.reset();
        nav.repathRequested = true;
        ++count;
    }
    if (count > 0)
        logsys::get()->debug("{} hierarchical paths invalidated (generation {})", count, ctx.Generation());
    return count;
}

} // namespace herd::nav
