#include "herd/nav/LocalSearch.h"

#include <algorithm>
#include <cstdlib>
#include <queue>

namespace herd::nav {

namespace {

constexpr int kDirs4[4][2] = { {1,0}, {-1,0}, {0,1}, {0,-1} };

struct OpenRec {
    uint32_t f = 0;
    uint32_t idx = 0;
};

// Min-heap on (f, idx).
struct OpenSort {
    bool operator()(const OpenRec& a, const OpenRec& b) const noexcept {
        return a.f != b.f ? a.f > b.f : a.idx > b.idx;
    }
};

inline uint32_t Manhattan(const Node& a, const Node& b) noexcept {
    return static_cast<uint32_t>(std::abs(a.x - b.x) + std::abs(a.y - b.y));
}

inline Node FromLocal(const CellRect& r, uint32_t idx) noexcept {
    const auto w = static_cast<uint32_t>(r.Width());
    return { r.minX + static_cast<int32_t>(idx % w), r.minY + static_cast<int32_t>(idx / w) };
}

} // namespace

std::optional<LocalPath> FindPathLocal(const CostGrid& grid, const Node& start, const Node& goal,
                                       const LocalSearchOptions& opt)
{
    CellRect box = opt.bounds;
    box.minX = std::max(box.minX, 0);
    box.minY = std::max(box.minY, 0);
    box.maxX = std::min(box.maxX, grid.Width() - 1);
    box.maxY = std::min(box.maxY, grid.Height() - 1);

    if (box.Empty() || !box.Contains(start) || !box.Contains(goal)) return std::nullopt;
    if (!grid.IsWalkable(start) || !grid.IsWalkable(goal)) return std::nullopt;

    if (start == goal)
        return LocalPath{ { start }, 0 };

    const std::size_t area = box.Area();
    constexpr uint32_t kInf = std::numeric_limits<uint32_t>::max();
    std::vector<uint32_t> g(area, kInf);
    std::vector<int32_t> parent(area, -1);
    std::vector<uint8_t> closed(area, 0);

    std::priority_queue<OpenRec, std::vector<OpenRec>, OpenSort> open;
    const auto startIdx = static_cast<uint32_t>(box.LocalIndex(start));
    const auto goalIdx = static_cast<uint32_t>(box.LocalIndex(goal));
    g[startIdx] = 0;
    open.push({ Manhattan(start, goal), startIdx });

    int32_t iterations = 0;
    while (!open.empty()) {
        const OpenRec cur = open.top(); open.pop();
        if (closed[cur.idx]) continue; // stale entry
        closed[cur.idx] = 1;

        if (cur.idx == goalIdx) {
            LocalPath out;
            out.cost = g[goalIdx];
            for (int32_t i = static_cast<int32_t>(goalIdx); i != -1; i = parent[static_cast<std::size_t>(i)])
                out.cells.push_back(FromLocal(box, static_cast<uint32_t>(i)));
            std::reverse(out.cells.begin(), out.cells.end());
            return out;
        }

        if (++iterations > opt.maxIterations) return std::nullopt;

        const Node c = FromLocal(box, cur.idx);
        for (const auto& d : kDirs4) {
            const Node n{ c.x + d[0], c.y + d[1] };
            if (!box.Contains(n) || !grid.IsWalkable(n)) continue;
            const auto nIdx = static_cast<uint32_t>(box.LocalIndex(n));
            if (closed[nIdx]) continue;
            const uint32_t tentative = g[cur.idx] + StepCost(grid, n);
            if (tentative < g[nIdx]) {
                g[nIdx] = tentative;
                parent[nIdx] = static_cast<int32_t>(cur.idx);
                open.push({ tentative + Manhattan(n, goal), nIdx });
            }
        }
    }
    return std::nullopt;
}

bool HasLineOfSight(const CostGrid& grid, const Node& a, const Node& b) noexcept
{
    if (!grid.IsWalkable(a) || !grid.IsWalkable(b)) return false;

    int32_t x = a.x, y = a.y;
    const int32_t dx = std::abs(b.x - a.x), dy = -std::abs(b.y - a.y);
    const int32_t sx = a.x < b.x ? 1 : -1, sy = a.y < b.y ? 1 : -1;
    int32_t err = dx + dy;

    while (x != b.x || y != b.y) {
        const int32_t e2 = 2 * err;
        bool stepX = false, stepY = false;
        if (e2 >= dy) { err += dy; stepX = true; }
        if (e2 <= dx) { err += dx; stepY = true; }

        if (stepX && stepY) {
            // No squeezing between two corners.
            if (!grid.IsWalkable(x + sx, y) || !grid.IsWalkable(x, y + sy)) return false;
        }
        if (stepX) x += sx;
        if (stepY) y += sy;
        if (!grid.IsWalkable(x, y)) return false;
    }
    return true;
}

std::optional<Node> FindNearestWalkable(const CostGrid& grid, const Node& target, int32_t maxRadius)
{
    if (!grid.InBounds(target)) return std::nullopt;
    if (grid.IsWalkable(target)) return target;
    if (maxRadius <= 0) return std::nullopt;

    const CellRect window{ target.x - maxRadius, target.y - maxRadius, target.x + maxRadius, target.y + maxRadius };
    std::vector<uint8_t> seen(window.Area(), 0);
    std::queue<Node> frontier;
    frontier.push(target);
    seen[window.LocalIndex(target)] = 1;

    while (!frontier.empty()) {
        const Node c = frontier.front(); frontier.pop();
        for (int32_t dy = -1; dy <= 1; ++dy) {
            for (int32_t dx = -1; dx <= 1; ++dx) {
                if (dx == 0 && dy == 0) continue;
                const Node n{ c.x + dx, c.y + dy };
                if (!window.Contains(n) || !grid.InBounds(n)) continue;
                auto& s = seen[window.LocalIndex(n)];
                if (s) continue;
                s = 1;
                if (grid.IsWalkable(n)) return n;
                frontier.push(n);
            }
        }
    }
    return std::nullopt;
}

std::optional<Node> IntegrationField::NextStep(const Node& from) const noexcept
{
    const uint32_t here = At(from);
    if (here == 0 || here == kUnreachable) return std::nullopt;

    std::optional<Node> best;
    uint32_t bestCost = here;
    for (const auto& d : kDirs4) {
        const Node n{ from.x + d[0], from.y + d[1] };
        const uint32_t c = At(n);
        if (c < bestCost) {
            bestCost = c;
            best = n;
        }
    }
    return best;
}

IntegrationField BuildIntegrationField(const CostGrid& grid, const CellRect& bounds,
                                       const Node& runMin, const Node& runMax)
{
    IntegrationField field;
    field.bounds = bounds;
    field.cost.assign(bounds.Area(), IntegrationField::kUnreachable);

    std::priority_queue<OpenRec, std::vector<OpenRec>, OpenSort> open;
    for (int32_t y = runMin.y; y <= runMax.y; ++y) {
        for (int32_t x = runMin.x; x <= runMax.x; ++x) {
            const Node n{ x, y };
            if (!bounds.Contains(n) || !grid.IsWalkable(n)) continue;
            const auto idx = static_cast<uint32_t>(bounds.LocalIndex(n));
            field.cost[idx] = 0;
            open.push({ 0, idx });
        }
    }

    while (!open.empty()) {
        const OpenRec cur = open.top(); open.pop();
        if (cur.f != field.cost[cur.idx]) continue; // stale entry

        const Node c = FromLocal(bounds, cur.idx);
        for (const auto& d : kDirs4) {
            const Node n{ c.x + d[0], c.y + d[1] };
            if (!bounds.Contains(n) || !grid.IsWalkable(n)) continue;
            const auto nIdx = static_cast<uint32_t>(bounds.LocalIndex(n));
            const uint32_t next = cur.f + StepCost(grid, n);
            if (next < field.cost[nIdx]) {
                field.cost[nIdx] = next;
                open.push({ next, nIdx });
            }
        }
    }
    return field;
}

} // namespace herd::nav
