#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "GridTypes.h"

namespace herd::nav {

// Per-cell traversal cost over a regular 2D grid. 0..254 are walkable (extra
// cost on top of the unit step), 255 (kBlockedCost) is an obstacle.
//
// Edits never touch the navigation graph; callers rebuild explicitly.
class CostGrid {
public:
    CostGrid() = default;
    CostGrid(int32_t width, int32_t height, Fixed cellSize = Fixed::One(), FixedVec2 origin = {});

    [[nodiscard]] int32_t Width() const noexcept { return width_; }
    [[nodiscard]] int32_t Height() const noexcept { return height_; }
    [[nodiscard]] Fixed CellSize() const noexcept { return cellSize_; }
    [[nodiscard]] FixedVec2 Origin() const noexcept { return origin_; }

    [[nodiscard]] bool InBounds(int32_t x, int32_t y) const noexcept {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
    [[nodiscard]] bool InBounds(const Node& n) const noexcept { return InBounds(n.x, n.y); }

    // Row-major: y * width + x. Caller guarantees InBounds.
    [[nodiscard]] std::size_t GetIndex(int32_t x, int32_t y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
    }

    // Out-of-bounds cells read as blocked.
    [[nodiscard]] uint8_t Cost(int32_t x, int32_t y) const noexcept {
        return InBounds(x, y) ? costs_[GetIndex(x, y)] : kBlockedCost;
    }
    [[nodiscard]] uint8_t Cost(const Node& n) const noexcept { return Cost(n.x, n.y); }

    [[nodiscard]] bool IsWalkable(int32_t x, int32_t y) const noexcept { return Cost(x, y) != kBlockedCost; }
    [[nodiscard]] bool IsWalkable(const Node& n) const noexcept { return IsWalkable(n.x, n.y); }

    // Returns false (and changes nothing) when out of bounds.
    bool SetCost(int32_t x, int32_t y, uint8_t cost) noexcept;
    bool SetObstacle(int32_t x, int32_t y) noexcept { return SetCost(x, y, kBlockedCost); }
    bool ClearObstacle(int32_t x, int32_t y) noexcept { return SetCost(x, y, 0); }

    // Fills the inclusive rectangle, clipped to the grid.
    void FillRect(const CellRect& r, uint8_t cost) noexcept;
    void Fill(uint8_t cost) noexcept;

    // Destructive: all cells become free.
    void Resize(int32_t width, int32_t height);

    // nullopt for positions left of / below the origin or past the far edge.
    [[nodiscard]] std::optional<Node> WorldToGrid(const FixedVec2& world) const noexcept;
    // Centre of the cell.
    [[nodiscard]] FixedVec2 GridToWorld(const Node& n) const noexcept;

    [[nodiscard]] const std::vector<uint8_t>& Costs() const noexcept { return costs_; }

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    Fixed cellSize_ = Fixed::One();
    FixedVec2 origin_{};
    std::vector<uint8_t> costs_;
};

} // namespace herd::nav
