#include "herd/nav/CostGrid.h"

#include <algorithm>

namespace herd::nav {

CostGrid::CostGrid(int32_t width, int32_t height, Fixed cellSize, FixedVec2 origin)
    : cellSize_(cellSize), origin_(origin)
{
    if (cellSize_ <= Fixed::Zero())
        cellSize_ = Fixed::One();
    Resize(width, height);
}

bool CostGrid::SetCost(int32_t x, int32_t y, uint8_t cost) noexcept {
    if (!InBounds(x, y)) return false;
    costs_[GetIndex(x, y)] = cost;
    return true;
}

void CostGrid::FillRect(const CellRect& r, uint8_t cost) noexcept {
    const int32_t x0 = std::max(r.minX, 0), x1 = std::min(r.maxX, width_ - 1);
    const int32_t y0 = std::max(r.minY, 0), y1 = std::min(r.maxY, height_ - 1);
    for (int32_t y = y0; y <= y1; ++y)
        for (int32_t x = x0; x <= x1; ++x)
            costs_[GetIndex(x, y)] = cost;
}

void CostGrid::Fill(uint8_t cost) noexcept {
    std::fill(costs_.begin(), costs_.end(), cost);
}

void CostGrid::Resize(int32_t width, int32_t height) {
    width_ = std::max(width, 0);
    height_ = std::max(height, 0);
    costs_.assign(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), 0);
}

std::optional<Node> CostGrid::WorldToGrid(const FixedVec2& world) const noexcept {
    const FixedVec2 local = world - origin_;
    if (local.x < Fixed::Zero() || local.y < Fixed::Zero())
        return std::nullopt;

    const int64_t gx = (local.x / cellSize_).ToIntFloor();
    const int64_t gy = (local.y / cellSize_).ToIntFloor();
    if (gx >= width_ || gy >= height_)
        return std::nullopt;

    return Node{ static_cast<int32_t>(gx), static_cast<int32_t>(gy) };
}

FixedVec2 CostGrid::GridToWorld(const Node& n) const noexcept {
    const Fixed half = cellSize_ / 2;
    return {
        origin_.x + cellSize_ * n.x + half,
        origin_.y + cellSize_ * n.y + half,
    };
}

} // namespace herd::nav
