#pragma once
// include/herd/math/Fixed.h
//
// Deterministic fixed-point scalar and 2D vector used for every world-space
// quantity in the navigation code. Raw storage is a signed 64-bit integer with
// 16 fractional bits; products and quotients go through the same integer math
// on every platform so results are bit-identical.
//
// Range: multiplication of two values is exact while |a * b| stays below 2^47
// (world units), which comfortably covers map coordinates and path costs.

#include <cstdint>
#include <compare>

namespace herd::math {

class Fixed {
public:
    static constexpr int kFracBits = 16;
    static constexpr int64_t kOne = int64_t{1} << kFracBits;

    constexpr Fixed() noexcept = default;

    [[nodiscard]] static constexpr Fixed FromRaw(int64_t raw) noexcept { Fixed f; f.raw_ = raw; return f; }
    [[nodiscard]] static constexpr Fixed FromInt(int64_t v) noexcept { return FromRaw(v * kOne); }
    // Exact for numerator/denominator pairs whose quotient fits; rounds toward zero.
    [[nodiscard]] static constexpr Fixed FromFraction(int64_t num, int64_t den) noexcept {
        return FromRaw((num * kOne) / den);
    }

    [[nodiscard]] static constexpr Fixed Zero() noexcept { return FromRaw(0); }
    [[nodiscard]] static constexpr Fixed One() noexcept { return FromRaw(kOne); }
    [[nodiscard]] static constexpr Fixed Max() noexcept { return FromRaw(INT64_MAX); }

    [[nodiscard]] constexpr int64_t Raw() const noexcept { return raw_; }

    // Floor toward negative infinity (C++20 defines >> on negatives as arithmetic).
    [[nodiscard]] constexpr int64_t ToIntFloor() const noexcept { return raw_ >> kFracBits; }
    [[nodiscard]] constexpr int64_t ToIntRound() const noexcept { return (raw_ + kOne / 2) >> kFracBits; }

    // Debug output only; never feed back into simulation.
    [[nodiscard]] double ToDouble() const noexcept { return static_cast<double>(raw_) / static_cast<double>(kOne); }

    constexpr Fixed operator-() const noexcept { return FromRaw(-raw_); }
    constexpr Fixed operator+(Fixed o) const noexcept { return FromRaw(raw_ + o.raw_); }
    constexpr Fixed operator-(Fixed o) const noexcept { return FromRaw(raw_ - o.raw_); }
    constexpr Fixed operator*(Fixed o) const noexcept { return FromRaw((raw_ * o.raw_) >> kFracBits); }
    constexpr Fixed operator/(Fixed o) const noexcept { return FromRaw((raw_ * kOne) / o.raw_); }
    constexpr Fixed operator*(int64_t s) const noexcept { return FromRaw(raw_ * s); }
    constexpr Fixed operator/(int64_t s) const noexcept { return FromRaw(raw_ / s); }

    constexpr Fixed& operator+=(Fixed o) noexcept { raw_ += o.raw_; return *this; }
    constexpr Fixed& operator-=(Fixed o) noexcept { raw_ -= o.raw_; return *this; }

    constexpr auto operator<=>(const Fixed&) const noexcept = default;
    constexpr bool operator==(const Fixed&) const noexcept = default;

private:
    int64_t raw_ = 0;
};

struct FixedVec2 {
    Fixed x;
    Fixed y;

    constexpr FixedVec2() noexcept = default;
    constexpr FixedVec2(Fixed x_, Fixed y_) noexcept : x(x_), y(y_) {}

    [[nodiscard]] static constexpr FixedVec2 FromInts(int64_t x, int64_t y) noexcept {
        return { Fixed::FromInt(x), Fixed::FromInt(y) };
    }

    constexpr FixedVec2 operator+(const FixedVec2& o) const noexcept { return { x + o.x, y + o.y }; }
    constexpr FixedVec2 operator-(const FixedVec2& o) const noexcept { return { x - o.x, y - o.y }; }
    constexpr FixedVec2 operator*(Fixed s) const noexcept { return { x * s, y * s }; }

    [[nodiscard]] constexpr Fixed LengthSquared() const noexcept { return x * x + y * y; }
    [[nodiscard]] constexpr Fixed DistanceSquared(const FixedVec2& o) const noexcept { return (*this - o).LengthSquared(); }

    constexpr bool operator==(const FixedVec2&) const noexcept = default;
};

} // namespace herd::math
