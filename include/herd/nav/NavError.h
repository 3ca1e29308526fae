#pragma once
#include <system_error>
#include <type_traits>

namespace herd::nav {

// Reasons a navigation build can fail. Reported through std::error_code so
// callers can log ec.message() without knowing the enum.
enum class NavErrc {
    Ok = 0,
    EmptyGrid,           // width or height is zero
    InvalidClusterSize,  // cluster size < 1
    TooManyRegions,      // a cluster has more than kMaxRegions walkable regions
    TooManyIslands,      // a cluster has more than kMaxIslands islands
};

const std::error_category& nav_category() noexcept;

inline std::error_code make_error_code(NavErrc e) noexcept {
    return { static_cast<int>(e), nav_category() };
}

} // namespace herd::nav

template <>
struct std::is_error_code_enum<herd::nav::NavErrc> : std::true_type {};
