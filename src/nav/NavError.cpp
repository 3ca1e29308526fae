#include "herd/nav/NavError.h"

#include <string>

namespace herd::nav {

namespace {

class NavCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "herd.nav"; }

    std::string message(int ev) const override {
        switch (static_cast<NavErrc>(ev)) {
        case NavErrc::Ok:                 return "ok";
        case NavErrc::EmptyGrid:          return "cost grid is empty";
        case NavErrc::InvalidClusterSize: return "cluster size must be at least 1";
        case NavErrc::TooManyRegions:     return "cluster exceeds the region capacity";
        case NavErrc::TooManyIslands:     return "cluster exceeds the island capacity";
        }
        return "unknown navigation error";
    }
};

} // namespace

const std::error_category& nav_category() noexcept {
    static const NavCategory cat;
    return cat;
}

} // namespace herd::nav
