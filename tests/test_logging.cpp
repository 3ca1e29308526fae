// tests/test_logging.cpp
#include <doctest/doctest.h>

#include "herd/logging/Log.h"
#include "herd/nav/NavError.h"
#include "herd/nav/NavigationContext.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

TEST_CASE("logsys: shared logger is registered once under its name")
{
    const auto a = herd::logsys::get();
    const auto b = herd::logsys::get();
    REQUIRE(a != nullptr);
    CHECK(a == b);
    CHECK(a->name() == "herd");
    CHECK(spdlog::get("herd") == a);
}

TEST_CASE("logsys: unknown level names keep the current level")
{
    auto log = herd::logsys::get();
    const auto before = log->level();

    herd::logsys::set_level("error");
    CHECK(log->level() == spdlog::level::err);
    herd::logsys::set_level("loud");
    CHECK(log->level() == spdlog::level::err);
    herd::logsys::set_level("off");
    CHECK(log->level() == spdlog::level::off);

    log->set_level(before);
}

TEST_CASE("logsys: navigation config level reaches the shared logger")
{
    auto log = herd::logsys::get();
    const auto before = log->level();

    herd::nav::NavConfig cfg;
    cfg.logLevel = "error";
    herd::nav::NavigationContext ctx(cfg);
    CHECK(log->level() == spdlog::level::err);

    cfg.logLevel = "critical";
    ctx.SetConfig(cfg);
    CHECK(log->level() == spdlog::level::critical);

    // Empty level: the logger is left as configured elsewhere.
    herd::nav::NavigationContext quiet{ herd::nav::NavConfig{} };
    CHECK(log->level() == spdlog::level::critical);
    quiet.SetConfig(herd::nav::NavConfig{});
    CHECK(log->level() == spdlog::level::critical);

    log->set_level(before);
}

TEST_CASE("logsys: init_file_logs adds a rotating herd.log")
{
    std::error_code ec;
    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const fs::path dir = fs::temp_directory_path(ec) / ("herd_log_tests_" + std::to_string(stamp));

    auto log = herd::logsys::get();
    const auto sinks = log->sinks().size();
    herd::logsys::init_file_logs(dir);
    CHECK(log->sinks().size() == sinks + 1);
    CHECK(fs::exists(dir / "herd.log"));

    // Leave the shared logger as the other tests expect it.
    log->sinks().pop_back();
    fs::remove_all(dir, ec);
}

TEST_CASE("NavErrc: messages come from the herd.nav category")
{
    const std::error_code ec = herd::nav::NavErrc::TooManyIslands;
    CHECK(ec.category().name() == std::string("herd.nav"));
    CHECK(ec.message() == "cluster exceeds the island capacity");
    CHECK(std::error_code(herd::nav::NavErrc::EmptyGrid).message() == "cost grid is empty");
    CHECK_FALSE(std::error_code(herd::nav::NavErrc::Ok));
}
