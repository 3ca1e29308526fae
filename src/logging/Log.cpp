#include "herd/logging/Log.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <system_error>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

static std::shared_ptr<spdlog::logger> make_default_logger() {
    if (auto existing = spdlog::get("herd"))
        return existing;
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("herd", sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::register_logger(logger);
    return logger;
}

void herd::logsys::init_file_logs(const fs::path& dir) {
    std::error_code ec; fs::create_directories(dir, ec);
    if (ec) {
        get()->warn("Log directory {} unavailable ({}); keeping stderr", dir.string(), ec.message());
        return;
    }
    auto file = (dir / "herd.log").string();
    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4); // 1MB * 4
        get()->sinks().push_back(sink);
    } catch (const spdlog::spdlog_ex& e) {
        get()->warn("Cannot open {}: {}", file, e.what());
        return;
    }
    get()->info("Logging started ({})", file);
}

std::shared_ptr<spdlog::logger> herd::logsys::get() {
    if (!g_logger) g_logger = make_default_logger();
    return g_logger;
}

void herd::logsys::set_level(std::string_view level) {
    const auto lvl = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off"; only honour that when asked for explicitly.
    if (lvl == spdlog::level::off && level != "off") {
        get()->warn("Unknown log level '{}'", std::string(level));
        return;
    }
    get()->set_level(lvl);
}
