#pragma once
#include <filesystem>
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace herd::logsys {
    void init_file_logs(const std::filesystem::path& dir); // rotates herd.log in dir
    std::shared_ptr<spdlog::logger> get();                  // "herd", stderr until init_file_logs
    void set_level(std::string_view level);                 // "trace".."off"; unknown names keep the level
}
