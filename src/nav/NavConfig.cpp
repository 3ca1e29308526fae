#include "herd/nav/NavConfig.h"

#include "herd/logging/Log.h"

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace herd::nav {

namespace {
    constexpr int kConfigVersion = 1;

    constexpr int32_t kMinClusterSize = 4;
    constexpr int32_t kMaxClusterSize = 128;

    bool ReadFileToString(const std::filesystem::path& p, std::string& out) noexcept
    {
        out.clear();
        std::ifstream f(p, std::ios::binary);
        if (!f) return false;
        f.seekg(0, std::ios::end);
        const std::streamoff sz = f.tellg();
        if (sz <= 0) return false;
        f.seekg(0, std::ios::beg);
        out.resize(static_cast<std::size_t>(sz));
        f.read(out.data(), static_cast<std::streamsize>(sz));
        return true;
    }

    int32_t ClampInt(const nlohmann::json& v, int32_t lo, int32_t hi, const char* key)
    {
        const int64_t raw = v.get<int64_t>();
        const int64_t clamped = std::clamp<int64_t>(raw, lo, hi);
        if (clamped != raw)
            logsys::get()->warn("navigation.json: '{}'={} clamped to {}", key, raw, clamped);
        return static_cast<int32_t>(clamped);
    }
}

bool LoadNavConfig(NavConfig& out, const std::filesystem::path& file) noexcept
{
    std::string text;
    if (!ReadFileToString(file, text))
        return false;

    const nlohmann::json j = nlohmann::json::parse(text, nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object()) {
        logsys::get()->warn("navigation.json: {} is not a JSON object, using defaults", file.string());
        return false;
    }

    NavConfig tmp = out;

    if (const auto it = j.find("version"); it != j.end() && it->is_number_integer()
        && it->get<int>() > kConfigVersion)
        logsys::get()->warn("navigation.json: version {} is newer than {}", it->get<int>(), kConfigVersion);

    if (const auto it = j.find("graph"); it != j.end() && it->is_object())
    {
        if (auto v = it->find("clusterSize"); v != it->end() && v->is_number_integer())
            tmp.clusterSize = ClampInt(*v, kMinClusterSize, kMaxClusterSize, "clusterSize");
        if (auto v = it->find("buildBatchSize"); v != it->end() && v->is_number_integer())
            tmp.buildBatchSize = ClampInt(*v, 1, 4096, "buildBatchSize");
    }

    if (const auto it = j.find("search"); it != j.end() && it->is_object())
    {
        if (auto v = it->find("localSearchMaxIterations"); v != it->end() && v->is_number_integer())
            tmp.localSearchMaxIterations = ClampInt(*v, 64, 1 << 22, "localSearchMaxIterations");
        if (auto v = it->find("nearestWalkableRadius"); v != it->end() && v->is_number_integer())
            tmp.nearestWalkableRadius = ClampInt(*v, 0, 1024, "nearestWalkableRadius");
        if (auto v = it->find("nearDistanceClusters"); v != it->end() && v->is_number_integer())
            tmp.nearDistanceClusters = ClampInt(*v, 0, 16, "nearDistanceClusters");
        if (auto v = it->find("fallbackPortalCount"); v != it->end() && v->is_number_integer())
            tmp.fallbackPortalCount = static_cast<std::size_t>(ClampInt(*v, 1, 16, "fallbackPortalCount"));
    }

    if (const auto it = j.find("logging"); it != j.end() && it->is_object())
    {
        if (auto v = it->find("level"); v != it->end() && v->is_string())
            tmp.logLevel = v->get<std::string>();
    }

    out = tmp;
    return true;
}

bool SaveNavConfig(const NavConfig& cfg, const std::filesystem::path& file) noexcept
{
    std::error_code ec;
    if (file.has_parent_path())
        std::filesystem::create_directories(file.parent_path(), ec);

    nlohmann::json j;
    j["version"] = kConfigVersion;
    j["graph"] = {
        {"clusterSize", cfg.clusterSize},
        {"buildBatchSize", cfg.buildBatchSize},
    };
    j["search"] = {
        {"localSearchMaxIterations", cfg.localSearchMaxIterations},
        {"nearestWalkableRadius", cfg.nearestWalkableRadius},
        {"nearDistanceClusters", cfg.nearDistanceClusters},
        {"fallbackPortalCount", cfg.fallbackPortalCount},
    };
    if (!cfg.logLevel.empty())
        j["logging"] = { {"level", cfg.logLevel} };

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f) {
        logsys::get()->warn("navigation.json: cannot write {}", file.string());
        return false;
    }
    f << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    return static_cast<bool>(f);
}

} // namespace herd::nav
