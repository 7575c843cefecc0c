#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace LanderSim {

namespace {

using JsonResult = Result<nlohmann::json, std::string>;

constexpr const char* kConfigDirEnv = "LANDERSIM_CONFIG_DIR";

bool isRegularFile(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(*explicitConfigDir_);
    }
    else if (const char* envDir = std::getenv(kConfigDirEnv); envDir && *envDir) {
        paths.emplace_back(envDir);
    }

    paths.push_back(fs::current_path() / "config");

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "landersim");
    }

    paths.emplace_back("/etc/landersim");
    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    for (const auto& dir : getSearchPaths()) {
        // A .local file replaces the base file in the same directory.
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            if (isRegularFile(candidate)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::tryLoadJson(const std::filesystem::path& path)
{
    const std::string name = path.string();

    if (!isRegularFile(path)) {
        return JsonResult::error("Config file not found: " + name);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        SLOG_WARN("ConfigLoader: cannot open {}", name);
        return JsonResult::error("Cannot open config file: " + name);
    }

    // Parse without exceptions so an empty file and a syntax error report the same way.
    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        SLOG_ERROR("ConfigLoader: {} is empty or not valid JSON", name);
        return JsonResult::error("Invalid JSON in config file: " + name);
    }
    if (!j.is_object()) {
        return JsonResult::error("Config file must contain a JSON object: " + name);
    }

    return JsonResult::okay(std::move(j));
}

Result<nlohmann::json, std::string> ConfigLoader::loadJson(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        SLOG_DEBUG("ConfigLoader: {} not found in any search path", filename);
        return JsonResult::error("Config file not found: " + filename);
    }

    SLOG_INFO("ConfigLoader: loading {}", path->string());
    return tryLoadJson(*path);
}

} // namespace LanderSim
