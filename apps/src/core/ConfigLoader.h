#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace LanderSim {

/**
 * @brief Loads configuration files with multi-path search and .local override support.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (setConfigDir), else $LANDERSIM_CONFIG_DIR if set
 * 2. ./config/ (CWD - for development)
 * 3. ~/.config/landersim/ (user overrides)
 * 4. /etc/landersim/ (system defaults)
 *
 * At each location, checks for .local version first (e.g., training.json.local),
 * then falls back to base file (e.g., training.json). The .local file is a complete
 * replacement, not a merge.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    template <typename T>
    static Result<T, std::string> loadFromPath(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> parse(
        const Result<nlohmann::json, std::string>& jsonResult, const std::string& label);
};

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    return parse<T>(loadJson(filename), filename);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadFromPath(const std::filesystem::path& path)
{
    return parse<T>(tryLoadJson(path), path.string());
}

template <typename T>
Result<T, std::string> ConfigLoader::parse(
    const Result<nlohmann::json, std::string>& jsonResult, const std::string& label)
{
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    try {
        T config;
        // Use unqualified call to enable ADL (argument-dependent lookup).
        from_json(jsonResult.value(), config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + label + ": " + e.what());
    }
}

} // namespace LanderSim
