#pragma once

#include "core/Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace StenoBridge {

/**
 * @brief Finds and parses JSON configuration files.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/ (CWD - for development)
 * 3. ~/.config/stenobridge/ (user overrides)
 * 4. /etc/stenobridge/ (system defaults)
 *
 * At each location the .local version (e.g., foo.json.local) wins over the
 * base file. The .local file is a complete replacement, not a merge.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    /**
     * @brief Like load(), but a file that does not exist anywhere yields a
     * default-constructed T. Unreadable or invalid files are still errors.
     */
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> readJson(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> parse(const std::filesystem::path& path);
};

template <typename T>
Result<T, std::string> ConfigLoader::parse(const std::filesystem::path& path)
{
    auto jsonResult = readJson(path);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    try {
        T config;
        // Unqualified call so ADL finds the config type's from_json().
        from_json(jsonResult.value(), config);
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error(
            "Failed to parse " + path.string() + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<T, std::string>::error("Config file not found: " + filename);
    }
    return parse<T>(path.value());
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<T, std::string>::okay(T{});
    }
    return parse<T>(path.value());
}

} // namespace StenoBridge
