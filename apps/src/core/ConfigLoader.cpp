#include "ConfigLoader.h"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace StenoBridge {

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

    // 1. Directory given with --config-dir.
    if (explicitConfigDir_.has_value()) {
        paths.push_back(fs::path(explicitConfigDir_.value()));
    }

    // 2. ./config/ next to where the bridge was started.
    std::error_code ec;
    const auto cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / "config");
    }

    // 3. Per-user overrides.
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "stenobridge");
    }

    // 4. System-wide defaults.
    paths.push_back(fs::path("/etc/stenobridge"));

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    for (const auto& dir : getSearchPaths()) {
        std::error_code ec;

        // A .local file shadows the shared one in the same directory.
        fs::path localPath = dir / (filename + ".local");
        if (fs::is_regular_file(localPath, ec)) {
            return localPath;
        }

        fs::path basePath = dir / filename;
        if (fs::is_regular_file(basePath, ec)) {
            return basePath;
        }
    }

    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readJson(const std::filesystem::path& path)
{
    namespace fs = std::filesystem;

    spdlog::info("ConfigLoader: Loading config from {}", path.string());

    try {
        // nlohmann rejects an empty stream with a less useful message.
        if (fs::file_size(path) == 0) {
            std::string error = "Empty config file: " + path.string();
            spdlog::warn("ConfigLoader: {}", error);
            return Result<nlohmann::json, std::string>::error(error);
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            std::string error = "Cannot open config file: " + path.string();
            spdlog::warn("ConfigLoader: {}", error);
            return Result<nlohmann::json, std::string>::error(error);
        }

        return Result<nlohmann::json, std::string>::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        std::string error = "Parse error in " + path.string() + ": " + e.what();
        spdlog::error("ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
    catch (const std::exception& e) {
        std::string error = "Error reading " + path.string() + ": " + e.what();
        spdlog::error("ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
}

} // namespace StenoBridge
