#pragma once

#include "core/Result.h"
#include <cstddef>
#include <filesystem>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace StenoBridge {
namespace Host {

/**
 * @brief A stroke-to-translation dictionary in the common JSON layout:
 * {"STROKE/STROKE": "translation", ...}.
 */
class StenoDictionary {
public:
    static Result<StenoDictionary, std::string> loadFile(const std::filesystem::path& path);
    static Result<StenoDictionary, std::string> fromJson(const nlohmann::json& j);

    void addEntry(const std::string& steno, const std::string& translation);

    std::optional<std::string> lookup(const std::string& steno) const;
    std::vector<std::vector<std::string>> reverseLookup(const std::string& translation) const;

    size_t longestKey() const { return longestKey_; }
    size_t size() const { return forward_.size(); }

    const std::filesystem::path& path() const { return path_; }

    static std::vector<std::string> splitStrokes(const std::string& steno);
    static std::string joinStrokes(const std::vector<std::string>& strokes);

private:
    std::filesystem::path path_;
    std::map<std::string, std::string> forward_;
    std::map<std::string, std::vector<std::vector<std::string>>> reverse_;
    size_t longestKey_ = 0;
};

} // namespace Host
} // namespace StenoBridge
