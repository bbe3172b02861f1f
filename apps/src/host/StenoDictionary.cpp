#include "StenoDictionary.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

namespace StenoBridge {
namespace Host {

Result<StenoDictionary, std::string> StenoDictionary::loadFile(const std::filesystem::path& path)
{
    using R = Result<StenoDictionary, std::string>;

    std::ifstream file(path);
    if (!file.is_open()) {
        return R::error("Cannot open dictionary: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    }
    catch (const nlohmann::json::parse_error& e) {
        return R::error("Dictionary " + path.string() + " is not valid JSON: " + e.what());
    }

    auto dictionary = fromJson(j);
    if (dictionary.isError()) {
        return R::error(path.string() + ": " + dictionary.errorValue());
    }
    dictionary.value().path_ = path;
    LOG_INFO(Host, "Loaded {} entries from {}", dictionary.value().size(), path.string());
    return dictionary;
}

Result<StenoDictionary, std::string> StenoDictionary::fromJson(const nlohmann::json& j)
{
    using R = Result<StenoDictionary, std::string>;

    if (!j.is_object()) {
        return R::error("dictionary must be a JSON object");
    }

    StenoDictionary dictionary;
    for (const auto& [steno, translation] : j.items()) {
        if (!translation.is_string()) {
            return R::error("translation for '" + steno + "' is not a string");
        }
        if (steno.empty()) {
            continue;
        }
        dictionary.addEntry(steno, translation.get<std::string>());
    }
    return R::okay(std::move(dictionary));
}

void StenoDictionary::addEntry(const std::string& steno, const std::string& translation)
{
    auto strokes = splitStrokes(steno);
    const std::string key = joinStrokes(strokes);

    if (auto existing = forward_.find(key); existing != forward_.end()) {
        auto& sequences = reverse_[existing->second];
        sequences.erase(std::remove(sequences.begin(), sequences.end(), strokes), sequences.end());
        if (sequences.empty()) {
            reverse_.erase(existing->second);
        }
    }

    longestKey_ = std::max(longestKey_, strokes.size());
    forward_[key] = translation;
    reverse_[translation].push_back(std::move(strokes));
}

std::optional<std::string> StenoDictionary::lookup(const std::string& steno) const
{
    auto it = forward_.find(joinStrokes(splitStrokes(steno)));
    if (it == forward_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::vector<std::string>> StenoDictionary::reverseLookup(
    const std::string& translation) const
{
    auto it = reverse_.find(translation);
    return it == reverse_.end() ? std::vector<std::vector<std::string>>{} : it->second;
}

std::vector<std::string> StenoDictionary::splitStrokes(const std::string& steno)
{
    std::vector<std::string> strokes;
    size_t start = 0;
    while (start <= steno.size()) {
        const auto slash = steno.find('/', start);
        const auto end = slash == std::string::npos ? steno.size() : slash;
        if (end > start) {
            strokes.push_back(steno.substr(start, end - start));
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return strokes;
}

std::string StenoDictionary::joinStrokes(const std::vector<std::string>& strokes)
{
    std::string joined;
    for (size_t i = 0; i < strokes.size(); ++i) {
        if (i > 0) {
            joined += '/';
        }
        joined += strokes[i];
    }
    return joined;
}

} // namespace Host
} // namespace StenoBridge
