#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace StenoBridge {
namespace Protocol {

/**
 * Strict field accessors for decoding payload objects. Each throws
 * std::invalid_argument naming the offending field when it is missing or has
 * the wrong JSON type.
 */
namespace JsonFields {

void requireObject(const nlohmann::json& j, const std::string& what);

std::string requireString(const nlohmann::json& j, const std::string& key);

bool requireBool(const nlohmann::json& j, const std::string& key);

uint32_t requireCount(const nlohmann::json& j, const std::string& key);

std::vector<std::string> requireStringArray(const nlohmann::json& j, const std::string& key);

int64_t requireInteger(const nlohmann::json& j, const std::string& key);

std::optional<std::string> optionalString(const nlohmann::json& j, const std::string& key);

std::optional<bool> optionalBool(const nlohmann::json& j, const std::string& key);

} // namespace JsonFields

} // namespace Protocol
} // namespace StenoBridge
