#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace StenoBridge {
namespace Protocol {

/**
 * @brief Typed value of an engine configuration option.
 */
using ConfigValue = std::variant<bool, int64_t, std::string>;

enum class ConfigOptionType { Bool, Integer, String };

struct ConfigOptionSpec {
    std::string_view name;
    ConfigOptionType type;
};

const char* toString(ConfigOptionType type);

ConfigOptionType typeOf(const ConfigValue& value);

/**
 * @brief The fixed set of options a client may change.
 */
const std::vector<ConfigOptionSpec>& knownConfigOptions();

std::optional<ConfigOptionType> findConfigOption(std::string_view name);

nlohmann::json configValueToJson(const ConfigValue& value);

// Throws std::invalid_argument for JSON that is not a bool, integer or string.
ConfigValue configValueFromJson(const nlohmann::json& j);

std::string describe(const ConfigValue& value);

} // namespace Protocol
} // namespace StenoBridge
