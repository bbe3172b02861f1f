#include "ConfigOptions.h"
#include <stdexcept>

namespace StenoBridge {
namespace Protocol {

const char* toString(ConfigOptionType type)
{
    switch (type) {
        case ConfigOptionType::Bool:
            return "bool";
        case ConfigOptionType::Integer:
            return "integer";
        case ConfigOptionType::String:
            return "string";
    }
    return "unknown";
}

ConfigOptionType typeOf(const ConfigValue& value)
{
    if (std::holds_alternative<bool>(value)) {
        return ConfigOptionType::Bool;
    }
    if (std::holds_alternative<int64_t>(value)) {
        return ConfigOptionType::Integer;
    }
    return ConfigOptionType::String;
}

const std::vector<ConfigOptionSpec>& knownConfigOptions()
{
    static const std::vector<ConfigOptionSpec> options = {
        { "enable_stroke_logging", ConfigOptionType::Bool },
        { "enable_translation_logging", ConfigOptionType::Bool },
        { "machine_type", ConfigOptionType::String },
        { "output_enabled", ConfigOptionType::Bool },
        { "space_placement", ConfigOptionType::String },
        { "start_attached", ConfigOptionType::Bool },
        { "start_capitalized", ConfigOptionType::Bool },
        { "system_name", ConfigOptionType::String },
        { "undo_levels", ConfigOptionType::Integer },
    };
    return options;
}

std::optional<ConfigOptionType> findConfigOption(std::string_view name)
{
    for (const auto& known : knownConfigOptions()) {
        if (known.name == name) {
            return known.type;
        }
    }
    return std::nullopt;
}

nlohmann::json configValueToJson(const ConfigValue& value)
{
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

ConfigValue configValueFromJson(const nlohmann::json& j)
{
    if (j.is_boolean()) {
        return j.get<bool>();
    }
    if (j.is_number_integer()) {
        return j.get<int64_t>();
    }
    if (j.is_string()) {
        return j.get<std::string>();
    }
    throw std::invalid_argument(
        std::string("config value must be bool, integer or string, got ") + j.type_name());
}

std::string describe(const ConfigValue& value)
{
    return configValueToJson(value).dump();
}

} // namespace Protocol
} // namespace StenoBridge
