#include "ClientCommand.h"
#include "JsonFields.h"
#include "VariantKinds.h"
#include <stdexcept>

namespace StenoBridge {
namespace Protocol {

using namespace JsonFields;

namespace Commands {

nlohmann::json SetConfigOption::toJson() const
{
    return { { "option", option }, { "value", configValueToJson(value) } };
}

SetConfigOption SetConfigOption::fromJson(const nlohmann::json& j)
{
    requireObject(j, "SetConfigOption payload");
    if (!j.contains("value")) {
        throw std::invalid_argument("missing field 'value'");
    }
    return SetConfigOption{ .option = requireString(j, "option"),
                            .value = configValueFromJson(j.at("value")) };
}

nlohmann::json ToggleOutput::toJson() const
{
    nlohmann::json j = nlohmann::json::object();
    if (enabled.has_value()) {
        j["enabled"] = enabled.value();
    }
    return j;
}

ToggleOutput ToggleOutput::fromJson(const nlohmann::json& j)
{
    // A missing payload is accepted as an empty object.
    if (j.is_null()) {
        return ToggleOutput{};
    }
    requireObject(j, "ToggleOutput payload");
    return ToggleOutput{ .enabled = optionalBool(j, "enabled") };
}

nlohmann::json SendText::toJson() const
{
    return { { "text", text } };
}

SendText SendText::fromJson(const nlohmann::json& j)
{
    requireObject(j, "SendText payload");
    return SendText{ .text = requireString(j, "text") };
}

nlohmann::json SendBackspaces::toJson() const
{
    return { { "count", count } };
}

SendBackspaces SendBackspaces::fromJson(const nlohmann::json& j)
{
    requireObject(j, "SendBackspaces payload");
    return SendBackspaces{ .count = requireCount(j, "count") };
}

nlohmann::json SendKeyCombination::toJson() const
{
    return { { "combination", combination } };
}

SendKeyCombination SendKeyCombination::fromJson(const nlohmann::json& j)
{
    requireObject(j, "SendKeyCombination payload");
    return SendKeyCombination{ .combination = requireString(j, "combination") };
}

nlohmann::json Lookup::toJson() const
{
    return { { "text", text } };
}

Lookup Lookup::fromJson(const nlohmann::json& j)
{
    requireObject(j, "Lookup payload");
    return Lookup{ .text = requireString(j, "text") };
}

nlohmann::json Subscribe::toJson() const
{
    return { { "kinds", kinds } };
}

Subscribe Subscribe::fromJson(const nlohmann::json& j)
{
    requireObject(j, "Subscribe payload");
    return Subscribe{ .kinds = requireStringArray(j, "kinds") };
}

} // namespace Commands

std::string_view ClientCommand::kind() const
{
    return commandKindOf(data);
}

std::string_view commandKindOf(const ClientCommand::Data& data)
{
    return kindOf(data);
}

const std::vector<std::string>& commandKindNames()
{
    static const std::vector<std::string> names = kindNames<ClientCommand::Data>();
    return names;
}

nlohmann::json commandPayloadToJson(const ClientCommand::Data& data)
{
    return payloadOf(data);
}

ClientCommand::Data commandPayloadFromJson(std::string_view kind, const nlohmann::json& payload)
{
    return fromKind<ClientCommand::Data>(kind, payload);
}

} // namespace Protocol
} // namespace StenoBridge
