#include "EngineEvent.h"
#include "JsonFields.h"
#include "VariantKinds.h"
#include <algorithm>
#include <stdexcept>

namespace StenoBridge {
namespace Protocol {

using namespace JsonFields;

namespace Events {

nlohmann::json Stroke::toJson() const
{
    return { { "keys", keys }, { "steno", steno } };
}

Stroke Stroke::fromJson(const nlohmann::json& j)
{
    requireObject(j, "Stroke payload");
    return Stroke{ .keys = requireStringArray(j, "keys"), .steno = requireString(j, "steno") };
}

nlohmann::json Translation::toJson() const
{
    return { { "text", text } };
}

Translation Translation::fromJson(const nlohmann::json& j)
{
    requireObject(j, "Translation payload");
    return Translation{ .text = requireString(j, "text") };
}

nlohmann::json ConfigChanged::toJson() const
{
    return { { "option", option }, { "value", configValueToJson(value) } };
}

ConfigChanged ConfigChanged::fromJson(const nlohmann::json& j)
{
    requireObject(j, "ConfigChanged payload");
    if (!j.contains("value")) {
        throw std::invalid_argument("missing field 'value'");
    }
    return ConfigChanged{ .option = requireString(j, "option"),
                          .value = configValueFromJson(j.at("value")) };
}

nlohmann::json OutputToggled::toJson() const
{
    return { { "enabled", enabled } };
}

OutputToggled OutputToggled::fromJson(const nlohmann::json& j)
{
    requireObject(j, "OutputToggled payload");
    return OutputToggled{ .enabled = requireBool(j, "enabled") };
}

nlohmann::json MachineStateChanged::toJson() const
{
    return { { "machine_type", machine_type }, { "state", state } };
}

MachineStateChanged MachineStateChanged::fromJson(const nlohmann::json& j)
{
    requireObject(j, "MachineStateChanged payload");
    return MachineStateChanged{ .machine_type = requireString(j, "machine_type"),
                                .state = requireString(j, "state") };
}

nlohmann::json DictionariesLoaded::toJson() const
{
    return { { "paths", paths } };
}

DictionariesLoaded DictionariesLoaded::fromJson(const nlohmann::json& j)
{
    requireObject(j, "DictionariesLoaded payload");
    return DictionariesLoaded{ .paths = requireStringArray(j, "paths") };
}

nlohmann::json SendString::toJson() const
{
    return { { "text", text } };
}

SendString SendString::fromJson(const nlohmann::json& j)
{
    requireObject(j, "SendString payload");
    return SendString{ .text = requireString(j, "text") };
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

} // namespace Events

std::string_view EngineEvent::kind() const
{
    return eventKindOf(data);
}

std::string_view eventKindOf(const EngineEvent::Data& data)
{
    return kindOf(data);
}

const std::vector<std::string>& eventKindNames()
{
    static const std::vector<std::string> names = kindNames<EngineEvent::Data>();
    return names;
}

bool isKnownEventKind(std::string_view kind)
{
    const auto& names = eventKindNames();
    return std::find(names.begin(), names.end(), kind) != names.end();
}

nlohmann::json eventPayloadToJson(const EngineEvent::Data& data)
{
    return payloadOf(data);
}

EngineEvent::Data eventPayloadFromJson(std::string_view kind, const nlohmann::json& payload)
{
    return fromKind<EngineEvent::Data>(kind, payload);
}

} // namespace Protocol
} // namespace StenoBridge
