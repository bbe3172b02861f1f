#pragma once

#include "ConfigOptions.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace StenoBridge {
namespace Protocol {

/**
 * Domain events emitted by the stenography engine. Each payload knows its wire
 * kind and how to convert itself to and from the JSON payload object.
 */
namespace Events {

struct Stroke {
    std::vector<std::string> keys;
    std::string steno;

    static constexpr const char* name() { return "Stroke"; }
    nlohmann::json toJson() const;
    static Stroke fromJson(const nlohmann::json& j);
    bool operator==(const Stroke&) const = default;
};

struct Translation {
    std::string text;

    static constexpr const char* name() { return "Translation"; }
    nlohmann::json toJson() const;
    static Translation fromJson(const nlohmann::json& j);
    bool operator==(const Translation&) const = default;
};

struct ConfigChanged {
    std::string option;
    ConfigValue value;

    static constexpr const char* name() { return "ConfigChanged"; }
    nlohmann::json toJson() const;
    static ConfigChanged fromJson(const nlohmann::json& j);
    bool operator==(const ConfigChanged&) const = default;
};

struct OutputToggled {
    bool enabled = false;

    static constexpr const char* name() { return "OutputToggled"; }
    nlohmann::json toJson() const;
    static OutputToggled fromJson(const nlohmann::json& j);
    bool operator==(const OutputToggled&) const = default;
};

struct MachineStateChanged {
    std::string machine_type;
    std::string state;

    static constexpr const char* name() { return "MachineStateChanged"; }
    nlohmann::json toJson() const;
    static MachineStateChanged fromJson(const nlohmann::json& j);
    bool operator==(const MachineStateChanged&) const = default;
};

struct DictionariesLoaded {
    std::vector<std::string> paths;

    static constexpr const char* name() { return "DictionariesLoaded"; }
    nlohmann::json toJson() const;
    static DictionariesLoaded fromJson(const nlohmann::json& j);
    bool operator==(const DictionariesLoaded&) const = default;
};

struct SendString {
    std::string text;

    static constexpr const char* name() { return "SendString"; }
    nlohmann::json toJson() const;
    static SendString fromJson(const nlohmann::json& j);
    bool operator==(const SendString&) const = default;
};

struct SendBackspaces {
    uint32_t count = 0;

    static constexpr const char* name() { return "SendBackspaces"; }
    nlohmann::json toJson() const;
    static SendBackspaces fromJson(const nlohmann::json& j);
    bool operator==(const SendBackspaces&) const = default;
};

struct SendKeyCombination {
    std::string combination;

    static constexpr const char* name() { return "SendKeyCombination"; }
    nlohmann::json toJson() const;
    static SendKeyCombination fromJson(const nlohmann::json& j);
    bool operator==(const SendKeyCombination&) const = default;
};

} // namespace Events

/**
 * @brief An engine event as it leaves the bridge: payload plus the sequence
 * number and timestamp stamped at publish time.
 */
struct EngineEvent {
    using Data = std::variant<
        Events::Stroke,
        Events::Translation,
        Events::ConfigChanged,
        Events::OutputToggled,
        Events::MachineStateChanged,
        Events::DictionariesLoaded,
        Events::SendString,
        Events::SendBackspaces,
        Events::SendKeyCombination>;

    uint64_t seq = 0;
    // Milliseconds since the Unix epoch.
    int64_t timestamp = 0;
    Data data;

    std::string_view kind() const;

    bool operator==(const EngineEvent&) const = default;
};

std::string_view eventKindOf(const EngineEvent::Data& data);

const std::vector<std::string>& eventKindNames();

bool isKnownEventKind(std::string_view kind);

nlohmann::json eventPayloadToJson(const EngineEvent::Data& data);

// Throws std::invalid_argument for an unknown kind, nlohmann::json::exception
// or std::invalid_argument for a payload that does not match the kind.
EngineEvent::Data eventPayloadFromJson(std::string_view kind, const nlohmann::json& payload);

} // namespace Protocol
} // namespace StenoBridge
