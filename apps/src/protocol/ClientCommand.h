#pragma once

#include "ConfigOptions.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace StenoBridge {
namespace Protocol {

namespace Commands {

struct SetConfigOption {
    std::string option;
    ConfigValue value;

    static constexpr const char* name() { return "SetConfigOption"; }
    nlohmann::json toJson() const;
    static SetConfigOption fromJson(const nlohmann::json& j);
    bool operator==(const SetConfigOption&) const = default;
};

/**
 * @brief Sets output on or off; with no value the current state is flipped.
 */
struct ToggleOutput {
    std::optional<bool> enabled;

    static constexpr const char* name() { return "ToggleOutput"; }
    nlohmann::json toJson() const;
    static ToggleOutput fromJson(const nlohmann::json& j);
    bool operator==(const ToggleOutput&) const = default;
};

struct SendText {
    std::string text;

    static constexpr const char* name() { return "SendText"; }
    nlohmann::json toJson() const;
    static SendText fromJson(const nlohmann::json& j);
    bool operator==(const SendText&) const = default;
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

/**
 * @brief Reverse lookup: which strokes would write this text.
 */
struct Lookup {
    std::string text;

    static constexpr const char* name() { return "Lookup"; }
    nlohmann::json toJson() const;
    static Lookup fromJson(const nlohmann::json& j);
    bool operator==(const Lookup&) const = default;
};

/**
 * @brief Replaces the connection's event filter. An empty list means all kinds.
 */
struct Subscribe {
    std::vector<std::string> kinds;

    static constexpr const char* name() { return "Subscribe"; }
    nlohmann::json toJson() const;
    static Subscribe fromJson(const nlohmann::json& j);
    bool operator==(const Subscribe&) const = default;
};

} // namespace Commands

struct ClientCommand {
    using Data = std::variant<
        Commands::SetConfigOption,
        Commands::ToggleOutput,
        Commands::SendText,
        Commands::SendBackspaces,
        Commands::SendKeyCombination,
        Commands::Lookup,
        Commands::Subscribe>;

    std::optional<std::string> correlationId;
    Data data;

    std::string_view kind() const;

    bool operator==(const ClientCommand&) const = default;
};

std::string_view commandKindOf(const ClientCommand::Data& data);

const std::vector<std::string>& commandKindNames();

nlohmann::json commandPayloadToJson(const ClientCommand::Data& data);

// Throws UnknownKindError for an unknown kind, std::invalid_argument or
// nlohmann::json::exception for a payload that does not fit the kind.
ClientCommand::Data commandPayloadFromJson(std::string_view kind, const nlohmann::json& payload);

} // namespace Protocol
} // namespace StenoBridge
