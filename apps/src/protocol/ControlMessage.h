#pragma once

#include "ProtocolErrors.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace StenoBridge {
namespace Protocol {

inline constexpr uint32_t kProtocolVersion = 1;

/**
 * Server-level messages that are not engine events: the handshake, command
 * acknowledgements, errors and heartbeats. The wire "type" is name().
 */
namespace Control {

struct Challenge {
    std::string nonce;
    int64_t expiresInMs = 0;

    static constexpr const char* name() { return "challenge"; }
    bool operator==(const Challenge&) const = default;
};

struct Proof {
    std::string response;

    static constexpr const char* name() { return "proof"; }
    bool operator==(const Proof&) const = default;
};

struct Welcome {
    std::string connectionId;
    uint32_t protocolVersion = kProtocolVersion;

    static constexpr const char* name() { return "welcome"; }
    bool operator==(const Welcome&) const = default;
};

/**
 * @brief Reply to a command that carried a correlation id.
 *
 * Without an error the outcome is "ok"; value carries a command result when
 * the command produces one (Lookup).
 */
struct Ack {
    std::string correlationId;
    std::optional<CommandError> error;
    nlohmann::json value;

    static constexpr const char* name() { return "ack"; }
    bool ok() const { return !error.has_value(); }
    bool operator==(const Ack&) const = default;
};

struct Error {
    std::string code;
    std::string message;

    static constexpr const char* name() { return "error"; }
    bool operator==(const Error&) const = default;
};

struct Ping {
    static constexpr const char* name() { return "ping"; }
    bool operator==(const Ping&) const = default;
};

struct Pong {
    static constexpr const char* name() { return "pong"; }
    bool operator==(const Pong&) const = default;
};

} // namespace Control

using ControlMessage = std::variant<
    Control::Challenge,
    Control::Proof,
    Control::Welcome,
    Control::Ack,
    Control::Error,
    Control::Ping,
    Control::Pong>;

std::string_view controlTypeOf(const ControlMessage& message);

/**
 * @brief Full envelope object for a control message, "type" included.
 */
nlohmann::json controlToJson(const ControlMessage& message);

// Throws UnknownKindError when type names no control message, and
// std::invalid_argument when a field is missing or has the wrong type.
ControlMessage controlFromJson(std::string_view type, const nlohmann::json& envelope);

} // namespace Protocol
} // namespace StenoBridge
