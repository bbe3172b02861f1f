#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace StenoBridge {
namespace Protocol {

/**
 * @brief Why an inbound frame could not be turned into a typed value.
 *
 * Malformed frames break protocol integrity and close the connection. An
 * UnknownKind or InvalidPayload command is answered and the connection survives.
 */
struct DecodeError {
    enum class Kind { Malformed, UnknownKind, InvalidPayload };

    Kind kind = Kind::Malformed;
    std::string message;
    // Recovered from the envelope when possible so the reply can be correlated.
    std::optional<std::string> correlationId;
    std::string commandKind;

    bool isFatal() const { return kind == Kind::Malformed; }
};

const char* toString(DecodeError::Kind kind);

/**
 * @brief Error codes reported to a client for a failed command.
 */
enum class CommandErrorCode { UnsupportedCommand, InvalidPayload, HostUnavailable, HostError };

const char* toString(CommandErrorCode code);

std::optional<CommandErrorCode> commandErrorCodeFromString(std::string_view code);

struct CommandError {
    CommandErrorCode code = CommandErrorCode::HostError;
    std::string message;

    bool operator==(const CommandError&) const = default;
};

} // namespace Protocol
} // namespace StenoBridge
