#include "ProtocolErrors.h"

namespace StenoBridge {
namespace Protocol {

const char* toString(DecodeError::Kind kind)
{
    switch (kind) {
        case DecodeError::Kind::Malformed:
            return "Malformed";
        case DecodeError::Kind::UnknownKind:
            return "UnknownKind";
        case DecodeError::Kind::InvalidPayload:
            return "InvalidPayload";
    }
    return "Unknown";
}

const char* toString(CommandErrorCode code)
{
    switch (code) {
        case CommandErrorCode::UnsupportedCommand:
            return "UnsupportedCommand";
        case CommandErrorCode::InvalidPayload:
            return "InvalidPayload";
        case CommandErrorCode::HostUnavailable:
            return "HostUnavailable";
        case CommandErrorCode::HostError:
            return "HostError";
    }
    return "Unknown";
}

std::optional<CommandErrorCode> commandErrorCodeFromString(std::string_view code)
{
    if (code == "UnsupportedCommand") return CommandErrorCode::UnsupportedCommand;
    if (code == "InvalidPayload") return CommandErrorCode::InvalidPayload;
    if (code == "HostUnavailable") return CommandErrorCode::HostUnavailable;
    if (code == "HostError") return CommandErrorCode::HostError;
    return std::nullopt;
}

} // namespace Protocol
} // namespace StenoBridge
