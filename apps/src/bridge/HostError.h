#pragma once

#include "protocol/ProtocolErrors.h"
#include <string>
#include <utility>

namespace StenoBridge {
namespace Bridge {

struct HostError {
    enum class Kind { HostUnavailable, Rejected };

    Kind kind = Kind::Rejected;
    std::string message;

    static HostError unavailable(std::string message)
    {
        return HostError{ .kind = Kind::HostUnavailable, .message = std::move(message) };
    }

    static HostError rejected(std::string message)
    {
        return HostError{ .kind = Kind::Rejected, .message = std::move(message) };
    }
};

inline const char* toString(HostError::Kind kind)
{
    switch (kind) {
        case HostError::Kind::HostUnavailable:
            return "HostUnavailable";
        case HostError::Kind::Rejected:
            return "Rejected";
    }
    return "Unknown";
}

inline Protocol::CommandError toCommandError(const HostError& error)
{
    const auto code = error.kind == HostError::Kind::HostUnavailable
        ? Protocol::CommandErrorCode::HostUnavailable
        : Protocol::CommandErrorCode::HostError;
    return Protocol::CommandError{ .code = code, .message = error.message };
}

} // namespace Bridge
} // namespace StenoBridge
