#pragma once

#include <string>

namespace StenoBridge {
namespace Auth {

struct AuthError {
    enum class Kind {
        MissingCredential,
        InvalidProof,
        ExpiredChallenge,
        RateLimited,
        // The gate itself could not operate (no randomness).
        Internal,
    };

    Kind kind = Kind::InvalidProof;
    std::string message;
};

inline const char* toString(AuthError::Kind kind)
{
    switch (kind) {
        case AuthError::Kind::MissingCredential:
            return "MissingCredential";
        case AuthError::Kind::InvalidProof:
            return "InvalidProof";
        case AuthError::Kind::ExpiredChallenge:
            return "ExpiredChallenge";
        case AuthError::Kind::RateLimited:
            return "RateLimited";
        case AuthError::Kind::Internal:
            return "Internal";
    }
    return "Unknown";
}

} // namespace Auth
} // namespace StenoBridge
