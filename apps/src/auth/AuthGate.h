#pragma once

#include "AuthError.h"
#include "FailureThrottle.h"
#include "ProofVerifier.h"
#include "core/Result.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace StenoBridge {
namespace Auth {

using Clock = std::chrono::steady_clock;

/**
 * @brief A nonce issued to one connection attempt. Valid for a single proof.
 */
struct Challenge {
    std::string nonce;
    std::string origin;
    Clock::time_point issuedAt;
    Clock::time_point expiresAt;
};

struct Identity {
    std::string origin;
    Clock::time_point authenticatedAt;
};

struct AuthGateConfig {
    std::chrono::milliseconds challengeTimeout{ 10000 };
    uint32_t maxFailures = 3;
    std::chrono::milliseconds failureWindow{ 60000 };
    std::chrono::milliseconds lockout{ 60000 };
};

/**
 * @brief Challenge-response admission check for new connections.
 *
 * Every connection attempt gets a fresh random nonce; the client answers with
 * a proof derived from the pre-shared key. Failures are counted per origin and
 * an origin that fails too often is refused challenges until its lockout ends.
 */
class AuthGate {
public:
    static constexpr size_t kNonceBytes = 32;

    struct Dependencies {
        std::function<Clock::time_point()> now;
        // Fills the buffer with cryptographically secure bytes; false on failure.
        std::function<bool(std::vector<uint8_t>&)> randomBytes;
    };

    AuthGate(
        AuthGateConfig config,
        std::shared_ptr<const ProofVerifier> verifier,
        Dependencies deps = {});

    Result<Challenge, AuthError> issueChallenge(const std::string& origin);

    /**
     * @brief Checks the proof sent for challenge. A missing proof means the
     * client sent something other than a proof.
     */
    Result<Identity, AuthError> authenticate(
        const Challenge& challenge,
        const std::optional<std::string>& proof,
        const std::string& origin);

    bool isLockedOut(const std::string& origin) const;

    const AuthGateConfig& config() const { return config_; }

private:
    Result<Identity, AuthError> fail(
        const std::string& origin, AuthError::Kind kind, std::string message);

    AuthGateConfig config_;
    std::shared_ptr<const ProofVerifier> verifier_;
    Dependencies deps_;
    FailureThrottle throttle_;
};

} // namespace Auth
} // namespace StenoBridge
