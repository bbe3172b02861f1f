#include "AuthGate.h"
#include "Hex.h"
#include "core/LoggingChannels.h"
#include <openssl/rand.h>

namespace StenoBridge {
namespace Auth {

namespace {

bool secureRandomBytes(std::vector<uint8_t>& buffer)
{
    return RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) == 1;
}

} // namespace

AuthGate::AuthGate(
    AuthGateConfig config, std::shared_ptr<const ProofVerifier> verifier, Dependencies deps)
    : config_(config),
      verifier_(std::move(verifier)),
      deps_(std::move(deps)),
      throttle_(config.maxFailures, config.failureWindow, config.lockout)
{
    if (!deps_.now) {
        deps_.now = []() { return Clock::now(); };
    }
    if (!deps_.randomBytes) {
        deps_.randomBytes = secureRandomBytes;
    }
}

Result<Challenge, AuthError> AuthGate::issueChallenge(const std::string& origin)
{
    const auto now = deps_.now();
    if (throttle_.isLocked(origin, now)) {
        LOG_INFO(Auth, "Refusing challenge for locked out origin {}", origin);
        return Result<Challenge, AuthError>::error(
            AuthError{ .kind = AuthError::Kind::RateLimited,
                       .message = "too many failed attempts, try again later" });
    }

    std::vector<uint8_t> nonce(kNonceBytes);
    if (!deps_.randomBytes(nonce)) {
        LOG_ERROR(Auth, "Secure random source failed, cannot issue challenge");
        return Result<Challenge, AuthError>::error(
            AuthError{ .kind = AuthError::Kind::Internal, .message = "no secure randomness" });
    }

    LOG_DEBUG(Auth, "Issued challenge to {}", origin);
    return Result<Challenge, AuthError>::okay(Challenge{ .nonce = toHex(nonce),
                                                         .origin = origin,
                                                         .issuedAt = now,
                                                         .expiresAt = now + config_.challengeTimeout });
}

Result<Identity, AuthError> AuthGate::authenticate(
    const Challenge& challenge, const std::optional<std::string>& proof, const std::string& origin)
{
    const auto now = deps_.now();

    if (throttle_.isLocked(origin, now)) {
        return Result<Identity, AuthError>::error(
            AuthError{ .kind = AuthError::Kind::RateLimited,
                       .message = "too many failed attempts, try again later" });
    }
    if (origin != challenge.origin) {
        return fail(origin, AuthError::Kind::InvalidProof, "challenge was issued to another origin");
    }
    if (now > challenge.expiresAt) {
        return fail(origin, AuthError::Kind::ExpiredChallenge, "challenge expired");
    }
    if (!proof.has_value() || proof->empty()) {
        return fail(origin, AuthError::Kind::MissingCredential, "no proof presented");
    }
    if (!verifier_ || !verifier_->verify(challenge.nonce, proof.value())) {
        return fail(origin, AuthError::Kind::InvalidProof, "proof does not match");
    }

    throttle_.recordSuccess(origin);
    LOG_INFO(Auth, "Authenticated client from {}", origin);
    return Result<Identity, AuthError>::okay(Identity{ .origin = origin, .authenticatedAt = now });
}

bool AuthGate::isLockedOut(const std::string& origin) const
{
    return throttle_.isLocked(origin, deps_.now());
}

Result<Identity, AuthError> AuthGate::fail(
    const std::string& origin, AuthError::Kind kind, std::string message)
{
    LOG_WARN(Auth, "Handshake from {} failed: {} ({})", origin, toString(kind), message);
    throttle_.recordFailure(origin, deps_.now());
    return Result<Identity, AuthError>::error(AuthError{ .kind = kind, .message = std::move(message) });
}

} // namespace Auth
} // namespace StenoBridge
