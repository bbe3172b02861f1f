#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace StenoBridge {
namespace Auth {

/**
 * @brief Locks an origin out after too many failed handshakes in a sliding window.
 *
 * maxFailures == 0 disables throttling.
 */
class FailureThrottle {
public:
    using Clock = std::chrono::steady_clock;

    FailureThrottle(
        uint32_t maxFailures, std::chrono::milliseconds window, std::chrono::milliseconds lockout);

    // Returns true when this failure locked the origin out.
    bool recordFailure(const std::string& origin, Clock::time_point now);
    void recordSuccess(const std::string& origin);

    bool isLocked(const std::string& origin, Clock::time_point now) const;

    size_t trackedOrigins() const;

private:
    struct OriginState {
        std::deque<Clock::time_point> failures;
        std::optional<Clock::time_point> lockedUntil;
    };

    void pruneLocked(Clock::time_point now);

    const uint32_t maxFailures_;
    const std::chrono::milliseconds window_;
    const std::chrono::milliseconds lockout_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, OriginState> origins_;
};

} // namespace Auth
} // namespace StenoBridge
