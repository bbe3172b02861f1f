#include "FailureThrottle.h"
#include "core/LoggingChannels.h"

namespace StenoBridge {
namespace Auth {

namespace {
constexpr size_t kPruneThreshold = 1024;
}

FailureThrottle::FailureThrottle(
    uint32_t maxFailures, std::chrono::milliseconds window, std::chrono::milliseconds lockout)
    : maxFailures_(maxFailures), window_(window), lockout_(lockout)
{}

bool FailureThrottle::recordFailure(const std::string& origin, Clock::time_point now)
{
    if (maxFailures_ == 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (origins_.size() > kPruneThreshold) {
        pruneLocked(now);
    }

    auto& state = origins_[origin];
    while (!state.failures.empty() && now - state.failures.front() > window_) {
        state.failures.pop_front();
    }
    state.failures.push_back(now);

    if (state.failures.size() < maxFailures_) {
        return false;
    }

    state.failures.clear();
    state.lockedUntil = now + lockout_;
    LOG_WARN(
        Auth,
        "Origin {} locked out for {} ms after {} failed handshakes",
        origin,
        lockout_.count(),
        maxFailures_);
    return true;
}

void FailureThrottle::recordSuccess(const std::string& origin)
{
    std::lock_guard<std::mutex> lock(mutex_);
    origins_.erase(origin);
}

bool FailureThrottle::isLocked(const std::string& origin, Clock::time_point now) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = origins_.find(origin);
    if (it == origins_.end() || !it->second.lockedUntil.has_value()) {
        return false;
    }
    return now < it->second.lockedUntil.value();
}

size_t FailureThrottle::trackedOrigins() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return origins_.size();
}

void FailureThrottle::pruneLocked(Clock::time_point now)
{
    for (auto it = origins_.begin(); it != origins_.end();) {
        auto& state = it->second;
        const bool lockExpired = !state.lockedUntil.has_value() || now >= *state.lockedUntil;
        const bool failuresExpired =
            state.failures.empty() || now - state.failures.back() > window_;
        if (lockExpired && failuresExpired) {
            it = origins_.erase(it);
        }
        else {
            ++it;
        }
    }
}

} // namespace Auth
} // namespace StenoBridge
