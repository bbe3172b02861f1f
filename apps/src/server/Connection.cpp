#include "Connection.h"
#include "core/LoggingChannels.h"

namespace StenoBridge {
namespace Server {

const char* toString(ConnectionState state)
{
    switch (state) {
        case ConnectionState::Connecting:
            return "Connecting";
        case ConnectionState::Authenticated:
            return "Authenticated";
        case ConnectionState::Closing:
            return "Closing";
        case ConnectionState::Closed:
            return "Closed";
    }
    return "Unknown";
}

const char* toString(CloseReason reason)
{
    switch (reason) {
        case CloseReason::ClientDisconnect:
            return "ClientDisconnect";
        case CloseReason::ProtocolViolation:
            return "ProtocolViolation";
        case CloseReason::Overwhelmed:
            return "Overwhelmed";
        case CloseReason::IdleTimeout:
            return "IdleTimeout";
        case CloseReason::ServerShutdown:
            return "ServerShutdown";
        case CloseReason::InternalError:
            return "InternalError";
    }
    return "Unknown";
}

Connection::Connection(
    std::string id,
    std::shared_ptr<Network::ClientSocket> socket,
    Auth::Identity identity,
    size_t queueCapacity,
    Clock::time_point now)
    : id_(std::move(id)),
      socket_(std::move(socket)),
      identity_(std::move(identity)),
      queueCapacity_(queueCapacity),
      lastActivity_(now)
{}

void Connection::markAuthenticated()
{
    if (state_ != ConnectionState::Connecting) {
        return;
    }
    state_ = ConnectionState::Authenticated;
    LOG_DEBUG(State, "{}: Connecting -> Authenticated", id_);
}

void Connection::beginClosing(CloseReason reason, Clock::time_point now, bool dropQueued)
{
    if (state_ == ConnectionState::Closing || state_ == ConnectionState::Closed) {
        return;
    }
    LOG_DEBUG(State, "{}: {} -> Closing ({})", id_, toString(state_), toString(reason));
    state_ = ConnectionState::Closing;
    closeReason_ = reason;
    closingSince_ = now;
    if (dropQueued) {
        outbound_.clear();
    }
}

void Connection::markClosed()
{
    if (state_ == ConnectionState::Closed) {
        return;
    }
    LOG_DEBUG(State, "{}: {} -> Closed", id_, toString(state_));
    state_ = ConnectionState::Closed;
    outbound_.clear();
}

void Connection::setSubscription(std::set<std::string> kinds)
{
    subscription_ = std::move(kinds);
}

bool Connection::wantsEvent(std::string_view kind) const
{
    return subscription_.empty() || subscription_.contains(std::string(kind));
}

bool Connection::enqueue(SharedFrame frame)
{
    if (outbound_.size() >= queueCapacity_) {
        return false;
    }
    outbound_.push_back(std::move(frame));
    return true;
}

void Connection::enqueueUnbounded(SharedFrame frame)
{
    outbound_.push_back(std::move(frame));
}

} // namespace Server
} // namespace StenoBridge
