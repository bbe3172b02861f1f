#pragma once

#include "auth/AuthGate.h"
#include "core/network/ClientSocket.h"
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace StenoBridge {
namespace Server {

using Clock = std::chrono::steady_clock;

// An encoded frame, shared by every connection it is queued on.
using SharedFrame = std::shared_ptr<const std::string>;

enum class ConnectionState { Connecting, Authenticated, Closing, Closed };

enum class CloseReason {
    ClientDisconnect,
    ProtocolViolation,
    Overwhelmed,
    IdleTimeout,
    ServerShutdown,
    InternalError,
};

const char* toString(ConnectionState state);
const char* toString(CloseReason reason);

/**
 * @brief One client that has passed the handshake.
 *
 * Only touched from the server loop. The registry owns it; everyone else
 * looks it up by id when they need it.
 */
class Connection {
public:
    Connection(
        std::string id,
        std::shared_ptr<Network::ClientSocket> socket,
        Auth::Identity identity,
        size_t queueCapacity,
        Clock::time_point now);

    const std::string& id() const { return id_; }
    Network::SocketId socketId() const { return socket_->id(); }
    Network::ClientSocket& socket() { return *socket_; }
    const Auth::Identity& identity() const { return identity_; }

    ConnectionState state() const { return state_; }
    std::optional<CloseReason> closeReason() const { return closeReason_; }
    bool isAuthenticated() const { return state_ == ConnectionState::Authenticated; }

    // Connecting -> Authenticated. Ignored in any other state.
    void markAuthenticated();

    /**
     * @brief Authenticated (or Connecting) -> Closing. The first reason wins;
     * later calls are ignored. With dropQueued the outbound queue is cleared.
     */
    void beginClosing(CloseReason reason, Clock::time_point now, bool dropQueued);

    void markClosed();
    Clock::time_point closingSince() const { return closingSince_; }

    // Empty set means every kind.
    void setSubscription(std::set<std::string> kinds);
    const std::set<std::string>& subscription() const { return subscription_; }
    bool wantsEvent(std::string_view kind) const;

    // False when the queue is already at capacity.
    bool enqueue(SharedFrame frame);

    // Queues past capacity; used for the final error before a close.
    void enqueueUnbounded(SharedFrame frame);

    bool hasQueued() const { return !outbound_.empty(); }
    size_t queuedCount() const { return outbound_.size(); }
    size_t queueCapacity() const { return queueCapacity_; }
    const SharedFrame& front() const { return outbound_.front(); }
    void popFront() { outbound_.pop_front(); }

    // Highest event seq queued so far; zero before the first event.
    uint64_t lastEventSeq() const { return lastEventSeq_; }
    void setLastEventSeq(uint64_t seq) { lastEventSeq_ = seq; }

    void markActivity(Clock::time_point now) { lastActivity_ = now; }
    Clock::time_point lastActivity() const { return lastActivity_; }

private:
    std::string id_;
    std::shared_ptr<Network::ClientSocket> socket_;
    Auth::Identity identity_;

    ConnectionState state_ = ConnectionState::Connecting;
    std::optional<CloseReason> closeReason_;
    Clock::time_point closingSince_{};

    std::set<std::string> subscription_;
    std::deque<SharedFrame> outbound_;
    size_t queueCapacity_;
    uint64_t lastEventSeq_ = 0;
    Clock::time_point lastActivity_;
};

} // namespace Server
} // namespace StenoBridge
