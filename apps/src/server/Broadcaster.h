#pragma once

#include "Connection.h"
#include "ConnectionRegistry.h"
#include "protocol/ControlMessage.h"
#include "protocol/EngineEvent.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace StenoBridge {
namespace Server {

/**
 * @brief Fans engine events out to connections and moves queued frames onto
 * their sockets.
 *
 * Each event is encoded once and the same buffer is queued on every matching
 * connection. A connection whose queue is full is closed as Overwhelmed
 * instead of holding up the others.
 */
class Broadcaster {
public:
    struct Options {
        // Stop writing to a socket while the transport holds this many bytes.
        size_t socketHighWaterBytes = 1024 * 1024;
        // How long a Closing connection may take to drain before it is cut.
        std::chrono::milliseconds closeGrace{ 2000 };
    };

    Broadcaster(ConnectionRegistry& registry, Options options);

    // Returns the number of frames queued across all connections.
    size_t broadcast(const std::vector<Protocol::EngineEvent>& events, Clock::time_point now);

    /**
     * @brief Queues a frame on one connection. A full queue moves the
     * connection to Closing(Overwhelmed) and returns false.
     */
    bool deliver(Connection& connection, SharedFrame frame, Clock::time_point now);

    bool sendControl(
        Connection& connection, const Protocol::ControlMessage& message, Clock::time_point now);

    // Queues an error frame (even past capacity) and starts closing.
    void closeWithError(
        Connection& connection,
        CloseReason reason,
        const std::string& code,
        const std::string& message,
        Clock::time_point now);

    /**
     * @brief Writes queued frames and completes Closing -> Closed for drained
     * or timed-out connections, removing them from the registry.
     * @return The connections removed during this call.
     */
    std::vector<std::shared_ptr<Connection>> flush(Clock::time_point now);

    uint64_t encodedEventCount() const { return encodedEvents_; }

private:
    void writeQueued(Connection& connection, Clock::time_point now);

    ConnectionRegistry& registry_;
    Options options_;
    uint64_t encodedEvents_ = 0;
};

} // namespace Server
} // namespace StenoBridge
