#include "Broadcaster.h"
#include "core/LoggingChannels.h"
#include "protocol/EnvelopeCodec.h"
#include <exception>

namespace StenoBridge {
namespace Server {

Broadcaster::Broadcaster(ConnectionRegistry& registry, Options options)
    : registry_(registry), options_(options)
{}

size_t Broadcaster::broadcast(const std::vector<Protocol::EngineEvent>& events, Clock::time_point now)
{
    if (events.empty()) {
        return 0;
    }

    const auto connections = registry_.snapshot();
    size_t queued = 0;
    for (const auto& event : events) {
        SharedFrame frame;
        for (const auto& connection : connections) {
            if (!connection->isAuthenticated() || !connection->wantsEvent(event.kind())) {
                continue;
            }
            // Never hand a connection an event older than one it already has.
            if (event.seq <= connection->lastEventSeq()) {
                continue;
            }
            if (!frame) {
                frame = std::make_shared<const std::string>(Protocol::encodeEvent(event));
                ++encodedEvents_;
            }
            if (deliver(*connection, frame, now)) {
                connection->setLastEventSeq(event.seq);
                ++queued;
            }
        }
    }

    LOG_TRACE(Broadcast, "Queued {} frames for {} events", queued, events.size());
    return queued;
}

bool Broadcaster::deliver(Connection& connection, SharedFrame frame, Clock::time_point now)
{
    if (connection.state() == ConnectionState::Closing
        || connection.state() == ConnectionState::Closed) {
        return false;
    }

    if (connection.enqueue(std::move(frame))) {
        return true;
    }

    LOG_WARN(
        Broadcast,
        "{} fell {} frames behind, closing as Overwhelmed",
        connection.id(),
        connection.queuedCount());
    connection.beginClosing(CloseReason::Overwhelmed, now, true);
    connection.enqueueUnbounded(std::make_shared<const std::string>(Protocol::encodeControl(
        Protocol::Control::Error{ .code = "Overwhelmed",
                                  .message = "client is not reading fast enough" })));
    return false;
}

bool Broadcaster::sendControl(
    Connection& connection, const Protocol::ControlMessage& message, Clock::time_point now)
{
    return deliver(
        connection, std::make_shared<const std::string>(Protocol::encodeControl(message)), now);
}

void Broadcaster::closeWithError(
    Connection& connection,
    CloseReason reason,
    const std::string& code,
    const std::string& message,
    Clock::time_point now)
{
    if (connection.state() == ConnectionState::Closing
        || connection.state() == ConnectionState::Closed) {
        return;
    }
    connection.enqueueUnbounded(std::make_shared<const std::string>(
        Protocol::encodeControl(Protocol::Control::Error{ .code = code, .message = message })));
    connection.beginClosing(reason, now, false);
}

std::vector<std::shared_ptr<Connection>> Broadcaster::flush(Clock::time_point now)
{
    std::vector<std::shared_ptr<Connection>> removed;

    for (const auto& connection : registry_.snapshot()) {
        if (connection->state() != ConnectionState::Closed) {
            writeQueued(*connection, now);
        }

        if (connection->state() == ConnectionState::Closing) {
            auto& socket = connection->socket();
            const bool drained = !connection->hasQueued() && socket.bufferedAmount() == 0;
            const bool expired = now - connection->closingSince() >= options_.closeGrace;
            if (drained || expired || !socket.isOpen()) {
                if (connection->hasQueued()) {
                    LOG_WARN(
                        Broadcast,
                        "{} did not drain within the grace period, dropping {} frames",
                        connection->id(),
                        connection->queuedCount());
                }
                socket.close();
                connection->markClosed();
            }
        }

        if (connection->state() == ConnectionState::Closed) {
            registry_.remove(connection->id());
            LOG_INFO(
                Network,
                "{} closed ({})",
                connection->id(),
                connection->closeReason().has_value() ? toString(connection->closeReason().value())
                                                      : "unknown");
            removed.push_back(connection);
        }
    }

    return removed;
}

void Broadcaster::writeQueued(Connection& connection, Clock::time_point now)
{
    auto& socket = connection.socket();
    while (connection.hasQueued() && socket.bufferedAmount() < options_.socketHighWaterBytes) {
        if (!socket.isOpen()) {
            return;
        }
        Result<std::monostate, std::string> result;
        try {
            result = socket.send(*connection.front());
        }
        catch (const std::exception& e) {
            LOG_ERROR(Network, "Socket for {} threw on send: {}", connection.id(), e.what());
            result = Result<std::monostate, std::string>::error(e.what());
        }
        if (result.isError()) {
            LOG_WARN(Network, "Send to {} failed: {}", connection.id(), result.errorValue());
            connection.beginClosing(CloseReason::InternalError, now, true);
            socket.close();
            connection.markClosed();
            return;
        }
        connection.popFront();
    }
}

} // namespace Server
} // namespace StenoBridge
