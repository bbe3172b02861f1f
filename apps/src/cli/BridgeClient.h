#pragma once

#include "core/Result.h"
#include "protocol/ClientCommand.h"
#include "protocol/ControlMessage.h"
#include "protocol/EngineEvent.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rtc {
class WebSocket;
}

namespace StenoBridge {
namespace Client {

/**
 * @brief WebSocket client for a bridge server.
 *
 * connect() returns once the challenge has been answered and the server has
 * welcomed us. Events arrive on libdatachannel's thread through the event
 * callback. sendCommand() blocks until the matching ack or a timeout.
 */
class BridgeClient {
public:
    using EventCallback = std::function<void(const Protocol::EngineEvent&)>;
    using DisconnectCallback = std::function<void(const std::string& reason)>;
    using AckCallback = std::function<void(const Protocol::Control::Ack&)>;

    explicit BridgeClient(std::vector<uint8_t> key);
    ~BridgeClient();

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    // Returns the connection id assigned by the server.
    Result<std::string, std::string> connect(const std::string& url, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;

    void onEvent(EventCallback callback);
    void onDisconnected(DisconnectCallback callback);

    // Called on the network thread for every ack, in arrival order relative
    // to events, before sendCommand() returns it.
    void onAck(AckCallback callback);

    Result<Protocol::Control::Ack, std::string> sendCommand(
        Protocol::ClientCommand::Data command, int timeoutMs = 5000);

    Result<std::monostate, std::string> sendText(const std::string& text);

    /**
     * @brief Sends a heartbeat. The server counts it as activity and answers
     * with a pong; idle clients are otherwise closed by the server.
     */
    Result<std::monostate, std::string> ping();

    std::string connectionId() const;

private:
    enum class HandshakeState { AwaitingChallenge, AwaitingWelcome, Ready, Failed };

    void handleText(const std::string& text);
    void handleControl(const Protocol::ControlMessage& message);
    void failHandshake(std::string reason);

    std::vector<uint8_t> key_;
    std::shared_ptr<rtc::WebSocket> ws_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    HandshakeState handshake_ = HandshakeState::AwaitingChallenge;
    std::string connectionId_;
    std::string lastError_;
    bool closed_ = false;
    std::map<std::string, std::optional<Protocol::Control::Ack>> pendingAcks_;

    std::atomic<uint64_t> nextCorrelationId_{ 1 };
    EventCallback eventCallback_;
    DisconnectCallback disconnectCallback_;
    AckCallback ackCallback_;
};

} // namespace Client
} // namespace StenoBridge
