#pragma once

#include "Broadcaster.h"
#include "CommandDispatcher.h"
#include "ConnectionRegistry.h"
#include "Event.h"
#include "EventProcessor.h"
#include "ServerConfig.h"
#include "auth/AuthGate.h"
#include "auth/ProofVerifier.h"
#include "bridge/EngineBridge.h"
#include "core/Result.h"
#include "core/network/ClientSocket.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace StenoBridge {

namespace Network {
class WebSocketListener;
}

namespace Server {

enum class LifecycleState { Idle, Running, Draining, Stopped };

const char* toString(LifecycleState state);

/**
 * @brief Runs one bridge server instance: listener, handshake, connection
 * registry, broadcaster and command dispatcher, all driven from one loop.
 *
 * Transport callbacks and host completions only post events; every piece of
 * connection state is touched from processEvents(). In normal mode start()
 * binds the listener and spawns the loop thread. In test mode there is no
 * networking and no thread, and tests call processEvents() themselves.
 */
class BridgeServer {
public:
    struct Dependencies {
        std::function<Clock::time_point()> now;
        std::function<bool(std::vector<uint8_t>&)> randomBytes;
    };

    struct TestMode {
        std::shared_ptr<const Auth::ProofVerifier> verifier;
        Dependencies dependencies;
    };

    BridgeServer(ServerConfig config, std::shared_ptr<Bridge::EngineBridge> bridge);
    BridgeServer(ServerConfig config, std::shared_ptr<Bridge::EngineBridge> bridge, TestMode testMode);
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    Result<std::monostate, std::string> start();

    /**
     * @brief Drains and closes every connection, then shuts the bridge down.
     * Blocks for at most the configured grace period. Safe to call more than
     * once; not callable from the loop thread.
     */
    void stop();

    // Starts the drain without waiting for it.
    void requestStop();

    LifecycleState lifecycleState() const { return state_.load(); }
    bool isRunning() const;
    uint16_t port() const;

    // Transport entry points; any thread.
    void acceptClient(std::shared_ptr<Network::ClientSocket> socket);
    void onClientText(Network::SocketId socketId, std::string text);
    void onClientBinary(Network::SocketId socketId);
    void onClientClosed(Network::SocketId socketId);

    // One loop turn.
    void processEvents();
    void mainLoopRun();
    void handleEvent(const Event& event);

    ConnectionRegistry& registry() { return registry_; }
    const CommandDispatcher& dispatcher() const { return dispatcher_; }
    const Broadcaster& broadcaster() const { return broadcaster_; }
    size_t pendingHandshakeCount() const { return pending_.size(); }
    const ServerConfig& config() const { return config_; }

private:
    struct PendingHandshake {
        std::shared_ptr<Network::ClientSocket> socket;
        Auth::Challenge challenge;
    };

    void handle(const LoopEvents::ClientOpened& event);
    void handle(const LoopEvents::ClientText& event);
    void handle(const LoopEvents::ClientBinary& event);
    void handle(const LoopEvents::ClientClosed& event);
    void handle(const LoopEvents::CommandCompleted& event);
    void handle(const LoopEvents::ShutdownRequested& event);

    void finishHandshake(const PendingHandshake& pending, const std::optional<std::string>& proof);
    void handleConnectionText(Connection& connection, const std::string& text);
    std::shared_ptr<Connection> findBySocket(Network::SocketId socketId) const;
    void refuse(Network::ClientSocket& socket, const std::string& code, const std::string& message);
    bool isOriginAllowed(const std::string& origin) const;

    void takePublishedEvents();
    void broadcastPublished(Clock::time_point now);
    void checkTimeouts(Clock::time_point now);
    void beginShutdown(Clock::time_point now);
    void finishShutdown();

    ServerConfig config_;
    std::shared_ptr<Bridge::EngineBridge> bridge_;
    Dependencies deps_;
    bool enableNetworking_ = true;
    std::shared_ptr<const Auth::ProofVerifier> verifier_;

    EventProcessor eventProcessor_;
    ConnectionRegistry registry_;
    Broadcaster broadcaster_;
    CommandDispatcher dispatcher_;
    std::unique_ptr<Auth::AuthGate> authGate_;
    std::unique_ptr<Network::WebSocketListener> listener_;

    std::unordered_map<Network::SocketId, PendingHandshake> pending_;
    std::unordered_map<Network::SocketId, std::string> connectionIds_;
    // Drained from the bridge this turn, not yet broadcast.
    std::vector<Protocol::EngineEvent> published_;

    std::atomic<LifecycleState> state_{ LifecycleState::Idle };
    Clock::time_point drainDeadline_{};
    std::mutex lifecycleMutex_;
    std::thread loopThread_;
};

} // namespace Server
} // namespace StenoBridge
