#pragma once

#include "bridge/EngineBridge.h"
#include "host/StandaloneEngine.h"
#include "server/BridgeServer.h"
#include "server/ServerConfig.h"
#include "tests/MockClientSocket.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace StenoBridge::Server::Tests {

using StenoBridge::Tests::MockClientSocket;

/**
 * @brief A BridgeServer in test mode with a controllable clock, a
 * StandaloneEngine as its host and helpers for driving mock clients.
 */
struct TestBridgeServerFixture {
    static const std::vector<uint8_t> kKey;
    static constexpr int64_t kWallClockMs = 1700000000000;

    explicit TestBridgeServerFixture(ServerConfig config = {});
    ~TestBridgeServerFixture();

    // Opens a socket and runs one loop turn; the socket holds the challenge.
    std::shared_ptr<MockClientSocket> open(
        const std::string& remoteAddress = "127.0.0.1:50000",
        const std::string& path = "/websocket");

    // Opens a socket and completes the handshake with the right key.
    std::shared_ptr<MockClientSocket> connect(const std::string& remoteAddress = "127.0.0.1:50000");

    std::string proofFor(const MockClientSocket& socket) const;

    // Posts a text frame and runs one loop turn.
    void sendText(const MockClientSocket& socket, const std::string& text);

    // Lets the host apply queued commands, then runs loop turns so the
    // completions and resulting events go out.
    void runHost();

    void publish(Protocol::EngineEvent::Data event);
    void advance(std::chrono::milliseconds duration);
    void turn();

    Clock::time_point now = Clock::time_point{} + std::chrono::hours(1);
    std::shared_ptr<Bridge::EngineBridge> bridge;
    std::unique_ptr<Host::StandaloneEngine> engine;
    std::unique_ptr<BridgeServer> server;

private:
    Network::SocketId nextSocketId_ = 1;
};

} // namespace StenoBridge::Server::Tests
