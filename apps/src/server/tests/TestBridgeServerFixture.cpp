#include "TestBridgeServerFixture.h"
#include "auth/HmacProofVerifier.h"
#include "protocol/EnvelopeCodec.h"
#include <gtest/gtest.h>
#include <stdexcept>

namespace StenoBridge::Server::Tests {

const std::vector<uint8_t> TestBridgeServerFixture::kKey(32, 0x5a);

TestBridgeServerFixture::TestBridgeServerFixture(ServerConfig config)
{
    bridge = std::make_shared<Bridge::EngineBridge>(
        config.eventBufferCapacity,
        Bridge::EngineBridge::Dependencies{ .wallClockMs = []() { return kWallClockMs; } });

    engine = std::make_unique<Host::StandaloneEngine>(
        [this](Protocol::EngineEvent::Data event) { bridge->publish(std::move(event)); });

    server = std::make_unique<BridgeServer>(
        std::move(config),
        bridge,
        BridgeServer::TestMode{
            .verifier = std::make_shared<Auth::HmacProofVerifier>(kKey),
            .dependencies = { .now = [this]() { return now; }, .randomBytes = {} } });

    auto started = server->start();
    if (started.isError()) {
        throw std::runtime_error("test server failed to start: " + started.errorValue());
    }
}

TestBridgeServerFixture::~TestBridgeServerFixture()
{
    server.reset();
}

std::shared_ptr<MockClientSocket> TestBridgeServerFixture::open(
    const std::string& remoteAddress, const std::string& path)
{
    auto socket = std::make_shared<MockClientSocket>(nextSocketId_++, remoteAddress, path);
    server->acceptClient(socket);
    turn();
    return socket;
}

std::shared_ptr<MockClientSocket> TestBridgeServerFixture::connect(const std::string& remoteAddress)
{
    auto socket = open(remoteAddress);
    sendText(*socket, Protocol::encodeControl(Protocol::Control::Proof{ proofFor(*socket) }));
    EXPECT_EQ(socket->lastSent().value("type", ""), "welcome");
    return socket;
}

std::string TestBridgeServerFixture::proofFor(const MockClientSocket& socket) const
{
    const auto challenges = socket.sentOfType("challenge");
    if (challenges.empty()) {
        return "";
    }
    const auto nonce = challenges.front().at("nonce").get<std::string>();
    auto proof = Auth::HmacProofVerifier::computeProof(kKey, nonce);
    return proof.isValue() ? proof.value() : "";
}

void TestBridgeServerFixture::sendText(const MockClientSocket& socket, const std::string& text)
{
    server->onClientText(socket.id(), text);
    turn();
}

void TestBridgeServerFixture::runHost()
{
    bridge->processHostCalls(*engine);
    turn();
}

void TestBridgeServerFixture::publish(Protocol::EngineEvent::Data event)
{
    bridge->publish(std::move(event));
}

void TestBridgeServerFixture::advance(std::chrono::milliseconds duration)
{
    now += duration;
}

void TestBridgeServerFixture::turn()
{
    server->processEvents();
}

} // namespace StenoBridge::Server::Tests
