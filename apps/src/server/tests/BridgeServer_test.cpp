#include "bridge/tests/FakeEngineHost.h"
#include "host/StenoDictionary.h"
#include "protocol/EnvelopeCodec.h"
#include "server/tests/TestBridgeServerFixture.h"
#include <algorithm>
#include <optional>
#include <gtest/gtest.h>

using namespace StenoBridge;
using namespace StenoBridge::Server;
using namespace StenoBridge::Server::Tests;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> eventKinds(const MockClientSocket& socket)
{
    std::vector<std::string> kinds;
    for (const auto& event : socket.sentOfType("event")) {
        kinds.push_back(event.at("kind").get<std::string>());
    }
    return kinds;
}

bool hasEvent(const MockClientSocket& socket, const std::string& kind, const nlohmann::json& payload)
{
    const auto events = socket.sentOfType("event");
    return std::any_of(events.begin(), events.end(), [&](const nlohmann::json& event) {
        return event.at("kind") == kind && event.at("payload") == payload;
    });
}

std::string errorCode(const MockClientSocket& socket)
{
    const auto last = socket.lastSent();
    if (!last.is_object() || last.value("type", "") != "error") {
        return "";
    }
    return last.value("code", "");
}

// Index of the first frame sent to the socket that satisfies the predicate.
template <typename Predicate>
std::optional<size_t> firstFrame(const MockClientSocket& socket, Predicate predicate)
{
    const auto frames = socket.sentJson();
    for (size_t i = 0; i < frames.size(); ++i) {
        if (predicate(frames[i])) {
            return i;
        }
    }
    return std::nullopt;
}

// Applies commands with the fixture's engine, but lets the server loop run a
// turn after the engine has published and before the call completes.
class InterleavingHost : public Bridge::EngineHost {
public:
    explicit InterleavingHost(TestBridgeServerFixture& fixture) : fixture_(fixture) {}

    Result<std::monostate, Bridge::HostError> applyCommand(
        const Protocol::ClientCommand::Data& command) override
    {
        auto result = fixture_.engine->applyCommand(command);
        fixture_.turn();
        return result;
    }

    std::vector<std::vector<std::string>> reverseLookup(const std::string& translation) const override
    {
        return fixture_.engine->reverseLookup(translation);
    }

    size_t longestKey() const override { return fixture_.engine->longestKey(); }

private:
    TestBridgeServerFixture& fixture_;
};

} // namespace

/**
 * @brief A client that answers the challenge is welcomed and then receives
 * events stamped by the bridge.
 */
TEST(BridgeServerTest, HandshakeThenTranslationIsDelivered)
{
    TestBridgeServerFixture fixture;

    // Execute: Open a socket; the server answers with a challenge.
    auto socket = fixture.open();
    const auto challenges = socket->sentOfType("challenge");
    ASSERT_EQ(challenges.size(), 1u);
    EXPECT_EQ(challenges[0].at("nonce").get<std::string>().size(), 64u);
    EXPECT_EQ(challenges[0].at("expires_in_ms"), 10000);
    EXPECT_EQ(fixture.server->pendingHandshakeCount(), 1u);
    EXPECT_EQ(fixture.server->registry().size(), 0u);

    // Execute: Answer with the right proof.
    fixture.sendText(*socket, Protocol::encodeControl(Protocol::Control::Proof{ fixture.proofFor(*socket) }));

    // Verify: Welcomed and registered.
    const auto welcome = socket->lastSent();
    EXPECT_EQ(welcome.at("type"), "welcome");
    EXPECT_EQ(welcome.at("connection_id"), "conn_1");
    EXPECT_EQ(welcome.at("protocol_version"), 1);
    EXPECT_EQ(fixture.server->registry().size(), 1u);
    EXPECT_EQ(fixture.server->pendingHandshakeCount(), 0u);

    // Execute: Host emits a translation.
    fixture.publish(Protocol::Events::Translation{ .text = "hello" });
    fixture.turn();

    // Verify: Exactly one event with seq 1.
    const auto events = socket->sentOfType("event");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].at("seq"), 1);
    EXPECT_EQ(events[0].at("kind"), "Translation");
    EXPECT_EQ(events[0].at("timestamp"), TestBridgeServerFixture::kWallClockMs);
    EXPECT_EQ(events[0].at("payload"), (nlohmann::json{ { "text", "hello" } }));
}

/**
 * @brief A config change is acknowledged to its sender only, while the state
 * change it causes is broadcast to everyone.
 */
TEST(BridgeServerTest, SetConfigOptionAcksSenderAndBroadcastsChange)
{
    TestBridgeServerFixture fixture;
    auto sender = fixture.connect("127.0.0.1:50001");
    auto observer = fixture.connect("127.0.0.1:50002");

    fixture.sendText(
        *sender,
        R"({"type":"command","kind":"SetConfigOption","correlation_id":"c1",)"
        R"("payload":{"option":"output_enabled","value":false}})");
    EXPECT_EQ(fixture.server->dispatcher().inFlightCount(), 1u);
    fixture.runHost();

    // Verify: Sender gets its ack.
    const auto acks = sender->sentOfType("ack");
    ASSERT_EQ(acks.size(), 1u);
    EXPECT_EQ(acks[0].at("correlation_id"), "c1");
    EXPECT_EQ(acks[0].at("outcome"), "ok");
    EXPECT_FALSE(acks[0].contains("value"));
    EXPECT_TRUE(observer->sentOfType("ack").empty());
    EXPECT_EQ(fixture.server->dispatcher().inFlightCount(), 0u);

    // Verify: Both see the resulting events.
    for (const auto& socket : { sender, observer }) {
        EXPECT_TRUE(hasEvent(*socket, "OutputToggled", { { "enabled", false } }));
        EXPECT_TRUE(hasEvent(
            *socket, "ConfigChanged", { { "option", "output_enabled" }, { "value", false } }));
    }
    EXPECT_FALSE(fixture.engine->outputEnabled());
}

/**
 * @brief Repeated bad proofs from one origin never admit it and eventually
 * lock it out; other origins are unaffected.
 */
TEST(BridgeServerTest, RepeatedBadProofsLockOutOrigin)
{
    TestBridgeServerFixture fixture;

    for (int i = 0; i < 3; ++i) {
        auto socket = fixture.open("10.0.0.9:4000" + std::to_string(i));
        fixture.sendText(
            *socket, Protocol::encodeControl(Protocol::Control::Proof{ std::string(64, '0') }));
        EXPECT_EQ(errorCode(*socket), "InvalidProof");
        EXPECT_FALSE(socket->isOpen());
    }
    EXPECT_EQ(fixture.server->registry().size(), 0u);

    // Verify: The fourth attempt is refused before a challenge is issued.
    auto refused = fixture.open("10.0.0.9:40010");
    EXPECT_TRUE(refused->sentOfType("challenge").empty());
    EXPECT_EQ(errorCode(*refused), "RateLimited");
    EXPECT_FALSE(refused->isOpen());

    // Verify: Another origin still gets in.
    fixture.connect("10.0.0.10:40000");
    EXPECT_EQ(fixture.server->registry().size(), 1u);
}

TEST(BridgeServerTest, NonProofDuringHandshakeIsMissingCredential)
{
    TestBridgeServerFixture fixture;
    auto socket = fixture.open();

    fixture.sendText(*socket, R"({"type":"ping"})");

    EXPECT_EQ(errorCode(*socket), "MissingCredential");
    EXPECT_FALSE(socket->isOpen());
    EXPECT_EQ(fixture.server->registry().size(), 0u);
}

TEST(BridgeServerTest, UnansweredChallengeExpires)
{
    TestBridgeServerFixture fixture;
    auto socket = fixture.open();

    fixture.advance(9s);
    fixture.turn();
    EXPECT_TRUE(socket->isOpen());

    fixture.advance(2s);
    fixture.turn();
    EXPECT_EQ(errorCode(*socket), "ExpiredChallenge");
    EXPECT_FALSE(socket->isOpen());
    EXPECT_EQ(fixture.server->pendingHandshakeCount(), 0u);
}

/**
 * @brief A client that stops reading is closed as Overwhelmed without
 * holding up delivery to the others.
 */
TEST(BridgeServerTest, SlowConsumerIsClosedWithoutStallingOthers)
{
    ServerConfig config;
    config.outboundQueueCapacity = 4;
    TestBridgeServerFixture fixture(config);
    auto slow = fixture.connect("127.0.0.1:50001");
    auto fast = fixture.connect("127.0.0.1:50002");

    // Setup: The slow client's transport is backed up.
    slow->setBufferedAmount(8 * 1024 * 1024);

    for (int i = 0; i < 10; ++i) {
        fixture.publish(Protocol::Events::Translation{ .text = "word" + std::to_string(i) });
        fixture.turn();
    }

    // Verify: The fast client got everything, in order.
    const auto events = fast->sentOfType("event");
    ASSERT_EQ(events.size(), 10u);
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].at("seq"), i + 1);
    }

    // Verify: The slow one is on its way out.
    auto slowConnection = fixture.server->registry().find("conn_1");
    ASSERT_NE(slowConnection, nullptr);
    EXPECT_EQ(slowConnection->state(), ConnectionState::Closing);
    EXPECT_EQ(slowConnection->closeReason(), CloseReason::Overwhelmed);

    // Execute: The grace period runs out.
    fixture.advance(3s);
    fixture.turn();
    EXPECT_EQ(fixture.server->registry().find("conn_1"), nullptr);
    EXPECT_FALSE(slow->isOpen());
    EXPECT_TRUE(slow->sentOfType("event").empty());

    // Verify: The fast client keeps receiving.
    fixture.publish(Protocol::Events::Translation{ .text = "after" });
    fixture.turn();
    EXPECT_EQ(fast->sentOfType("event").size(), 11u);
    EXPECT_TRUE(fast->isOpen());
}

/**
 * @brief stop() with two live connections delivers what is already queued,
 * then closes both and tears down the bridge.
 */
TEST(BridgeServerTest, StopDrainsQueuedEventsThenCloses)
{
    TestBridgeServerFixture fixture;
    auto first = fixture.connect("127.0.0.1:50001");
    auto second = fixture.connect("127.0.0.1:50002");

    fixture.publish(Protocol::Events::Translation{ .text = "bye" });
    fixture.server->requestStop();
    fixture.turn();

    for (const auto& socket : { first, second }) {
        EXPECT_TRUE(hasEvent(*socket, "Translation", { { "text", "bye" } }));
        EXPECT_EQ(errorCode(*socket), "ServerShutdown");
        EXPECT_FALSE(socket->isOpen());
    }
    EXPECT_EQ(fixture.server->lifecycleState(), LifecycleState::Stopped);
    EXPECT_EQ(fixture.server->registry().size(), 0u);
    EXPECT_TRUE(fixture.bridge->isShutdown());

    // Verify: Stopping again is a no-op.
    fixture.server->stop();
    EXPECT_EQ(fixture.server->lifecycleState(), LifecycleState::Stopped);
}

TEST(BridgeServerTest, StopForceClosesConnectionsThatDoNotDrain)
{
    TestBridgeServerFixture fixture;
    auto stuck = fixture.connect();
    stuck->setBufferedAmount(8 * 1024 * 1024);

    fixture.server->requestStop();
    fixture.turn();
    EXPECT_EQ(fixture.server->lifecycleState(), LifecycleState::Draining);
    EXPECT_TRUE(stuck->isOpen());

    fixture.advance(2001ms);
    fixture.turn();
    EXPECT_EQ(fixture.server->lifecycleState(), LifecycleState::Stopped);
    EXPECT_FALSE(stuck->isOpen());
}

TEST(BridgeServerTest, NewSocketsAreRefusedWhileDraining)
{
    TestBridgeServerFixture fixture;
    auto stuck = fixture.connect("127.0.0.1:50001");
    stuck->setBufferedAmount(8 * 1024 * 1024);
    fixture.server->requestStop();
    fixture.turn();

    auto late = fixture.open("127.0.0.1:50002");
    EXPECT_TRUE(late->sentOfType("challenge").empty());
    EXPECT_FALSE(late->isOpen());
}

TEST(BridgeServerTest, SubscriptionFiltersEvents)
{
    TestBridgeServerFixture fixture;
    auto socket = fixture.connect();

    fixture.sendText(
        *socket, R"({"type":"command","kind":"Subscribe","correlation_id":"s1","payload":{"kinds":["Stroke"]}})");
    ASSERT_EQ(socket->sentOfType("ack").size(), 1u);
    EXPECT_EQ(socket->sentOfType("ack")[0].at("outcome"), "ok");

    fixture.publish(Protocol::Events::Translation{ .text = "skipped" });
    fixture.publish(Protocol::Events::Stroke{ .keys = { "S-", "T-" }, .steno = "ST" });
    fixture.turn();

    const auto events = socket->sentOfType("event");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].at("kind"), "Stroke");
    EXPECT_EQ(events[0].at("seq"), 2);

    // Execute: An empty list restores every kind.
    fixture.sendText(*socket, R"({"type":"command","kind":"Subscribe","payload":{"kinds":[]}})");
    fixture.publish(Protocol::Events::Translation{ .text = "seen" });
    fixture.turn();
    EXPECT_EQ(eventKinds(*socket), (std::vector<std::string>{ "Stroke", "Translation" }));
}

TEST(BridgeServerTest, SubscribeToUnknownKindIsInvalidPayload)
{
    TestBridgeServerFixture fixture;
    auto socket = fixture.connect();

    fixture.sendText(
        *socket, R"({"type":"command","kind":"Subscribe","correlation_id":"s2","payload":{"kinds":["Nope"]}})");

    const auto ack = socket->lastSent();
    EXPECT_EQ(ack.at("outcome"), "error");
    EXPECT_EQ(ack.at("error").at("code"), "InvalidPayload");
    EXPECT_TRUE(socket->isOpen());
}

/**
 * @brief Version skew is tolerated; broken framing is not.
 */
TEST(BridgeServerTest, UnknownCommandSurvivesMalformedFrameCloses)
{
    TestBridgeServerFixture fixture;
    auto socket = fixture.connect();

    // Execute: Unknown command kind.
    fixture.sendText(
        *socket, R"({"type":"command","kind":"Frobnicate","correlation_id":"c9","payload":{}})");
    auto ack = socket->lastSent();
    EXPECT_EQ(ack.at("type"), "ack");
    EXPECT_EQ(ack.at("correlation_id"), "c9");
    EXPECT_EQ(ack.at("error").at("code"), "UnsupportedCommand");
    EXPECT_TRUE(socket->isOpen());

    // Execute: Known kind, bad payload, no correlation id.
    fixture.sendText(*socket, R"({"type":"command","kind":"SendBackspaces","payload":{"count":-1}})");
    EXPECT_EQ(errorCode(*socket), "InvalidPayload");
    EXPECT_TRUE(socket->isOpen());
    ASSERT_NE(fixture.server->registry().find("conn_1"), nullptr);
    EXPECT_TRUE(fixture.server->registry().find("conn_1")->isAuthenticated());

    // Execute: Not JSON at all.
    fixture.sendText(*socket, "{not json");
    EXPECT_EQ(errorCode(*socket), "Malformed");
    EXPECT_FALSE(socket->isOpen());
    EXPECT_EQ(fixture.server->registry().size(), 0u);
}

TEST(BridgeServerTest, BinaryFrameClosesConnection)
{
    TestBridgeServerFixture fixture;
    auto socket = fixture.connect();

    fixture.server->onClientBinary(socket->id());
    fixture.turn();

    EXPECT_EQ(errorCode(*socket), "Malformed");
    EXPECT_FALSE(socket->isOpen());
}

TEST(BridgeServerTest, InvalidCommandNeverReachesHost)
{
    TestBridgeServerFixture fixture;
    auto socket = fixture.connect();

    fixture.sendText(
        *socket,
        R"({"type":"command","kind":"SetConfigOption","correlation_id":"c2",)"
        R"("payload":{"option":"undo_levels","value":"many"}})");

    EXPECT_EQ(fixture.server->dispatcher().inFlightCount(), 0u);
    EXPECT_EQ(fixture.bridge->pendingCallCount(), 0u);
    const auto ack = socket->lastSent();
    EXPECT_EQ(ack.at("error").at("code"), "InvalidPayload");
}

/**
 * @brief When the host is gone, only the client that asked hears about it.
 */
TEST(BridgeServerTest, HostUnavailableReachesOnlyTheSender)
{
    TestBridgeServerFixture fixture;
    auto sender = fixture.connect("127.0.0.1:50001");
    auto observer = fixture.connect("127.0.0.1:50002");
    const size_t observerFrames = observer->sent.size();

    fixture.bridge->shutdown();
    fixture.sendText(
        *sender, R"({"type":"command","kind":"SendText","correlation_id":"c3","payload":{"text":"hi"}})");

    const auto ack = sender->lastSent();
    EXPECT_EQ(ack.at("correlation_id"), "c3");
    EXPECT_EQ(ack.at("error").at("code"), "HostUnavailable");
    EXPECT_TRUE(sender->isOpen());
    EXPECT_EQ(observer->sent.size(), observerFrames);
}

TEST(BridgeServerTest, ResultForDepartedClientIsDiscarded)
{
    TestBridgeServerFixture fixture;
    auto socket = fixture.connect();

    fixture.sendText(
        *socket, R"({"type":"command","kind":"SendText","correlation_id":"c4","payload":{"text":"hi"}})");
    fixture.server->onClientClosed(socket->id());
    fixture.turn();
    EXPECT_EQ(fixture.server->registry().size(), 0u);
    const size_t framesBefore = socket->sent.size();

    // Execute: The host still runs the command.
    fixture.runHost();

    EXPECT_EQ(socket->sent.size(), framesBefore);
    EXPECT_EQ(fixture.server->dispatcher().inFlightCount(), 0u);
}

TEST(BridgeServerTest, LookupAckCarriesRankedStrokes)
{
    TestBridgeServerFixture fixture;
    auto dictionary = Host::StenoDictionary::fromJson({ { "HEL/LOW", "hello" }, { "HEFL", "hello" } });
    ASSERT_TRUE(dictionary.isValue());
    fixture.engine->addDictionary(std::move(dictionary.value()));
    auto socket = fixture.connect();

    fixture.sendText(
        *socket, R"({"type":"command","kind":"Lookup","correlation_id":"l1","payload":{"text":"hello"}})");
    fixture.runHost();

    const auto ack = socket->lastSent();
    ASSERT_EQ(ack.at("type"), "ack");
    EXPECT_EQ(ack.at("outcome"), "ok");
    // Verify: The single stroke outline wins over the two stroke one.
    const nlohmann::json expected = nlohmann::json::parse(R"([[{"text":"hello","steno":["HEFL"]}]])");
    EXPECT_EQ(ack.at("value"), expected);
}

TEST(BridgeServerTest, PingIsAnsweredAndKeepsConnectionAlive)
{
    ServerConfig config;
    config.idleTimeoutMs = 1000;
    TestBridgeServerFixture fixture(config);
    auto socket = fixture.connect();

    fixture.advance(600ms);
    fixture.sendText(*socket, "ping");
    EXPECT_EQ(socket->lastSent().at("type"), "pong");

    fixture.advance(600ms);
    fixture.sendText(*socket, R"({"type":"ping"})");
    EXPECT_EQ(socket->lastSent().at("type"), "pong");
    EXPECT_TRUE(socket->isOpen());

    // Execute: Go quiet past the idle limit.
    fixture.advance(1100ms);
    fixture.turn();
    EXPECT_EQ(errorCode(*socket), "IdleTimeout");
    EXPECT_FALSE(socket->isOpen());
    EXPECT_EQ(fixture.server->registry().size(), 0u);
}

TEST(BridgeServerTest, ConnectionLimitCountsPendingHandshakes)
{
    ServerConfig config;
    config.maxConnections = 2;
    TestBridgeServerFixture fixture(config);

    fixture.connect("127.0.0.1:50001");
    auto pending = fixture.open("127.0.0.1:50002");
    EXPECT_EQ(pending->sentOfType("challenge").size(), 1u);

    auto refused = fixture.open("127.0.0.1:50003");
    EXPECT_EQ(errorCode(*refused), "ServerFull");
    EXPECT_FALSE(refused->isOpen());
}

TEST(BridgeServerTest, WrongPathIsRefused)
{
    TestBridgeServerFixture fixture;
    auto socket = fixture.open("127.0.0.1:50001", "/other");

    EXPECT_EQ(errorCode(*socket), "NotFound");
    EXPECT_FALSE(socket->isOpen());
    EXPECT_EQ(fixture.server->pendingHandshakeCount(), 0u);
}

TEST(BridgeServerTest, OriginAllowlistIsEnforcedBeforeChallenge)
{
    ServerConfig config;
    config.allowedOrigins = { "192.168.1.20" };
    TestBridgeServerFixture fixture(config);

    auto stranger = fixture.open("192.168.1.99:40000");
    EXPECT_EQ(errorCode(*stranger), "OriginNotAllowed");
    EXPECT_TRUE(stranger->sentOfType("challenge").empty());

    auto known = fixture.open("192.168.1.20:40000");
    EXPECT_EQ(known->sentOfType("challenge").size(), 1u);
}

TEST(BridgeServerTest, SecondStartIsAnError)
{
    TestBridgeServerFixture fixture;
    auto again = fixture.server->start();
    ASSERT_TRUE(again.isError());
    EXPECT_TRUE(fixture.server->isRunning());
}

/**
 * @brief The sender's ack goes out before the events its command caused, even
 * when the server loop turns while the host is still finishing the call.
 */
TEST(BridgeServerTest, AckPrecedesEventsCausedByTheCommand)
{
    TestBridgeServerFixture fixture;
    auto sender = fixture.connect("127.0.0.1:50001");
    auto observer = fixture.connect("127.0.0.1:50002");
    InterleavingHost host(fixture);

    fixture.sendText(
        *sender,
        R"({"type":"command","kind":"SetConfigOption","correlation_id":"c1",)"
        R"("payload":{"option":"output_enabled","value":false}})");

    // Execute: The loop turns mid-call, then once more after the call.
    fixture.bridge->processHostCalls(host);
    EXPECT_TRUE(sender->sentOfType("event").empty());
    fixture.turn();

    // Verify: Ack first, then the broadcast, for the sender.
    const auto ackIndex = firstFrame(*sender, [](const nlohmann::json& frame) {
        return frame.value("type", "") == "ack" && frame.value("correlation_id", "") == "c1";
    });
    const auto eventIndex = firstFrame(*sender, [](const nlohmann::json& frame) {
        return frame.value("type", "") == "event" && frame.value("kind", "") == "OutputToggled";
    });
    ASSERT_TRUE(ackIndex.has_value());
    ASSERT_TRUE(eventIndex.has_value());
    EXPECT_LT(ackIndex.value(), eventIndex.value());
    EXPECT_TRUE(hasEvent(*observer, "OutputToggled", { { "enabled", false } }));
}

/**
 * @brief A host that throws while applying a command fails that command only;
 * the sender stays connected.
 */
TEST(BridgeServerTest, HostExceptionIsReportedToSenderOnly)
{
    TestBridgeServerFixture fixture;
    auto sender = fixture.connect("127.0.0.1:50001");
    auto observer = fixture.connect("127.0.0.1:50002");
    StenoBridge::Tests::FakeEngineHost host;
    host.throwWith("engine crashed");

    fixture.sendText(*sender, R"({"type":"command","kind":"SendText","correlation_id":"t1","payload":{"text":"x"}})");
    fixture.bridge->processHostCalls(host);
    fixture.turn();

    const auto ack = sender->lastSent();
    ASSERT_EQ(ack.at("type"), "ack");
    EXPECT_EQ(ack.at("outcome"), "error");
    EXPECT_EQ(ack.at("error").at("code"), "HostError");
    EXPECT_TRUE(sender->isOpen());
    EXPECT_TRUE(observer->sentOfType("ack").empty());
    EXPECT_EQ(fixture.server->registry().size(), 2u);
}

/**
 * @brief An exception while serving one connection closes that connection as
 * InternalError; the server and other clients carry on.
 */
TEST(BridgeServerTest, ExceptionServingOneClientClosesOnlyIt)
{
    TestBridgeServerFixture fixture;
    auto broken = fixture.connect("127.0.0.1:50001");
    auto healthy = fixture.connect("127.0.0.1:50002");
    broken->throwOnSend("socket exploded");

    fixture.publish(Protocol::Events::Translation{ .text = "hello" });
    fixture.turn();

    EXPECT_FALSE(broken->isOpen());
    EXPECT_EQ(fixture.server->registry().find("conn_1"), nullptr);
    EXPECT_TRUE(hasEvent(*healthy, "Translation", { { "text", "hello" } }));
    EXPECT_TRUE(fixture.server->isRunning());

    fixture.publish(Protocol::Events::Translation{ .text = "again" });
    fixture.turn();
    EXPECT_TRUE(hasEvent(*healthy, "Translation", { { "text", "again" } }));
}
