#include "BridgeServer.h"
#include "auth/CredentialStore.h"
#include "auth/HmacProofVerifier.h"
#include "core/LoggingChannels.h"
#include "core/network/WebSocketListener.h"
#include "protocol/EnvelopeCodec.h"
#include <algorithm>
#include <chrono>
#include <openssl/crypto.h>

namespace StenoBridge {
namespace Server {

const char* toString(LifecycleState state)
{
    switch (state) {
        case LifecycleState::Idle:
            return "Idle";
        case LifecycleState::Running:
            return "Running";
        case LifecycleState::Draining:
            return "Draining";
        case LifecycleState::Stopped:
            return "Stopped";
    }
    return "Unknown";
}

namespace {

Broadcaster::Options broadcasterOptions(const ServerConfig& config)
{
    return Broadcaster::Options{ .socketHighWaterBytes = config.maxMessageBytes,
                                 .closeGrace = std::chrono::milliseconds(config.shutdownGraceMs) };
}

CommandDispatcher::CompletionSink completionSink(const std::shared_ptr<EventQueue>& queue)
{
    // Completions can arrive after the server is gone; the queue outlives it.
    return [queue](CommandCompletion completion) {
        postEvent(queue, LoopEvents::CommandCompleted{ std::move(completion) });
    };
}

std::string connectionIdFor(Network::SocketId socketId)
{
    return "conn_" + std::to_string(socketId);
}

} // namespace

BridgeServer::BridgeServer(ServerConfig config, std::shared_ptr<Bridge::EngineBridge> bridge)
    : config_(std::move(config)),
      bridge_(std::move(bridge)),
      broadcaster_(registry_, broadcasterOptions(config_)),
      dispatcher_(registry_, broadcaster_, *bridge_, completionSink(eventProcessor_.eventQueue))
{
    deps_.now = []() { return Clock::now(); };
}

BridgeServer::BridgeServer(
    ServerConfig config, std::shared_ptr<Bridge::EngineBridge> bridge, TestMode testMode)
    : config_(std::move(config)),
      bridge_(std::move(bridge)),
      deps_(std::move(testMode.dependencies)),
      enableNetworking_(false),
      verifier_(std::move(testMode.verifier)),
      broadcaster_(registry_, broadcasterOptions(config_)),
      dispatcher_(registry_, broadcaster_, *bridge_, completionSink(eventProcessor_.eventQueue))
{
    if (!deps_.now) {
        deps_.now = []() { return Clock::now(); };
    }
}

BridgeServer::~BridgeServer()
{
    stop();
}

Result<std::monostate, std::string> BridgeServer::start()
{
    using R = Result<std::monostate, std::string>;
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (state_ != LifecycleState::Idle) {
        return R::error(std::string("Server cannot start from state ") + toString(state_.load()));
    }

    auto valid = config_.validate();
    if (valid.isError()) {
        return R::error("Invalid server config: " + valid.errorValue());
    }

    if (enableNetworking_) {
        auto key = Auth::CredentialStore::loadOrCreate(config_.credentialPath, config_.generateCredential);
        if (key.isError()) {
            return R::error(key.errorValue());
        }
        verifier_ = std::make_shared<Auth::HmacProofVerifier>(key.value());
        OPENSSL_cleanse(key.value().data(), key.value().size());
    }
    if (!verifier_) {
        return R::error("No proof verifier configured");
    }

    authGate_ = std::make_unique<Auth::AuthGate>(
        Auth::AuthGateConfig{
            .challengeTimeout = std::chrono::milliseconds(config_.challengeTimeoutMs),
            .maxFailures = config_.authMaxFailures,
            .failureWindow = std::chrono::milliseconds(config_.authFailureWindowMs),
            .lockout = std::chrono::milliseconds(config_.authLockoutMs) },
        verifier_,
        Auth::AuthGate::Dependencies{ .now = deps_.now, .randomBytes = deps_.randomBytes });

    if (enableNetworking_) {
        listener_ = std::make_unique<Network::WebSocketListener>(Network::WebSocketListener::Handlers{
            .onOpen = [this](std::shared_ptr<Network::ClientSocket> socket) { acceptClient(std::move(socket)); },
            .onText = [this](Network::SocketId id, std::string text) { onClientText(id, std::move(text)); },
            .onBinary = [this](Network::SocketId id) { onClientBinary(id); },
            .onClosed = [this](Network::SocketId id) { onClientClosed(id); },
        });

        Network::WebSocketListener::Options options;
        options.bindAddress = config_.host;
        options.port = config_.port;
        options.maxMessageSize = config_.maxMessageBytes;
        if (config_.tls.has_value()) {
            options.certificatePemFile = config_.tls->certPath;
            options.keyPemFile = config_.tls->keyPath;
        }

        auto listening = listener_->listen(options);
        if (listening.isError()) {
            listener_.reset();
            return R::error(listening.errorValue());
        }
    }

    state_ = LifecycleState::Running;
    LOG_INFO(
        State,
        "Bridge server running on {}:{}{}{}",
        config_.host,
        port(),
        config_.path,
        enableNetworking_ ? "" : " (test mode)");

    if (enableNetworking_) {
        loopThread_ = std::thread([this]() { mainLoopRun(); });
    }
    return R::okay(std::monostate{});
}

void BridgeServer::stop()
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (state_ == LifecycleState::Idle) {
        state_ = LifecycleState::Stopped;
        return;
    }
    if (state_ == LifecycleState::Stopped) {
        return;
    }

    requestStop();
    if (loopThread_.joinable()) {
        loopThread_.join();
    }
    else {
        processEvents();
        if (state_ != LifecycleState::Stopped) {
            finishShutdown();
        }
    }
}

void BridgeServer::requestStop()
{
    eventProcessor_.enqueueEvent(LoopEvents::ShutdownRequested{});
}

bool BridgeServer::isRunning() const
{
    const auto state = state_.load();
    return state == LifecycleState::Running || state == LifecycleState::Draining;
}

uint16_t BridgeServer::port() const
{
    return listener_ ? listener_->port() : config_.port;
}

void BridgeServer::acceptClient(std::shared_ptr<Network::ClientSocket> socket)
{
    eventProcessor_.enqueueEvent(LoopEvents::ClientOpened{ std::move(socket) });
}

void BridgeServer::onClientText(Network::SocketId socketId, std::string text)
{
    eventProcessor_.enqueueEvent(LoopEvents::ClientText{ socketId, std::move(text) });
}

void BridgeServer::onClientBinary(Network::SocketId socketId)
{
    eventProcessor_.enqueueEvent(LoopEvents::ClientBinary{ socketId });
}

void BridgeServer::onClientClosed(Network::SocketId socketId)
{
    eventProcessor_.enqueueEvent(LoopEvents::ClientClosed{ socketId });
}

void BridgeServer::mainLoopRun()
{
    LOG_DEBUG(State, "Server loop started");
    while (isRunning()) {
        processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    LOG_DEBUG(State, "Server loop finished");
}

void BridgeServer::processEvents()
{
    // Drain first: events a host call caused only become drainable after its
    // completion is queued, so the caller's ack is queued before them.
    takePublishedEvents();
    eventProcessor_.processEventsFromQueue(*this);
    if (!isRunning()) {
        return;
    }

    const auto now = deps_.now();
    if (state_ == LifecycleState::Running) {
        broadcastPublished(now);
    }

    checkTimeouts(now);

    for (const auto& closed : broadcaster_.flush(now)) {
        connectionIds_.erase(closed->socketId());
    }

    if (state_ == LifecycleState::Draining && (registry_.size() == 0 || now >= drainDeadline_)) {
        finishShutdown();
    }
}

void BridgeServer::takePublishedEvents()
{
    auto drained = bridge_->drainEvents();
    published_.insert(
        published_.end(), std::make_move_iterator(drained.begin()), std::make_move_iterator(drained.end()));
}

void BridgeServer::broadcastPublished(Clock::time_point now)
{
    auto events = std::move(published_);
    published_.clear();
    broadcaster_.broadcast(events, now);
}

void BridgeServer::handleEvent(const Event& event)
{
    if (!isRunning()) {
        // Late socket callbacks after shutdown.
        if (const auto* opened = std::get_if<LoopEvents::ClientOpened>(&event.getVariant())) {
            opened->socket->close();
        }
        return;
    }
    std::visit([this](auto&& e) { handle(e); }, event.getVariant());
}

void BridgeServer::handle(const LoopEvents::ClientOpened& event)
{
    auto& socket = *event.socket;
    const auto socketId = socket.id();

    if (state_ != LifecycleState::Running) {
        refuse(socket, "ServerShutdown", "server is stopping");
        return;
    }
    if (socket.path() != config_.path) {
        LOG_INFO(Network, "Socket {} asked for unknown path '{}'", socketId, socket.path());
        refuse(socket, "NotFound", "no endpoint at " + socket.path());
        return;
    }

    const std::string origin = Network::hostFromRemoteAddress(socket.remoteAddress());
    if (!isOriginAllowed(origin)) {
        LOG_WARN(Network, "Refusing socket {} from {}: origin not allowed", socketId, origin);
        refuse(socket, "OriginNotAllowed", "origin is not allowed");
        return;
    }
    if (registry_.size() + pending_.size() >= config_.maxConnections) {
        LOG_WARN(Network, "Refusing socket {} from {}: server full", socketId, origin);
        refuse(socket, "ServerFull", "too many connections");
        return;
    }

    auto challenge = authGate_->issueChallenge(origin);
    if (challenge.isError()) {
        refuse(socket, Auth::toString(challenge.errorValue().kind), challenge.errorValue().message);
        return;
    }

    auto sent = socket.send(Protocol::encodeControl(Protocol::Control::Challenge{
        .nonce = challenge.value().nonce, .expiresInMs = config_.challengeTimeoutMs }));
    if (sent.isError()) {
        LOG_WARN(Network, "Could not send challenge to socket {}: {}", socketId, sent.errorValue());
        socket.close();
        return;
    }

    LOG_DEBUG(Network, "Socket {} from {} challenged", socketId, origin);
    pending_[socketId] = PendingHandshake{ .socket = event.socket, .challenge = challenge.value() };
}

void BridgeServer::handle(const LoopEvents::ClientText& event)
{
    if (auto it = pending_.find(event.socketId); it != pending_.end()) {
        const PendingHandshake pending = std::move(it->second);
        pending_.erase(it);

        std::optional<std::string> proof;
        auto decoded = Protocol::decodeInbound(event.text);
        if (decoded.isValue()) {
            if (const auto* control = std::get_if<Protocol::ControlMessage>(&decoded.value())) {
                if (const auto* answer = std::get_if<Protocol::Control::Proof>(control)) {
                    proof = answer->response;
                }
            }
        }
        finishHandshake(pending, proof);
        return;
    }

    auto connection = findBySocket(event.socketId);
    if (!connection || !connection->isAuthenticated()) {
        LOG_DEBUG(Network, "Ignoring text from socket {} outside an open connection", event.socketId);
        return;
    }

    try {
        handleConnectionText(*connection, event.text);
    }
    catch (const std::exception& e) {
        LOG_ERROR(State, "Error handling frame from {}: {}", connection->id(), e.what());
        connection->beginClosing(CloseReason::InternalError, deps_.now(), false);
    }
}

void BridgeServer::handle(const LoopEvents::ClientBinary& event)
{
    if (auto it = pending_.find(event.socketId); it != pending_.end()) {
        const PendingHandshake pending = std::move(it->second);
        pending_.erase(it);
        finishHandshake(pending, std::nullopt);
        return;
    }

    auto connection = findBySocket(event.socketId);
    if (connection && connection->isAuthenticated()) {
        dispatcher_.handleDecodeError(
            *connection,
            Protocol::DecodeError{ .kind = Protocol::DecodeError::Kind::Malformed,
                                   .message = "binary frames are not supported",
                                   .correlationId = std::nullopt,
                                   .commandKind = {} },
            deps_.now());
    }
}

void BridgeServer::handle(const LoopEvents::ClientClosed& event)
{
    if (pending_.erase(event.socketId) > 0) {
        LOG_DEBUG(Network, "Socket {} closed during the handshake", event.socketId);
        return;
    }

    auto connection = findBySocket(event.socketId);
    connectionIds_.erase(event.socketId);
    if (!connection) {
        return;
    }
    connection->beginClosing(CloseReason::ClientDisconnect, deps_.now(), true);
    connection->markClosed();
    registry_.remove(connection->id());
    LOG_INFO(Network, "{} disconnected", connection->id());
}

void BridgeServer::handle(const LoopEvents::CommandCompleted& event)
{
    dispatcher_.complete(event.completion, deps_.now());
}

void BridgeServer::handle(const LoopEvents::ShutdownRequested& /*event*/)
{
    beginShutdown(deps_.now());
}

void BridgeServer::finishHandshake(
    const PendingHandshake& pending, const std::optional<std::string>& proof)
{
    auto& socket = *pending.socket;
    auto identity = authGate_->authenticate(pending.challenge, proof, pending.challenge.origin);
    if (identity.isError()) {
        refuse(socket, Auth::toString(identity.errorValue().kind), identity.errorValue().message);
        return;
    }

    const auto now = deps_.now();
    auto connection = std::make_shared<Connection>(
        connectionIdFor(socket.id()),
        pending.socket,
        identity.value(),
        config_.outboundQueueCapacity,
        now);
    connection->markAuthenticated();
    if (!registry_.add(connection)) {
        refuse(socket, "Internal", "duplicate connection id");
        return;
    }
    connectionIds_[socket.id()] = connection->id();

    broadcaster_.sendControl(
        *connection,
        Protocol::Control::Welcome{ .connectionId = connection->id(),
                                    .protocolVersion = Protocol::kProtocolVersion },
        now);
    LOG_INFO(Network, "{} connected from {}", connection->id(), identity.value().origin);
}

void BridgeServer::handleConnectionText(Connection& connection, const std::string& text)
{
    const auto now = deps_.now();
    connection.markActivity(now);

    if (text == "ping") {
        broadcaster_.sendControl(connection, Protocol::Control::Pong{}, now);
        return;
    }

    auto decoded = Protocol::decodeInbound(text);
    if (decoded.isError()) {
        dispatcher_.handleDecodeError(connection, decoded.errorValue(), now);
        return;
    }

    if (const auto* command = std::get_if<Protocol::ClientCommand>(&decoded.value())) {
        dispatcher_.handle(connection, *command, now);
        return;
    }

    const auto& control = std::get<Protocol::ControlMessage>(decoded.value());
    if (std::holds_alternative<Protocol::Control::Ping>(control)) {
        broadcaster_.sendControl(connection, Protocol::Control::Pong{}, now);
    }
    else if (std::holds_alternative<Protocol::Control::Proof>(control)) {
        dispatcher_.handleDecodeError(
            connection,
            Protocol::DecodeError{ .kind = Protocol::DecodeError::Kind::Malformed,
                                   .message = "handshake already completed",
                                   .correlationId = std::nullopt,
                                   .commandKind = {} },
            now);
    }
}

std::shared_ptr<Connection> BridgeServer::findBySocket(Network::SocketId socketId) const
{
    auto it = connectionIds_.find(socketId);
    if (it == connectionIds_.end()) {
        return nullptr;
    }
    return registry_.find(it->second);
}

void BridgeServer::refuse(
    Network::ClientSocket& socket, const std::string& code, const std::string& message)
{
    auto sent = socket.send(
        Protocol::encodeControl(Protocol::Control::Error{ .code = code, .message = message }));
    if (sent.isError()) {
        LOG_DEBUG(Network, "Could not tell socket {} about {}: {}", socket.id(), code, sent.errorValue());
    }
    socket.close();
}

bool BridgeServer::isOriginAllowed(const std::string& origin) const
{
    if (config_.allowedOrigins.empty()) {
        return true;
    }
    return std::find(config_.allowedOrigins.begin(), config_.allowedOrigins.end(), origin)
        != config_.allowedOrigins.end();
}

void BridgeServer::checkTimeouts(Clock::time_point now)
{
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (now > it->second.challenge.expiresAt) {
            const PendingHandshake pending = std::move(it->second);
            it = pending_.erase(it);
            finishHandshake(pending, std::nullopt);
        }
        else {
            ++it;
        }
    }

    if (config_.idleTimeoutMs == 0) {
        return;
    }
    const auto idleLimit = std::chrono::milliseconds(config_.idleTimeoutMs);
    for (const auto& connection : registry_.snapshot()) {
        if (connection->isAuthenticated() && now - connection->lastActivity() > idleLimit) {
            LOG_INFO(Network, "{} idle for more than {} ms", connection->id(), config_.idleTimeoutMs);
            broadcaster_.closeWithError(
                *connection, CloseReason::IdleTimeout, "IdleTimeout", "no traffic received", now);
        }
    }
}

void BridgeServer::beginShutdown(Clock::time_point now)
{
    if (state_ != LifecycleState::Running) {
        return;
    }
    state_ = LifecycleState::Draining;
    drainDeadline_ = now + std::chrono::milliseconds(config_.shutdownGraceMs);
    LOG_INFO(
        State,
        "Stopping: draining {} connections for up to {} ms",
        registry_.size(),
        config_.shutdownGraceMs);

    // Events published before the stop still go out.
    takePublishedEvents();
    broadcastPublished(now);

    for (auto& [socketId, pending] : pending_) {
        refuse(*pending.socket, "ServerShutdown", "server is stopping");
    }
    pending_.clear();

    for (const auto& connection : registry_.snapshot()) {
        broadcaster_.closeWithError(
            *connection, CloseReason::ServerShutdown, "ServerShutdown", "server is stopping", now);
    }
}

void BridgeServer::finishShutdown()
{
    size_t forced = 0;
    for (const auto& connection : registry_.snapshot()) {
        if (connection->hasQueued()) {
            ++forced;
        }
        connection->beginClosing(CloseReason::ServerShutdown, deps_.now(), true);
        connection->socket().close();
        connection->markClosed();
        registry_.remove(connection->id());
    }
    connectionIds_.clear();

    for (auto& [socketId, pending] : pending_) {
        pending.socket->close();
    }
    pending_.clear();

    if (listener_) {
        listener_->stop();
    }
    published_.clear();
    bridge_->shutdown();
    state_ = LifecycleState::Stopped;

    if (forced > 0) {
        LOG_WARN(State, "Force-closed {} connections that did not drain in time", forced);
    }
    LOG_INFO(State, "Bridge server stopped");
}

} // namespace Server
} // namespace StenoBridge
