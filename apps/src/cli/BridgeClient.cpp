#include "BridgeClient.h"
#include "auth/HmacProofVerifier.h"
#include "core/LoggingChannels.h"
#include "protocol/EnvelopeCodec.h"
#include <chrono>
#include <openssl/crypto.h>
#include <rtc/rtc.hpp>

namespace StenoBridge {
namespace Client {

BridgeClient::BridgeClient(std::vector<uint8_t> key) : key_(std::move(key))
{}

BridgeClient::~BridgeClient()
{
    disconnect();
    OPENSSL_cleanse(key_.data(), key_.size());
}

Result<std::string, std::string> BridgeClient::connect(const std::string& url, int timeoutMs)
{
    using R = Result<std::string, std::string>;

    disconnect();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handshake_ = HandshakeState::AwaitingChallenge;
        connectionId_.clear();
        lastError_.clear();
        closed_ = false;
    }

    try {
        LOG_INFO(Network, "Connecting to {}", url);

        rtc::WebSocketConfiguration config;
        ws_ = std::make_shared<rtc::WebSocket>(config);

        ws_->onMessage([this](std::variant<rtc::binary, rtc::string> data) {
            if (std::holds_alternative<rtc::string>(data)) {
                handleText(std::get<rtc::string>(data));
            }
            else {
                LOG_WARN(Network, "Ignoring binary frame from server");
            }
        });

        ws_->onClosed([this]() {
            DisconnectCallback callback;
            std::string reason;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
                if (handshake_ != HandshakeState::Ready && handshake_ != HandshakeState::Failed) {
                    handshake_ = HandshakeState::Failed;
                    if (lastError_.empty()) {
                        lastError_ = "connection closed during handshake";
                    }
                }
                reason = lastError_.empty() ? "connection closed" : lastError_;
                callback = disconnectCallback_;
            }
            cv_.notify_all();
            LOG_DEBUG(Network, "Connection closed: {}", reason);
            if (callback) {
                callback(reason);
            }
        });

        ws_->onError([this](std::string error) {
            LOG_ERROR(Network, "WebSocket error: {}", error);
            failHandshake(error);
        });

        ws_->open(url);
    }
    catch (const std::exception& e) {
        return R::error(std::string("Connection error: ") + e.what());
    }

    std::unique_lock<std::mutex> lock(mutex_);
    const bool settled = cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this]() {
        return handshake_ == HandshakeState::Ready || handshake_ == HandshakeState::Failed;
    });
    if (!settled) {
        lock.unlock();
        disconnect();
        return R::error("Handshake timeout");
    }
    if (handshake_ == HandshakeState::Failed) {
        const std::string reason = lastError_;
        lock.unlock();
        disconnect();
        return R::error(reason);
    }

    LOG_INFO(Network, "Connected to {} as {}", url, connectionId_);
    return R::okay(connectionId_);
}

void BridgeClient::disconnect()
{
    if (ws_) {
        ws_->onClosed([]() {});
        ws_->onError([](const std::string&) {});
        ws_->onMessage([](std::variant<rtc::binary, rtc::string>) {});
        if (!ws_->isClosed()) {
            ws_->close();
        }
        ws_.reset();
    }
}

bool BridgeClient::isConnected() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ws_ && ws_->isOpen() && handshake_ == HandshakeState::Ready && !closed_;
}

void BridgeClient::onEvent(EventCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    eventCallback_ = std::move(callback);
}

void BridgeClient::onDisconnected(DisconnectCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    disconnectCallback_ = std::move(callback);
}

void BridgeClient::onAck(AckCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ackCallback_ = std::move(callback);
}

Result<Protocol::Control::Ack, std::string> BridgeClient::sendCommand(
    Protocol::ClientCommand::Data command, int timeoutMs)
{
    using R = Result<Protocol::Control::Ack, std::string>;

    const std::string correlationId = "c" + std::to_string(nextCorrelationId_.fetch_add(1));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingAcks_[correlationId] = std::nullopt;
    }

    auto sent = sendText(Protocol::encodeCommand(
        Protocol::ClientCommand{ .correlationId = correlationId, .data = std::move(command) }));
    if (sent.isError()) {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingAcks_.erase(correlationId);
        return R::error(sent.errorValue());
    }

    std::unique_lock<std::mutex> lock(mutex_);
    const bool answered = cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs), [&]() {
        return closed_ || pendingAcks_[correlationId].has_value();
    });
    auto ack = std::move(pendingAcks_[correlationId]);
    pendingAcks_.erase(correlationId);

    if (ack.has_value()) {
        return R::okay(std::move(ack.value()));
    }
    if (!answered) {
        return R::error("Timed out waiting for ack " + correlationId);
    }
    return R::error(lastError_.empty() ? "Connection closed" : lastError_);
}

Result<std::monostate, std::string> BridgeClient::sendText(const std::string& text)
{
    if (!ws_ || !ws_->isOpen()) {
        return Result<std::monostate, std::string>::error("Not connected");
    }
    try {
        ws_->send(text);
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    catch (const std::exception& e) {
        return Result<std::monostate, std::string>::error(std::string("Send failed: ") + e.what());
    }
}

Result<std::monostate, std::string> BridgeClient::ping()
{
    return sendText(Protocol::encodeControl(Protocol::Control::Ping{}));
}

std::string BridgeClient::connectionId() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connectionId_;
}

void BridgeClient::handleText(const std::string& text)
{
    auto decoded = Protocol::decodeOutbound(text);
    if (decoded.isError()) {
        LOG_WARN(Protocol, "Undecodable frame from server: {}", decoded.errorValue().message);
        return;
    }

    if (const auto* event = std::get_if<Protocol::EngineEvent>(&decoded.value())) {
        EventCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = eventCallback_;
        }
        if (callback) {
            callback(*event);
        }
        return;
    }

    handleControl(std::get<Protocol::ControlMessage>(decoded.value()));
}

void BridgeClient::handleControl(const Protocol::ControlMessage& message)
{
    if (const auto* challenge = std::get_if<Protocol::Control::Challenge>(&message)) {
        auto proof = Auth::HmacProofVerifier::computeProof(key_, challenge->nonce);
        if (proof.isError()) {
            failHandshake(proof.errorValue());
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handshake_ = HandshakeState::AwaitingWelcome;
        }
        auto sent = sendText(Protocol::encodeControl(Protocol::Control::Proof{ proof.value() }));
        if (sent.isError()) {
            failHandshake(sent.errorValue());
        }
        return;
    }

    if (const auto* welcome = std::get_if<Protocol::Control::Welcome>(&message)) {
        if (welcome->protocolVersion != Protocol::kProtocolVersion) {
            LOG_WARN(
                Protocol,
                "Server speaks protocol {}, client speaks {}",
                welcome->protocolVersion,
                Protocol::kProtocolVersion);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connectionId_ = welcome->connectionId;
            handshake_ = HandshakeState::Ready;
        }
        cv_.notify_all();
        return;
    }

    if (const auto* ack = std::get_if<Protocol::Control::Ack>(&message)) {
        AckCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = ackCallback_;
        }
        if (callback) {
            callback(*ack);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pendingAcks_.find(ack->correlationId);
            if (it == pendingAcks_.end()) {
                LOG_DEBUG(Protocol, "Ack for unknown correlation id {}", ack->correlationId);
                return;
            }
            it->second = *ack;
        }
        cv_.notify_all();
        return;
    }

    if (std::holds_alternative<Protocol::Control::Pong>(message)) {
        LOG_TRACE(Network, "Pong from server");
        return;
    }

    if (const auto* error = std::get_if<Protocol::Control::Error>(&message)) {
        LOG_WARN(Protocol, "Server error {}: {}", error->code, error->message);
        failHandshake(error->code + ": " + error->message);
        return;
    }
}

void BridgeClient::failHandshake(std::string reason)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = std::move(reason);
        if (handshake_ != HandshakeState::Ready) {
            handshake_ = HandshakeState::Failed;
        }
    }
    cv_.notify_all();
}

} // namespace Client
} // namespace StenoBridge
