#include "WebSocketListener.h"
#include "RtcClientSocket.h"
#include "core/LoggingChannels.h"
#include <vector>

namespace StenoBridge {
namespace Network {

WebSocketListener::WebSocketListener(Handlers handlers) : handlers_(std::move(handlers))
{}

WebSocketListener::~WebSocketListener()
{
    stop();
}

Result<std::monostate, std::string> WebSocketListener::listen(const Options& options)
{
    try {
        LOG_INFO(Network, "Starting listener on {}:{}", options.bindAddress, options.port);

        rtc::WebSocketServerConfiguration config;
        config.port = options.port;
        config.bindAddress = options.bindAddress;
        config.maxMessageSize = options.maxMessageSize;
        if (options.certificatePemFile.has_value() && options.keyPemFile.has_value()) {
            config.enableTls = true;
            config.certificatePemFile = options.certificatePemFile;
            config.keyPemFile = options.keyPemFile;
        }
        else {
            config.enableTls = false;
        }

        server_ = std::make_unique<rtc::WebSocketServer>(config);
        server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) { onClientConnected(ws); });

        LOG_INFO(
            Network,
            "Listener started on port {}{}",
            server_->port(),
            config.enableTls ? " (TLS)" : "");
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    catch (const std::exception& e) {
        server_.reset();
        return Result<std::monostate, std::string>::error(
            std::string("Failed to start listener: ") + e.what());
    }
}

void WebSocketListener::stop()
{
    if (!server_) {
        return;
    }

    std::vector<std::shared_ptr<RtcClientSocket>> sockets;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        for (auto& [id, socket] : sockets_) {
            sockets.push_back(socket);
        }
        sockets_.clear();
    }

    for (auto& socket : sockets) {
        socket->detachCallbacks();
        socket->close();
    }

    server_->stop();
    server_.reset();
    LOG_INFO(Network, "Listener stopped");
}

bool WebSocketListener::isListening() const
{
    return server_ != nullptr;
}

uint16_t WebSocketListener::port() const
{
    return server_ ? server_->port() : 0;
}

std::shared_ptr<RtcClientSocket> WebSocketListener::findSocket(SocketId id)
{
    std::lock_guard<std::mutex> lock(socketsMutex_);
    auto it = sockets_.find(id);
    return it == sockets_.end() ? nullptr : it->second;
}

void WebSocketListener::onClientConnected(std::shared_ptr<rtc::WebSocket> ws)
{
    const SocketId id = nextSocketId_++;
    auto socket = std::make_shared<RtcClientSocket>(id, ws);
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        sockets_[id] = socket;
    }

    // Handlers capture the id only; the socket map owns the WebSocket.
    ws->onOpen([this, id]() {
        auto socket = findSocket(id);
        if (!socket) {
            return;
        }
        LOG_DEBUG(Network, "Socket {} opened from {}", id, socket->remoteAddress());
        if (handlers_.onOpen) {
            handlers_.onOpen(socket);
        }
    });

    ws->onMessage([this, id](std::variant<rtc::binary, rtc::string> data) {
        if (std::holds_alternative<rtc::string>(data)) {
            if (handlers_.onText) {
                handlers_.onText(id, std::move(std::get<rtc::string>(data)));
            }
        }
        else if (handlers_.onBinary) {
            handlers_.onBinary(id);
        }
    });

    ws->onClosed([this, id]() {
        LOG_DEBUG(Network, "Socket {} closed", id);
        std::shared_ptr<RtcClientSocket> socket;
        {
            std::lock_guard<std::mutex> lock(socketsMutex_);
            auto it = sockets_.find(id);
            if (it != sockets_.end()) {
                socket = it->second;
                sockets_.erase(it);
            }
        }
        if (handlers_.onClosed) {
            handlers_.onClosed(id);
        }
    });

    ws->onError([id](std::string error) { LOG_WARN(Network, "Socket {} error: {}", id, error); });
}

} // namespace Network
} // namespace StenoBridge
