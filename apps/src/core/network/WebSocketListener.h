#pragma once

#include "ClientSocket.h"
#include "core/Result.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <rtc/rtc.hpp>
#include <string>
#include <unordered_map>

namespace StenoBridge {
namespace Network {

class RtcClientSocket;

/**
 * @brief Accepts WebSocket connections with libdatachannel and reports socket
 * activity through handlers.
 *
 * Handlers run on libdatachannel's threads and must only hand work off to the
 * owner's own loop.
 */
class WebSocketListener {
public:
    struct Options {
        std::string bindAddress = "127.0.0.1";
        uint16_t port = 0;
        std::optional<std::string> certificatePemFile;
        std::optional<std::string> keyPemFile;
        size_t maxMessageSize = 1024 * 1024;
    };

    struct Handlers {
        std::function<void(std::shared_ptr<ClientSocket>)> onOpen;
        std::function<void(SocketId, std::string)> onText;
        std::function<void(SocketId)> onBinary;
        std::function<void(SocketId)> onClosed;
    };

    explicit WebSocketListener(Handlers handlers);
    ~WebSocketListener();

    WebSocketListener(const WebSocketListener&) = delete;
    WebSocketListener& operator=(const WebSocketListener&) = delete;

    Result<std::monostate, std::string> listen(const Options& options);

    // Stops accepting and detaches every socket still known to the listener.
    void stop();

    bool isListening() const;
    uint16_t port() const;

private:
    void onClientConnected(std::shared_ptr<rtc::WebSocket> ws);
    std::shared_ptr<RtcClientSocket> findSocket(SocketId id);

    Handlers handlers_;
    std::unique_ptr<rtc::WebSocketServer> server_;
    std::atomic<SocketId> nextSocketId_{ 1 };

    mutable std::mutex socketsMutex_;
    std::unordered_map<SocketId, std::shared_ptr<RtcClientSocket>> sockets_;
};

} // namespace Network
} // namespace StenoBridge
