#pragma once

#include "ClientSocket.h"
#include <memory>
#include <rtc/rtc.hpp>

namespace StenoBridge {
namespace Network {

/**
 * @brief ClientSocket backed by a libdatachannel WebSocket accepted by the listener.
 */
class RtcClientSocket : public ClientSocket {
public:
    RtcClientSocket(SocketId id, std::shared_ptr<rtc::WebSocket> ws);

    SocketId id() const override { return id_; }

    Result<std::monostate, std::string> send(const std::string& text) override;
    void close() override;
    bool isOpen() const override;
    size_t bufferedAmount() const override;
    std::string remoteAddress() const override;
    std::string path() const override;

    // Drops the handlers installed by the listener so no callback outlives it.
    void detachCallbacks();

private:
    SocketId id_;
    std::shared_ptr<rtc::WebSocket> ws_;
};

} // namespace Network
} // namespace StenoBridge
