#include "RtcClientSocket.h"
#include "core/LoggingChannels.h"

namespace StenoBridge {
namespace Network {

std::string hostFromRemoteAddress(const std::string& remoteAddress)
{
    const auto pos = remoteAddress.rfind(':');
    if (pos == std::string::npos) {
        return remoteAddress;
    }
    std::string host = remoteAddress.substr(0, pos);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return host;
}

RtcClientSocket::RtcClientSocket(SocketId id, std::shared_ptr<rtc::WebSocket> ws)
    : id_(id), ws_(std::move(ws))
{}

Result<std::monostate, std::string> RtcClientSocket::send(const std::string& text)
{
    try {
        if (!ws_->isOpen()) {
            return Result<std::monostate, std::string>::error("socket is not open");
        }
        // A false return only means the frame was buffered by the transport.
        ws_->send(text);
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    catch (const std::exception& e) {
        return Result<std::monostate, std::string>::error(
            std::string("send failed: ") + e.what());
    }
}

void RtcClientSocket::close()
{
    try {
        if (!ws_->isClosed()) {
            ws_->close();
        }
    }
    catch (const std::exception& e) {
        LOG_WARN(Network, "Error closing socket {}: {}", id_, e.what());
    }
}

bool RtcClientSocket::isOpen() const
{
    return ws_->isOpen();
}

size_t RtcClientSocket::bufferedAmount() const
{
    return ws_->bufferedAmount();
}

std::string RtcClientSocket::remoteAddress() const
{
    return ws_->remoteAddress().value_or("");
}

std::string RtcClientSocket::path() const
{
    const std::string full = ws_->path().value_or("/");
    const auto query = full.find('?');
    return query == std::string::npos ? full : full.substr(0, query);
}

void RtcClientSocket::detachCallbacks()
{
    ws_->onOpen([]() {});
    ws_->onClosed([]() {});
    ws_->onError([](const std::string&) {});
    ws_->onMessage([](std::variant<rtc::binary, rtc::string>) {});
}

} // namespace Network
} // namespace StenoBridge
