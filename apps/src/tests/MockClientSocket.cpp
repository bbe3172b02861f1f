#include "MockClientSocket.h"
#include <stdexcept>

namespace StenoBridge::Tests {

MockClientSocket::MockClientSocket(
    Network::SocketId id, std::string remoteAddress, std::string path)
    : id_(id), remoteAddress_(std::move(remoteAddress)), path_(std::move(path))
{}

Result<std::monostate, std::string> MockClientSocket::send(const std::string& text)
{
    if (!open_) {
        return Result<std::monostate, std::string>::error("socket is closed");
    }
    if (!throwMessage_.empty()) {
        throw std::runtime_error(throwMessage_);
    }
    if (failSends_) {
        return Result<std::monostate, std::string>::error("send failed");
    }
    sent.push_back(text);
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

void MockClientSocket::close()
{
    open_ = false;
    ++closeCount_;
}

std::vector<nlohmann::json> MockClientSocket::sentJson() const
{
    std::vector<nlohmann::json> frames;
    for (const auto& text : sent) {
        frames.push_back(nlohmann::json::parse(text));
    }
    return frames;
}

std::vector<nlohmann::json> MockClientSocket::sentOfType(const std::string& type) const
{
    std::vector<nlohmann::json> frames;
    for (auto& frame : sentJson()) {
        if (frame.value("type", "") == type) {
            frames.push_back(std::move(frame));
        }
    }
    return frames;
}

nlohmann::json MockClientSocket::lastSent() const
{
    if (sent.empty()) {
        return nullptr;
    }
    return nlohmann::json::parse(sent.back());
}

} // namespace StenoBridge::Tests
