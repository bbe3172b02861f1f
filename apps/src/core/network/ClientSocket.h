#pragma once

#include "core/Result.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace StenoBridge {
namespace Network {

using SocketId = uint64_t;

/**
 * @brief One accepted client connection at the transport level.
 *
 * Allows dependency injection of mock sockets so the server loop can be driven
 * without real networking.
 */
class ClientSocket {
public:
    virtual ~ClientSocket() = default;

    virtual SocketId id() const = 0;

    virtual Result<std::monostate, std::string> send(const std::string& text) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Bytes handed to the transport but not yet written to the network.
    virtual size_t bufferedAmount() const = 0;

    // "host:port" as reported by the transport, empty when unknown.
    virtual std::string remoteAddress() const = 0;

    // Request path without the query string.
    virtual std::string path() const = 0;
};

/**
 * @brief Host part of a "host:port" remote address.
 */
std::string hostFromRemoteAddress(const std::string& remoteAddress);

} // namespace Network
} // namespace StenoBridge
