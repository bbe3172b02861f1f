#pragma once

#include "Connection.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace StenoBridge {
namespace Server {

/**
 * @brief Owns the live connections of one server instance.
 *
 * Callers never keep a Connection across loop turns; they keep its id and
 * look it up again, so a connection closed in between is simply not found.
 */
class ConnectionRegistry {
public:
    // False if a connection with the same id is already registered.
    bool add(std::shared_ptr<Connection> connection);

    std::shared_ptr<Connection> remove(const std::string& id);
    std::shared_ptr<Connection> find(const std::string& id) const;

    // Stable copy for iteration while the registry changes.
    std::vector<std::shared_ptr<Connection>> snapshot() const;

    size_t size() const;
    size_t countInState(ConnectionState state) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;
};

} // namespace Server
} // namespace StenoBridge
