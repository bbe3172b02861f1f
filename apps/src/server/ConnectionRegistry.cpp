#include "ConnectionRegistry.h"
#include "core/LoggingChannels.h"

namespace StenoBridge {
namespace Server {

bool ConnectionRegistry::add(std::shared_ptr<Connection> connection)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = connection->id();
    const bool inserted = connections_.emplace(id, std::move(connection)).second;
    if (!inserted) {
        LOG_ERROR(State, "Connection {} is already registered", id);
    }
    return inserted;
}

std::shared_ptr<Connection> ConnectionRegistry::remove(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return nullptr;
    }
    auto connection = std::move(it->second);
    connections_.erase(it);
    return connection;
}

std::shared_ptr<Connection> ConnectionRegistry::find(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Connection>> ConnectionRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Connection>> result;
    result.reserve(connections_.size());
    for (const auto& [id, connection] : connections_) {
        result.push_back(connection);
    }
    return result;
}

size_t ConnectionRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

size_t ConnectionRegistry::countInState(ConnectionState state) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, connection] : connections_) {
        if (connection->state() == state) {
            ++count;
        }
    }
    return count;
}

} // namespace Server
} // namespace StenoBridge
