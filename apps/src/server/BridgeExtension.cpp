#include "BridgeExtension.h"
#include "core/LoggingChannels.h"

namespace StenoBridge {
namespace Server {

BridgeExtension::BridgeExtension(ServerConfig config)
    : config_(std::move(config)),
      bridge_(std::make_shared<Bridge::EngineBridge>(config_.eventBufferCapacity))
{}

BridgeExtension::~BridgeExtension()
{
    stop();
}

Result<std::monostate, std::string> BridgeExtension::start()
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (server_ && server_->isRunning()) {
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }

    if (bridge_->isShutdown()) {
        bridge_ = std::make_shared<Bridge::EngineBridge>(config_.eventBufferCapacity);
    }
    auto server = std::make_unique<BridgeServer>(config_, bridge_);
    lock.unlock();

    auto started = server->start();
    if (started.isError()) {
        LOG_ERROR(State, "Bridge failed to start: {}", started.errorValue());
        return started;
    }

    lock.lock();
    server_ = std::move(server);
    return started;
}

void BridgeExtension::stop()
{
    std::unique_ptr<BridgeServer> server;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = std::move(server_);
    }
    if (server) {
        server->stop();
    }
}

void BridgeExtension::onEngineEvent(Protocol::EngineEvent::Data event)
{
    currentBridge()->publish(std::move(event));
}

size_t BridgeExtension::processHostCalls(Bridge::EngineHost& host)
{
    return currentBridge()->processHostCalls(host);
}

bool BridgeExtension::isRunning() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return server_ && server_->isRunning();
}

uint16_t BridgeExtension::port() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return server_ ? server_->port() : config_.port;
}

std::shared_ptr<Bridge::EngineBridge> BridgeExtension::currentBridge() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return bridge_;
}

} // namespace Server
} // namespace StenoBridge
