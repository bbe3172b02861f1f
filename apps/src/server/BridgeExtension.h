#pragma once

#include "BridgeServer.h"
#include "ServerConfig.h"
#include "bridge/EngineBridge.h"
#include "bridge/EngineHost.h"
#include "core/Result.h"
#include "protocol/EngineEvent.h"
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace StenoBridge {
namespace Server {

/**
 * @brief What a stenography engine sees of the bridge.
 *
 * The host calls every method from its own thread. Events reported before
 * start() wait in the bridge (up to its capacity) and are broadcast on the
 * server's first turn, so only clients already connected by then see them.
 * After stop() a later start() begins with a fresh bridge.
 */
class BridgeExtension {
public:
    explicit BridgeExtension(ServerConfig config);
    ~BridgeExtension();

    BridgeExtension(const BridgeExtension&) = delete;
    BridgeExtension& operator=(const BridgeExtension&) = delete;

    Result<std::monostate, std::string> start();
    void stop();

    void onEngineEvent(Protocol::EngineEvent::Data event);

    // Runs commands queued by clients. Call from the host loop.
    size_t processHostCalls(Bridge::EngineHost& host);

    bool isRunning() const;

    // Port actually bound; useful when the config asks for port 0.
    uint16_t port() const;

private:
    std::shared_ptr<Bridge::EngineBridge> currentBridge() const;

    ServerConfig config_;
    mutable std::mutex mutex_;
    std::shared_ptr<Bridge::EngineBridge> bridge_;
    std::unique_ptr<BridgeServer> server_;
};

} // namespace Server
} // namespace StenoBridge
