#pragma once

#include "EngineHost.h"
#include "HostError.h"
#include "core/CommandWithCallback.h"
#include "core/Result.h"
#include "protocol/ClientCommand.h"
#include "protocol/EngineEvent.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace StenoBridge {
namespace Bridge {

struct HostRequest {
    std::string connectionId;
    Protocol::ClientCommand command;
};

// Null JSON on success means the command has no result value.
using HostResponse = Result<nlohmann::json, HostError>;

using HostCall = CommandWithCallback<HostRequest, HostResponse>;

/**
 * @brief Hands events and commands across the boundary between the host's
 * execution context and the server loop.
 *
 * Host side: publish() stamps and buffers an event and returns at once;
 * processHostCalls() runs queued commands on the host's own turn.
 * Server side: drainEvents() takes buffered events; submit() queues a command
 * whose callback fires once the host has run it or can no longer run it.
 *
 * Events are buffered up to a fixed capacity. Past it the oldest event is
 * dropped and the loss is logged. Calls are applied in submission order, one
 * at a time.
 *
 * Events published while a call runs are held back from drainEvents() until
 * the call's callback has returned, so a server that drains before handling
 * its completions answers the caller before broadcasting what the call caused.
 */
class EngineBridge {
public:
    struct Dependencies {
        // Milliseconds since the Unix epoch, used to timestamp events.
        std::function<int64_t()> wallClockMs;
    };

    explicit EngineBridge(size_t eventCapacity, Dependencies deps = {});

    EngineBridge(const EngineBridge&) = delete;
    EngineBridge& operator=(const EngineBridge&) = delete;

    // Host side.
    void publish(Protocol::EngineEvent::Data data);
    size_t processHostCalls(EngineHost& host);

    // Server side.
    std::vector<Protocol::EngineEvent> drainEvents();
    void submit(HostCall call);

    /**
     * @brief Fails queued and future calls with HostUnavailable and turns
     * publish() into a no-op. Buffered events are discarded.
     */
    void shutdown();

    bool isShutdown() const;
    uint64_t droppedEventCount() const;
    size_t pendingCallCount() const;
    size_t bufferedEventCount() const;

private:
    HostResponse runCall(EngineHost& host, const HostRequest& request);
    void releaseHeldEvents();

    const size_t eventCapacity_;
    Dependencies deps_;

    mutable std::mutex mutex_;
    bool shutdown_ = false;
    uint64_t lastSeq_ = 0;
    // Set while a call runs: the last seq published before it started.
    std::optional<uint64_t> heldAfterSeq_;
    uint64_t droppedEvents_ = 0;
    std::deque<Protocol::EngineEvent> events_;
    std::deque<HostCall> calls_;
};

} // namespace Bridge
} // namespace StenoBridge
