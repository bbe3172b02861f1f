#include "EngineBridge.h"
#include "PhraseLookup.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <chrono>

namespace StenoBridge {
namespace Bridge {

namespace {

int64_t systemWallClockMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

EngineBridge::EngineBridge(size_t eventCapacity, Dependencies deps)
    : eventCapacity_(eventCapacity > 0 ? eventCapacity : 1), deps_(std::move(deps))
{
    if (!deps_.wallClockMs) {
        deps_.wallClockMs = systemWallClockMs;
    }
}

void EngineBridge::publish(Protocol::EngineEvent::Data data)
{
    const int64_t timestamp = deps_.wallClockMs();

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }

    events_.push_back(
        Protocol::EngineEvent{ .seq = ++lastSeq_, .timestamp = timestamp, .data = std::move(data) });

    if (events_.size() > eventCapacity_) {
        const auto& oldest = events_.front();
        ++droppedEvents_;
        LOG_WARN(
            Bridge,
            "BridgeOverflow: dropped {} event seq {} ({} dropped so far)",
            oldest.kind(),
            oldest.seq,
            droppedEvents_);
        events_.pop_front();
    }
}

std::vector<Protocol::EngineEvent> EngineBridge::drainEvents()
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto end = events_.end();
    if (heldAfterSeq_.has_value()) {
        const uint64_t held = heldAfterSeq_.value();
        end = std::find_if(events_.begin(), events_.end(), [held](const Protocol::EngineEvent& event) {
            return event.seq > held;
        });
    }
    std::vector<Protocol::EngineEvent> drained(
        std::make_move_iterator(events_.begin()), std::make_move_iterator(end));
    events_.erase(events_.begin(), end);
    return drained;
}

void EngineBridge::submit(HostCall call)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shutdown_) {
            calls_.push_back(std::move(call));
            return;
        }
    }

    LOG_DEBUG(
        Bridge,
        "Rejecting {} from {}: host is shutting down",
        call.command.command.kind(),
        call.command.connectionId);
    call.sendResponse(HostResponse::error(HostError::unavailable("host is shutting down")));
}

size_t EngineBridge::processHostCalls(EngineHost& host)
{
    std::deque<HostCall> calls;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls.swap(calls_);
    }

    for (auto& call : calls) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            heldAfterSeq_ = lastSeq_;
        }
        auto response = runCall(host, call.command);
        try {
            call.sendResponse(std::move(response));
        }
        catch (...) {
            releaseHeldEvents();
            throw;
        }
        releaseHeldEvents();
    }
    return calls.size();
}

void EngineBridge::releaseHeldEvents()
{
    std::lock_guard<std::mutex> lock(mutex_);
    heldAfterSeq_.reset();
}

HostResponse EngineBridge::runCall(EngineHost& host, const HostRequest& request)
{
    const auto& command = request.command;
    LOG_DEBUG(Bridge, "Applying {} from {}", command.kind(), request.connectionId);

    try {
        if (const auto* lookup = std::get_if<Protocol::Commands::Lookup>(&command.data)) {
            PhraseLookup phraseLookup(host);
            return HostResponse::okay(PhraseLookup::toJson(phraseLookup.lookup(lookup->text)));
        }

        auto result = host.applyCommand(command.data);
        if (result.isError()) {
            LOG_INFO(
                Bridge,
                "Host rejected {} from {}: {}",
                command.kind(),
                request.connectionId,
                result.errorValue().message);
            return HostResponse::error(result.errorValue());
        }
        return HostResponse::okay(nullptr);
    }
    catch (const std::exception& e) {
        LOG_ERROR(Bridge, "Host failed applying {}: {}", command.kind(), e.what());
        return HostResponse::error(HostError::rejected(std::string("host error: ") + e.what()));
    }
}

void EngineBridge::shutdown()
{
    std::deque<HostCall> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        pending.swap(calls_);
        events_.clear();
    }

    LOG_INFO(Bridge, "Bridge shut down, failing {} pending call(s)", pending.size());
    for (auto& call : pending) {
        call.sendResponse(HostResponse::error(HostError::unavailable("host is shutting down")));
    }
}

bool EngineBridge::isShutdown() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

uint64_t EngineBridge::droppedEventCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return droppedEvents_;
}

size_t EngineBridge::pendingCallCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

size_t EngineBridge::bufferedEventCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace Bridge
} // namespace StenoBridge
