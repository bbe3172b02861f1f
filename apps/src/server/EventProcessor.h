#pragma once

#include "Event.h"
#include <memory>

namespace StenoBridge {
namespace Server {

class BridgeServer;
struct EventQueue;

class EventProcessor {
public:
    EventProcessor();

    void processEventsFromQueue(BridgeServer& server);
    void enqueueEvent(Event event);

    bool hasEvents() const;
    size_t queueSize() const;
    void clearQueue();

    // Shared with callbacks that may outlive the server (host completions).
    std::shared_ptr<EventQueue> eventQueue;
};

/**
 * @brief Posts to a queue without keeping the server alive.
 */
void postEvent(const std::shared_ptr<EventQueue>& queue, Event event);

} // namespace Server
} // namespace StenoBridge
