#include "EventProcessor.h"
#include "BridgeServer.h"
#include "core/LoggingChannels.h"
#include "core/SynchronizedQueue.h"

namespace StenoBridge {
namespace Server {

struct EventQueue {
    SynchronizedQueue<Event> queue;
};

EventProcessor::EventProcessor() : eventQueue(std::make_shared<EventQueue>())
{}

void EventProcessor::processEventsFromQueue(BridgeServer& server)
{
    // Handlers may post more events; those run in this same pass.
    while (!eventQueue->queue.empty()) {
        auto event = eventQueue->queue.tryPop();
        if (event.has_value()) {
            LOG_TRACE(State, "Processing event: {}", getEventName(event.value()));
            server.handleEvent(event.value());
        }
    }
}

void EventProcessor::enqueueEvent(Event event)
{
    postEvent(eventQueue, std::move(event));
}

bool EventProcessor::hasEvents() const
{
    return !eventQueue->queue.empty();
}

size_t EventProcessor::queueSize() const
{
    return eventQueue->queue.size();
}

void EventProcessor::clearQueue()
{
    eventQueue->queue.clear();
}

void postEvent(const std::shared_ptr<EventQueue>& queue, Event event)
{
    LOG_TRACE(State, "Enqueuing event: {}", getEventName(event));
    queue->queue.push(std::move(event));
}

} // namespace Server
} // namespace StenoBridge
