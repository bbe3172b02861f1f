#pragma once

#include "CommandDispatcher.h"
#include "core/network/ClientSocket.h"
#include <concepts>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace StenoBridge {
namespace Server {

template <typename T>
concept HasEventName = requires {
    { T::name() } -> std::convertible_to<const char*>;
};

/**
 * Work items for the server loop. Transport callbacks and host completions
 * run on other threads; they only ever post one of these.
 */
namespace LoopEvents {

struct ClientOpened {
    std::shared_ptr<Network::ClientSocket> socket;
    static constexpr const char* name() { return "ClientOpened"; }
};

struct ClientText {
    Network::SocketId socketId = 0;
    std::string text;
    static constexpr const char* name() { return "ClientText"; }
};

struct ClientBinary {
    Network::SocketId socketId = 0;
    static constexpr const char* name() { return "ClientBinary"; }
};

struct ClientClosed {
    Network::SocketId socketId = 0;
    static constexpr const char* name() { return "ClientClosed"; }
};

struct CommandCompleted {
    CommandCompletion completion;
    static constexpr const char* name() { return "CommandCompleted"; }
};

struct ShutdownRequested {
    static constexpr const char* name() { return "ShutdownRequested"; }
};

} // namespace LoopEvents

class Event {
public:
    using Variant = std::variant<
        LoopEvents::ClientOpened,
        LoopEvents::ClientText,
        LoopEvents::ClientBinary,
        LoopEvents::ClientClosed,
        LoopEvents::CommandCompleted,
        LoopEvents::ShutdownRequested>;

    template <typename T>
        requires HasEventName<std::decay_t<T>>
    Event(T&& event) : variant_(std::forward<T>(event))
    {}

    Event() = default;

    Variant& getVariant() { return variant_; }
    const Variant& getVariant() const { return variant_; }

private:
    Variant variant_;
};

inline std::string getEventName(const Event& event)
{
    return std::visit([](auto&& e) { return std::string(e.name()); }, event.getVariant());
}

} // namespace Server
} // namespace StenoBridge
