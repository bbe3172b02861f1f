#pragma once

#include "Broadcaster.h"
#include "Connection.h"
#include "ConnectionRegistry.h"
#include "bridge/EngineBridge.h"
#include "core/Result.h"
#include "protocol/ClientCommand.h"
#include "protocol/ProtocolErrors.h"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace StenoBridge {
namespace Server {

/**
 * @brief Result of a host command, carried back to the server loop.
 */
struct CommandCompletion {
    std::string connectionId;
    std::optional<std::string> correlationId;
    std::string commandKind;
    Result<nlohmann::json, Protocol::CommandError> outcome;
};

/**
 * @brief Validates client commands and routes them to the host.
 *
 * Subscribe is handled here; everything else crosses the bridge. Completions
 * arrive on the host's thread and are handed to the completion sink, which
 * must post them back to the server loop; complete() then replies if the
 * connection is still there.
 *
 * Replies: a command with a correlation id always gets an ack. Without one,
 * only a failure is reported (as an error frame). Failures never close the
 * connection; a malformed frame does.
 */
class CommandDispatcher {
public:
    using CompletionSink = std::function<void(CommandCompletion)>;

    CommandDispatcher(
        ConnectionRegistry& registry,
        Broadcaster& broadcaster,
        Bridge::EngineBridge& bridge,
        CompletionSink sink);

    void handle(Connection& connection, const Protocol::ClientCommand& command, Clock::time_point now);

    void handleDecodeError(
        Connection& connection, const Protocol::DecodeError& error, Clock::time_point now);

    void complete(const CommandCompletion& completion, Clock::time_point now);

    // Commands submitted to the host whose completion has not come back yet.
    size_t inFlightCount() const { return inFlight_; }

    static Result<std::monostate, Protocol::CommandError> validate(
        const Protocol::ClientCommand::Data& data);

private:
    void reply(
        Connection& connection,
        const std::optional<std::string>& correlationId,
        const Result<nlohmann::json, Protocol::CommandError>& outcome,
        Clock::time_point now);

    ConnectionRegistry& registry_;
    Broadcaster& broadcaster_;
    Bridge::EngineBridge& bridge_;
    CompletionSink sink_;
    size_t inFlight_ = 0;
};

} // namespace Server
} // namespace StenoBridge
