#include "CommandDispatcher.h"
#include "core/LoggingChannels.h"
#include "protocol/ConfigOptions.h"
#include "protocol/EngineEvent.h"
#include <set>

namespace StenoBridge {
namespace Server {

using Protocol::CommandError;
using Protocol::CommandErrorCode;
using Outcome = Result<nlohmann::json, CommandError>;

namespace {

Result<std::monostate, CommandError> invalid(std::string message)
{
    return Result<std::monostate, CommandError>::error(
        CommandError{ .code = CommandErrorCode::InvalidPayload, .message = std::move(message) });
}

} // namespace

CommandDispatcher::CommandDispatcher(
    ConnectionRegistry& registry,
    Broadcaster& broadcaster,
    Bridge::EngineBridge& bridge,
    CompletionSink sink)
    : registry_(registry), broadcaster_(broadcaster), bridge_(bridge), sink_(std::move(sink))
{}

Result<std::monostate, CommandError> CommandDispatcher::validate(
    const Protocol::ClientCommand::Data& data)
{
    using namespace Protocol::Commands;

    if (const auto* set = std::get_if<SetConfigOption>(&data)) {
        const auto expected = Protocol::findConfigOption(set->option);
        if (!expected.has_value()) {
            return invalid("unknown config option '" + set->option + "'");
        }
        const auto actual = Protocol::typeOf(set->value);
        if (actual != expected.value()) {
            return invalid(
                "option '" + set->option + "' expects " + Protocol::toString(expected.value())
                + ", got " + Protocol::toString(actual));
        }
    }
    else if (const auto* combo = std::get_if<SendKeyCombination>(&data)) {
        if (combo->combination.empty()) {
            return invalid("combination must not be empty");
        }
    }
    else if (const auto* subscribe = std::get_if<Subscribe>(&data)) {
        for (const auto& kind : subscribe->kinds) {
            if (!Protocol::isKnownEventKind(kind)) {
                return invalid("unknown event kind '" + kind + "'");
            }
        }
    }
    return Result<std::monostate, CommandError>::okay(std::monostate{});
}

void CommandDispatcher::handle(
    Connection& connection, const Protocol::ClientCommand& command, Clock::time_point now)
{
    const std::string kind(command.kind());
    LOG_DEBUG(Dispatch, "{} sent {}", connection.id(), kind);

    auto valid = validate(command.data);
    if (valid.isError()) {
        LOG_INFO(Dispatch, "{} rejected {}: {}", connection.id(), kind, valid.errorValue().message);
        reply(connection, command.correlationId, Outcome::error(valid.errorValue()), now);
        return;
    }

    if (const auto* subscribe = std::get_if<Protocol::Commands::Subscribe>(&command.data)) {
        connection.setSubscription(std::set<std::string>(subscribe->kinds.begin(), subscribe->kinds.end()));
        LOG_INFO(
            Dispatch,
            "{} subscribed to {}",
            connection.id(),
            subscribe->kinds.empty() ? std::string("all events")
                                     : std::to_string(subscribe->kinds.size()) + " kinds");
        reply(connection, command.correlationId, Outcome::okay(nullptr), now);
        return;
    }

    ++inFlight_;
    auto sink = sink_;
    auto connectionId = connection.id();
    auto correlationId = command.correlationId;
    bridge_.submit(Bridge::HostCall(
        Bridge::HostRequest{ .connectionId = connectionId, .command = command },
        [sink, connectionId, correlationId, kind](Bridge::HostResponse&& response) {
            CommandCompletion completion{ .connectionId = connectionId,
                                          .correlationId = correlationId,
                                          .commandKind = kind,
                                          .outcome = {} };
            if (response.isValue()) {
                completion.outcome = Outcome::okay(std::move(response.value()));
            }
            else {
                completion.outcome = Outcome::error(Bridge::toCommandError(response.errorValue()));
            }
            if (sink) {
                sink(std::move(completion));
            }
        }));
}

void CommandDispatcher::handleDecodeError(
    Connection& connection, const Protocol::DecodeError& error, Clock::time_point now)
{
    switch (error.kind) {
        case Protocol::DecodeError::Kind::Malformed:
            LOG_WARN(Protocol, "Malformed frame from {}: {}", connection.id(), error.message);
            broadcaster_.closeWithError(
                connection, CloseReason::ProtocolViolation, "Malformed", error.message, now);
            return;
        case Protocol::DecodeError::Kind::UnknownKind:
            LOG_INFO(Protocol, "{} sent unsupported command '{}'", connection.id(), error.commandKind);
            reply(
                connection,
                error.correlationId,
                Outcome::error(CommandError{ .code = CommandErrorCode::UnsupportedCommand,
                                             .message = error.message }),
                now);
            return;
        case Protocol::DecodeError::Kind::InvalidPayload:
            LOG_INFO(Protocol, "{} sent invalid {}: {}", connection.id(), error.commandKind, error.message);
            reply(
                connection,
                error.correlationId,
                Outcome::error(
                    CommandError{ .code = CommandErrorCode::InvalidPayload, .message = error.message }),
                now);
            return;
    }
}

void CommandDispatcher::complete(const CommandCompletion& completion, Clock::time_point now)
{
    if (inFlight_ > 0) {
        --inFlight_;
    }

    auto connection = registry_.find(completion.connectionId);
    if (!connection || !connection->isAuthenticated()) {
        LOG_DEBUG(
            Dispatch,
            "Discarding {} result for departed {}",
            completion.commandKind,
            completion.connectionId);
        return;
    }

    if (completion.outcome.isError()) {
        LOG_INFO(
            Dispatch,
            "{} from {} failed: {}",
            completion.commandKind,
            completion.connectionId,
            completion.outcome.errorValue().message);
    }
    reply(*connection, completion.correlationId, completion.outcome, now);
}

void CommandDispatcher::reply(
    Connection& connection,
    const std::optional<std::string>& correlationId,
    const Outcome& outcome,
    Clock::time_point now)
{
    if (correlationId.has_value()) {
        Protocol::Control::Ack ack{ .correlationId = correlationId.value(), .error = {}, .value = {} };
        if (outcome.isError()) {
            ack.error = outcome.errorValue();
        }
        else {
            ack.value = outcome.value();
        }
        broadcaster_.sendControl(connection, ack, now);
        return;
    }

    if (outcome.isError()) {
        broadcaster_.sendControl(
            connection,
            Protocol::Control::Error{ .code = Protocol::toString(outcome.errorValue().code),
                                      .message = outcome.errorValue().message },
            now);
    }
}

} // namespace Server
} // namespace StenoBridge
