#include "EnvelopeCodec.h"
#include "JsonFields.h"
#include "VariantKinds.h"
#include <exception>

namespace StenoBridge {
namespace Protocol {

namespace {

constexpr const char* kEventType = "event";
constexpr const char* kCommandType = "command";

std::string dump(const nlohmann::json& j)
{
    // Invalid UTF-8 coming from the host is replaced rather than thrown.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

DecodeError malformed(std::string message)
{
    return DecodeError{ .kind = DecodeError::Kind::Malformed,
                        .message = std::move(message),
                        .correlationId = std::nullopt,
                        .commandKind = {} };
}

// Parses the frame and extracts the envelope type, or reports a Malformed error.
Result<std::pair<nlohmann::json, std::string>, DecodeError> parseEnvelope(std::string_view text)
{
    using R = Result<std::pair<nlohmann::json, std::string>, DecodeError>;

    nlohmann::json j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded()) {
        return R::error(malformed("frame is not valid JSON"));
    }
    if (!j.is_object()) {
        return R::error(malformed(std::string("frame must be a JSON object, got ") + j.type_name()));
    }
    auto it = j.find("type");
    if (it == j.end() || !it->is_string()) {
        return R::error(malformed("frame has no string 'type' field"));
    }
    std::string type = it->get<std::string>();
    return R::okay({ std::move(j), std::move(type) });
}

Result<Inbound, DecodeError> decodeCommand(const nlohmann::json& j)
{
    using R = Result<Inbound, DecodeError>;

    auto kindIt = j.find("kind");
    if (kindIt == j.end() || !kindIt->is_string()) {
        return R::error(malformed("command has no string 'kind' field"));
    }
    const std::string kind = kindIt->get<std::string>();

    std::optional<std::string> correlationId;
    try {
        correlationId = JsonFields::optionalString(j, "correlation_id");
    }
    catch (const std::exception& e) {
        return R::error(malformed(e.what()));
    }

    const nlohmann::json payload = j.contains("payload") ? j.at("payload") : nlohmann::json();

    try {
        ClientCommand command{ .correlationId = correlationId,
                               .data = commandPayloadFromJson(kind, payload) };
        return R::okay(std::move(command));
    }
    catch (const UnknownKindError& e) {
        return R::error(DecodeError{ .kind = DecodeError::Kind::UnknownKind,
                                     .message = e.what(),
                                     .correlationId = correlationId,
                                     .commandKind = kind });
    }
    catch (const std::exception& e) {
        return R::error(DecodeError{ .kind = DecodeError::Kind::InvalidPayload,
                                     .message = kind + ": " + e.what(),
                                     .correlationId = correlationId,
                                     .commandKind = kind });
    }
}

bool isClientControlType(std::string_view type)
{
    return type == Control::Proof::name() || type == Control::Ping::name()
        || type == Control::Pong::name();
}

Result<Outbound, DecodeError> decodeEvent(const nlohmann::json& j)
{
    using R = Result<Outbound, DecodeError>;

    std::string kind;
    EngineEvent event;
    try {
        kind = JsonFields::requireString(j, "kind");
        auto seqIt = j.find("seq");
        if (seqIt == j.end() || !seqIt->is_number_unsigned()) {
            return R::error(malformed("event has no unsigned 'seq' field"));
        }
        event.seq = seqIt->get<uint64_t>();
        event.timestamp = JsonFields::requireInteger(j, "timestamp");
    }
    catch (const std::exception& e) {
        return R::error(malformed(e.what()));
    }

    const nlohmann::json payload = j.contains("payload") ? j.at("payload") : nlohmann::json();

    try {
        event.data = eventPayloadFromJson(kind, payload);
        return R::okay(std::move(event));
    }
    catch (const UnknownKindError& e) {
        return R::error(DecodeError{ .kind = DecodeError::Kind::UnknownKind,
                                     .message = e.what(),
                                     .correlationId = std::nullopt,
                                     .commandKind = kind });
    }
    catch (const std::exception& e) {
        return R::error(DecodeError{ .kind = DecodeError::Kind::InvalidPayload,
                                     .message = kind + ": " + e.what(),
                                     .correlationId = std::nullopt,
                                     .commandKind = kind });
    }
}

} // namespace

std::string encodeEvent(const EngineEvent& event)
{
    const nlohmann::json j = {
        { "type", kEventType },
        { "seq", event.seq },
        { "kind", std::string(event.kind()) },
        { "timestamp", event.timestamp },
        { "payload", eventPayloadToJson(event.data) },
    };
    return dump(j);
}

std::string encodeControl(const ControlMessage& message)
{
    return dump(controlToJson(message));
}

std::string encodeCommand(const ClientCommand& command)
{
    nlohmann::json j = {
        { "type", kCommandType },
        { "kind", std::string(command.kind()) },
        { "payload", commandPayloadToJson(command.data) },
    };
    if (command.correlationId.has_value()) {
        j["correlation_id"] = command.correlationId.value();
    }
    return dump(j);
}

Result<Inbound, DecodeError> decodeInbound(std::string_view text)
{
    using R = Result<Inbound, DecodeError>;

    auto envelope = parseEnvelope(text);
    if (envelope.isError()) {
        return R::error(envelope.errorValue());
    }
    const auto& [j, type] = envelope.value();

    if (type == kCommandType) {
        return decodeCommand(j);
    }
    if (!isClientControlType(type)) {
        return R::error(malformed("unexpected message type '" + type + "'"));
    }

    try {
        return R::okay(controlFromJson(type, j));
    }
    catch (const std::exception& e) {
        return R::error(malformed(type + ": " + e.what()));
    }
}

Result<Outbound, DecodeError> decodeOutbound(std::string_view text)
{
    using R = Result<Outbound, DecodeError>;

    auto envelope = parseEnvelope(text);
    if (envelope.isError()) {
        return R::error(envelope.errorValue());
    }
    const auto& [j, type] = envelope.value();

    if (type == kEventType) {
        return decodeEvent(j);
    }

    try {
        return R::okay(controlFromJson(type, j));
    }
    catch (const UnknownKindError&) {
        return R::error(malformed("unexpected message type '" + type + "'"));
    }
    catch (const std::exception& e) {
        return R::error(malformed(type + ": " + e.what()));
    }
}

} // namespace Protocol
} // namespace StenoBridge
