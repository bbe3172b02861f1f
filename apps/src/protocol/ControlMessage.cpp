#include "ControlMessage.h"
#include "JsonFields.h"
#include "VariantKinds.h"
#include <stdexcept>

namespace StenoBridge {
namespace Protocol {

using namespace JsonFields;

namespace {

nlohmann::json toJson(const Control::Challenge& m)
{
    return { { "nonce", m.nonce }, { "expires_in_ms", m.expiresInMs } };
}

nlohmann::json toJson(const Control::Proof& m)
{
    return { { "response", m.response } };
}

nlohmann::json toJson(const Control::Welcome& m)
{
    return { { "connection_id", m.connectionId }, { "protocol_version", m.protocolVersion } };
}

nlohmann::json toJson(const Control::Ack& m)
{
    nlohmann::json j = { { "correlation_id", m.correlationId },
                         { "outcome", m.ok() ? "ok" : "error" } };
    if (m.error.has_value()) {
        j["error"] = { { "code", toString(m.error->code) }, { "message", m.error->message } };
    }
    if (!m.value.is_null()) {
        j["value"] = m.value;
    }
    return j;
}

nlohmann::json toJson(const Control::Error& m)
{
    return { { "code", m.code }, { "message", m.message } };
}

nlohmann::json toJson(const Control::Ping&)
{
    return nlohmann::json::object();
}

nlohmann::json toJson(const Control::Pong&)
{
    return nlohmann::json::object();
}

Control::Ack ackFromJson(const nlohmann::json& j)
{
    Control::Ack ack{ .correlationId = requireString(j, "correlation_id"),
                      .error = std::nullopt,
                      .value = nullptr };

    const std::string outcome = requireString(j, "outcome");
    if (outcome == "error") {
        if (!j.contains("error")) {
            throw std::invalid_argument("error outcome without 'error' object");
        }
        const auto& err = j.at("error");
        requireObject(err, "ack error");
        const std::string code = requireString(err, "code");
        auto parsed = commandErrorCodeFromString(code);
        if (!parsed.has_value()) {
            throw std::invalid_argument("unknown error code '" + code + "'");
        }
        ack.error = CommandError{ .code = *parsed, .message = requireString(err, "message") };
    }
    else if (outcome != "ok") {
        throw std::invalid_argument("unknown outcome '" + outcome + "'");
    }

    if (auto it = j.find("value"); it != j.end()) {
        ack.value = *it;
    }
    return ack;
}

} // namespace

std::string_view controlTypeOf(const ControlMessage& message)
{
    return kindOf(message);
}

nlohmann::json controlToJson(const ControlMessage& message)
{
    return std::visit(
        [](const auto& m) {
            nlohmann::json j = toJson(m);
            j["type"] = m.name();
            return j;
        },
        message);
}

ControlMessage controlFromJson(std::string_view type, const nlohmann::json& j)
{
    if (type == Control::Challenge::name()) {
        return Control::Challenge{ .nonce = requireString(j, "nonce"),
                                   .expiresInMs = requireInteger(j, "expires_in_ms") };
    }
    if (type == Control::Proof::name()) {
        return Control::Proof{ .response = requireString(j, "response") };
    }
    if (type == Control::Welcome::name()) {
        return Control::Welcome{ .connectionId = requireString(j, "connection_id"),
                                 .protocolVersion = requireCount(j, "protocol_version") };
    }
    if (type == Control::Ack::name()) {
        return ackFromJson(j);
    }
    if (type == Control::Error::name()) {
        return Control::Error{ .code = requireString(j, "code"),
                               .message = requireString(j, "message") };
    }
    if (type == Control::Ping::name()) {
        return Control::Ping{};
    }
    if (type == Control::Pong::name()) {
        return Control::Pong{};
    }
    throw UnknownKindError(std::string(type));
}

} // namespace Protocol
} // namespace StenoBridge
