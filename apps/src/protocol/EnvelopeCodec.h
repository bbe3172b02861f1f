#pragma once

#include "ClientCommand.h"
#include "ControlMessage.h"
#include "EngineEvent.h"
#include "ProtocolErrors.h"
#include "core/Result.h"
#include <string>
#include <string_view>
#include <variant>

namespace StenoBridge {
namespace Protocol {

/**
 * Wire codec for JSON text frames. Every frame is an object with a "type"
 * field: "event" and "command" carry a kind and a payload, everything else is
 * a control message. Unknown extra fields are ignored.
 *
 * Decoding is all or nothing: a frame either becomes a fully typed value or a
 * DecodeError.
 */

// What a server receives from a client.
using Inbound = std::variant<ClientCommand, ControlMessage>;

// What a client receives from a server.
using Outbound = std::variant<EngineEvent, ControlMessage>;

std::string encodeEvent(const EngineEvent& event);

std::string encodeControl(const ControlMessage& message);

std::string encodeCommand(const ClientCommand& command);

Result<Inbound, DecodeError> decodeInbound(std::string_view text);

Result<Outbound, DecodeError> decodeOutbound(std::string_view text);

} // namespace Protocol
} // namespace StenoBridge
