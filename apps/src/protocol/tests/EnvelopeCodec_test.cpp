#include "protocol/EnvelopeCodec.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace StenoBridge;
using namespace StenoBridge::Protocol;

namespace {

EngineEvent makeEvent(uint64_t seq, EngineEvent::Data data)
{
    return EngineEvent{ .seq = seq, .timestamp = 1700000000000 + static_cast<int64_t>(seq), .data = std::move(data) };
}

void expectEventRoundTrip(const EngineEvent& original)
{
    auto decoded = decodeOutbound(encodeEvent(original));
    ASSERT_TRUE(decoded.isValue()) << decoded.errorValue().message;
    ASSERT_TRUE(std::holds_alternative<EngineEvent>(decoded.value()));
    EXPECT_EQ(std::get<EngineEvent>(decoded.value()), original) << original.kind();
}

void expectCommandRoundTrip(const ClientCommand& original)
{
    auto decoded = decodeInbound(encodeCommand(original));
    ASSERT_TRUE(decoded.isValue()) << decoded.errorValue().message;
    ASSERT_TRUE(std::holds_alternative<ClientCommand>(decoded.value()));
    EXPECT_EQ(std::get<ClientCommand>(decoded.value()), original) << original.kind();
}

DecodeError expectInboundError(const std::string& text)
{
    auto decoded = decodeInbound(text);
    EXPECT_TRUE(decoded.isError()) << "Unexpectedly decoded: " << text;
    if (decoded.isValue()) {
        return DecodeError{};
    }
    return decoded.errorValue();
}

} // namespace

TEST(EnvelopeCodecTest, TranslationEventHasDocumentedShape)
{
    const auto event = EngineEvent{ .seq = 1,
                                    .timestamp = 1700000000000,
                                    .data = Events::Translation{ .text = "hello" } };

    const auto j = nlohmann::json::parse(encodeEvent(event));

    EXPECT_EQ(j["type"], "event");
    EXPECT_EQ(j["seq"], 1);
    EXPECT_EQ(j["kind"], "Translation");
    EXPECT_EQ(j["timestamp"], 1700000000000);
    EXPECT_EQ(j["payload"], nlohmann::json({ { "text", "hello" } }));
}

TEST(EnvelopeCodecTest, EveryEventKindRoundTrips)
{
    expectEventRoundTrip(makeEvent(1, Events::Stroke{ .keys = { "T-", "-P" }, .steno = "TP" }));
    expectEventRoundTrip(makeEvent(2, Events::Translation{ .text = "héllo \"world\"" }));
    expectEventRoundTrip(makeEvent(3, Events::ConfigChanged{ .option = "undo_levels", .value = int64_t{ 100 } }));
    expectEventRoundTrip(makeEvent(4, Events::ConfigChanged{ .option = "output_enabled", .value = false }));
    expectEventRoundTrip(makeEvent(5, Events::ConfigChanged{ .option = "system_name", .value = std::string("English Stenotype") }));
    expectEventRoundTrip(makeEvent(6, Events::OutputToggled{ .enabled = true }));
    expectEventRoundTrip(makeEvent(7, Events::MachineStateChanged{ .machine_type = "Gemini PR", .state = "connected" }));
    expectEventRoundTrip(makeEvent(8, Events::DictionariesLoaded{ .paths = { "main.json", "user.json" } }));
    expectEventRoundTrip(makeEvent(9, Events::SendString{ .text = "hi " }));
    expectEventRoundTrip(makeEvent(10, Events::SendBackspaces{ .count = 3 }));
    expectEventRoundTrip(makeEvent(11, Events::SendKeyCombination{ .combination = "ctrl_l(z)" }));
}

TEST(EnvelopeCodecTest, EveryCommandKindRoundTrips)
{
    expectCommandRoundTrip(ClientCommand{ .correlationId = "c1",
                                          .data = Commands::SetConfigOption{ .option = "output_enabled", .value = false } });
    expectCommandRoundTrip(ClientCommand{ .correlationId = std::nullopt, .data = Commands::ToggleOutput{} });
    expectCommandRoundTrip(ClientCommand{ .correlationId = "t", .data = Commands::ToggleOutput{ .enabled = true } });
    expectCommandRoundTrip(ClientCommand{ .correlationId = "c2", .data = Commands::SendText{ .text = "abc" } });
    expectCommandRoundTrip(ClientCommand{ .correlationId = "c3", .data = Commands::SendBackspaces{ .count = 2 } });
    expectCommandRoundTrip(ClientCommand{ .correlationId = "c4", .data = Commands::SendKeyCombination{ .combination = "alt_l(tab)" } });
    expectCommandRoundTrip(ClientCommand{ .correlationId = "c5", .data = Commands::Lookup{ .text = "Hello, world" } });
    expectCommandRoundTrip(ClientCommand{ .correlationId = "c6", .data = Commands::Subscribe{ .kinds = { "Stroke", "Translation" } } });
}

TEST(EnvelopeCodecTest, ControlMessagesRoundTripThroughTheirSide)
{
    const std::vector<ControlMessage> serverSide = {
        Control::Challenge{ .nonce = std::string(64, 'a'), .expiresInMs = 10000 },
        Control::Welcome{ .connectionId = "conn_7", .protocolVersion = kProtocolVersion },
        Control::Ack{ .correlationId = "c1", .error = std::nullopt, .value = nullptr },
        Control::Ack{ .correlationId = "c2",
                      .error = CommandError{ .code = CommandErrorCode::HostUnavailable, .message = "stopping" },
                      .value = nullptr },
        Control::Ack{ .correlationId = "c3", .error = std::nullopt, .value = nlohmann::json::array({ 1, 2 }) },
        Control::Error{ .code = "InvalidProof", .message = "bad proof" },
        Control::Pong{},
    };
    for (const auto& message : serverSide) {
        auto decoded = decodeOutbound(encodeControl(message));
        ASSERT_TRUE(decoded.isValue()) << decoded.errorValue().message;
        ASSERT_TRUE(std::holds_alternative<ControlMessage>(decoded.value()));
        EXPECT_EQ(std::get<ControlMessage>(decoded.value()), message) << controlTypeOf(message);
    }

    const std::vector<ControlMessage> clientSide = {
        Control::Proof{ .response = std::string(64, 'f') },
        Control::Ping{},
    };
    for (const auto& message : clientSide) {
        auto decoded = decodeInbound(encodeControl(message));
        ASSERT_TRUE(decoded.isValue()) << decoded.errorValue().message;
        ASSERT_TRUE(std::holds_alternative<ControlMessage>(decoded.value()));
        EXPECT_EQ(std::get<ControlMessage>(decoded.value()), message);
    }
}

TEST(EnvelopeCodecTest, AckEncodesOutcome)
{
    const auto ok = nlohmann::json::parse(
        encodeControl(Control::Ack{ .correlationId = "c1", .error = std::nullopt, .value = nullptr }));
    EXPECT_EQ(ok["type"], "ack");
    EXPECT_EQ(ok["correlation_id"], "c1");
    EXPECT_EQ(ok["outcome"], "ok");
    EXPECT_FALSE(ok.contains("error"));
    EXPECT_FALSE(ok.contains("value"));

    const auto failed = nlohmann::json::parse(encodeControl(Control::Ack{
        .correlationId = "c2",
        .error = CommandError{ .code = CommandErrorCode::UnsupportedCommand, .message = "Teleport" },
        .value = nullptr }));
    EXPECT_EQ(failed["outcome"], "error");
    EXPECT_EQ(failed["error"]["code"], "UnsupportedCommand");
}

TEST(EnvelopeCodecTest, UnknownExtraFieldsAreIgnored)
{
    auto decoded = decodeInbound(
        R"({"type":"command","kind":"SendText","correlation_id":"x","future":1,)"
        R"("payload":{"text":"hi","extra":[1,2]}})");
    ASSERT_TRUE(decoded.isValue());
    const auto& command = std::get<ClientCommand>(decoded.value());
    EXPECT_EQ(command.correlationId, "x");
    EXPECT_EQ(std::get<Commands::SendText>(command.data).text, "hi");
}

TEST(EnvelopeCodecTest, ToggleOutputAcceptsMissingPayload)
{
    auto decoded = decodeInbound(R"({"type":"command","kind":"ToggleOutput"})");
    ASSERT_TRUE(decoded.isValue());
    const auto& command = std::get<ClientCommand>(decoded.value());
    EXPECT_FALSE(command.correlationId.has_value());
    EXPECT_FALSE(std::get<Commands::ToggleOutput>(command.data).enabled.has_value());
}

TEST(EnvelopeCodecTest, StructuralProblemsAreMalformed)
{
    const std::vector<std::string> frames = {
        "not json at all",
        "",
        "[1,2,3]",
        "\"just a string\"",
        R"({"kind":"SendText"})",
        R"({"type":42})",
        R"({"type":"teleport"})",
        R"({"type":"command","payload":{}})",
        R"({"type":"command","kind":7})",
        R"({"type":"command","kind":"SendText","correlation_id":5,"payload":{"text":"x"}})",
        R"({"type":"proof"})",
        R"({"type":"proof","response":12})",
        R"({"type":"challenge","nonce":"abc","expires_in_ms":1})",
        R"({"type":"event","seq":1,"kind":"Translation","timestamp":0,"payload":{"text":"x"}})",
    };
    for (const auto& frame : frames) {
        const auto error = expectInboundError(frame);
        EXPECT_EQ(error.kind, DecodeError::Kind::Malformed) << frame;
        EXPECT_TRUE(error.isFatal());
    }
}

TEST(EnvelopeCodecTest, UnknownCommandKindKeepsCorrelationId)
{
    const auto error = expectInboundError(
        R"({"type":"command","kind":"Teleport","correlation_id":"c9","payload":{}})");
    EXPECT_EQ(error.kind, DecodeError::Kind::UnknownKind);
    EXPECT_FALSE(error.isFatal());
    EXPECT_EQ(error.correlationId, "c9");
    EXPECT_EQ(error.commandKind, "Teleport");
}

TEST(EnvelopeCodecTest, PayloadSchemaViolationsAreInvalidPayload)
{
    const std::vector<std::string> frames = {
        R"({"type":"command","kind":"SendText","payload":{}})",
        R"({"type":"command","kind":"SendText","payload":{"text":3}})",
        R"({"type":"command","kind":"SendText"})",
        R"({"type":"command","kind":"SendBackspaces","payload":{"count":-1}})",
        R"({"type":"command","kind":"SendBackspaces","payload":{"count":1.5}})",
        R"({"type":"command","kind":"SetConfigOption","payload":{"option":"undo_levels"}})",
        R"({"type":"command","kind":"SetConfigOption","payload":{"option":"undo_levels","value":[1]}})",
        R"({"type":"command","kind":"ToggleOutput","payload":{"enabled":"yes"}})",
        R"({"type":"command","kind":"Subscribe","payload":{"kinds":["Stroke",1]}})",
        R"({"type":"command","kind":"Lookup","payload":"hello"})",
    };
    for (const auto& frame : frames) {
        const auto error = expectInboundError(frame);
        EXPECT_EQ(error.kind, DecodeError::Kind::InvalidPayload) << frame;
        EXPECT_FALSE(error.isFatal());
    }
}

TEST(EnvelopeCodecTest, ClientSideReportsUnknownEventKindWithoutFailingStructure)
{
    auto decoded = decodeOutbound(
        R"({"type":"event","seq":4,"kind":"FutureThing","timestamp":1,"payload":{}})");
    ASSERT_TRUE(decoded.isError());
    EXPECT_EQ(decoded.errorValue().kind, DecodeError::Kind::UnknownKind);
    EXPECT_EQ(decoded.errorValue().commandKind, "FutureThing");
}

TEST(EnvelopeCodecTest, InvalidUtf8FromHostDoesNotThrow)
{
    const auto event = EngineEvent{ .seq = 1,
                                    .timestamp = 0,
                                    .data = Events::Translation{ .text = std::string("bad \xff byte") } };
    std::string encoded;
    EXPECT_NO_THROW(encoded = encodeEvent(event));
    EXPECT_TRUE(decodeOutbound(encoded).isValue());
}

TEST(ConfigOptionsTest, KnownOptionsHaveTypes)
{
    EXPECT_EQ(findConfigOption("output_enabled"), ConfigOptionType::Bool);
    EXPECT_EQ(findConfigOption("undo_levels"), ConfigOptionType::Integer);
    EXPECT_EQ(findConfigOption("system_name"), ConfigOptionType::String);
    EXPECT_FALSE(findConfigOption("warp_drive").has_value());
    EXPECT_EQ(typeOf(ConfigValue{ int64_t{ 3 } }), ConfigOptionType::Integer);
}

TEST(EngineEventTest, KindNamesCoverEveryAlternative)
{
    EXPECT_EQ(eventKindNames().size(), std::variant_size_v<EngineEvent::Data>);
    EXPECT_TRUE(isKnownEventKind("Translation"));
    EXPECT_TRUE(isKnownEventKind("SendKeyCombination"));
    EXPECT_FALSE(isKnownEventKind("translation"));
    EXPECT_EQ(commandKindNames().size(), std::variant_size_v<ClientCommand::Data>);
}
