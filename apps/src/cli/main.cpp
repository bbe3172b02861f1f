#include "BridgeClient.h"
#include "auth/CredentialStore.h"
#include "core/LoggingChannels.h"
#include "protocol/ClientCommand.h"
#include "protocol/EnvelopeCodec.h"
#include "protocol/VariantKinds.h"
#include <args.hxx>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>

using namespace StenoBridge;

static std::atomic<bool> g_exitRequested{ false };

void signalHandler(int /*signum*/)
{
    g_exitRequested = true;
}

namespace {

std::vector<std::string> splitList(const std::string& list)
{
    std::vector<std::string> items;
    std::stringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string commandListHelp()
{
    std::string help = "Action: watch | send. Command kinds for send:";
    for (const auto& kind : Protocol::commandKindNames()) {
        help += " " + kind;
    }
    return help;
}

int runWatch(
    Client::BridgeClient& client, const std::vector<std::string>& kinds, int timeoutMs, int heartbeatMs)
{
    if (!kinds.empty()) {
        auto ack = client.sendCommand(Protocol::Commands::Subscribe{ .kinds = kinds }, timeoutMs);
        if (ack.isError()) {
            std::cerr << "Subscribe failed: " << ack.errorValue() << std::endl;
            return 1;
        }
        if (!ack.value().ok()) {
            std::cerr << "Subscribe rejected: " << ack.value().error->message << std::endl;
            return 1;
        }
    }

    std::atomic<bool> disconnected{ false };
    client.onDisconnected([&disconnected](const std::string& reason) {
        std::cerr << "Disconnected: " << reason << std::endl;
        disconnected = true;
    });
    client.onEvent([](const Protocol::EngineEvent& event) {
        std::cout << Protocol::encodeEvent(event) << std::endl;
    });

    // The server closes clients that stay silent past its idle timeout.
    auto lastPing = std::chrono::steady_clock::now();
    while (!g_exitRequested && !disconnected) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        const auto now = std::chrono::steady_clock::now();
        if (heartbeatMs > 0 && now - lastPing >= std::chrono::milliseconds(heartbeatMs)) {
            lastPing = now;
            auto sent = client.ping();
            if (sent.isError()) {
                LOG_WARN(Network, "Heartbeat failed: {}", sent.errorValue());
            }
        }
    }
    return disconnected ? 1 : 0;
}

int runSend(
    Client::BridgeClient& client, const std::string& kind, const std::string& payloadText, int timeoutMs)
{
    Protocol::ClientCommand::Data command;
    try {
        const auto payload = payloadText.empty() ? nlohmann::json::object()
                                                 : nlohmann::json::parse(payloadText);
        command = Protocol::commandPayloadFromJson(kind, payload);
    }
    catch (const Protocol::UnknownKindError& e) {
        std::cerr << "Unknown command kind '" << e.kind() << "'" << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid payload for " << kind << ": " << e.what() << std::endl;
        return 1;
    }

    auto ack = client.sendCommand(std::move(command), timeoutMs);
    if (ack.isError()) {
        std::cerr << ack.errorValue() << std::endl;
        return 1;
    }
    std::cout << Protocol::encodeControl(ack.value()) << std::endl;
    return ack.value().ok() ? 0 : 2;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "StenoBridge CLI",
        "Connects to a bridge server, then streams its events or sends one command.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> url(
        parser, "url", "Server URL (default: ws://127.0.0.1:8086/websocket)", { 'u', "url" });
    args::ValueFlag<std::string> keyFile(
        parser, "file", "Pre-shared key file (default: stenobridge.key)", { 'k', "key-file" });
    args::ValueFlag<std::string> kinds(
        parser, "kinds", "Comma-separated event kinds to watch (default: all)", { "kinds" });
    args::ValueFlag<int> timeout(parser, "ms", "Connect and ack timeout (default: 5000)", { 't', "timeout" });
    args::ValueFlag<int> heartbeat(
        parser, "ms", "Heartbeat interval while watching, 0 disables (default: 20000)", { "heartbeat" });
    args::Positional<std::string> action(parser, "action", commandListHelp());
    args::Positional<std::string> kind(parser, "kind", "Command kind for send");
    args::Positional<std::string> payload(parser, "payload", "Command payload JSON for send");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Events go to stdout; keep logging on stderr.
    LoggingChannels::initialize(
        verbose ? spdlog::level::debug : spdlog::level::warn, spdlog::level::off, "cli", true);

    const std::string actionName = action ? args::get(action) : "";
    if (actionName != "watch" && actionName != "send") {
        std::cerr << "Expected an action: watch or send" << std::endl;
        std::cerr << parser;
        return 1;
    }
    if (actionName == "send" && !kind) {
        std::cerr << "send needs a command kind" << std::endl;
        return 1;
    }

    auto key = Auth::CredentialStore::load(keyFile ? args::get(keyFile) : "stenobridge.key");
    if (key.isError()) {
        std::cerr << key.errorValue() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const int timeoutMs = timeout ? args::get(timeout) : 5000;
    Client::BridgeClient client(std::move(key.value()));
    auto connected = client.connect(url ? args::get(url) : "ws://127.0.0.1:8086/websocket", timeoutMs);
    if (connected.isError()) {
        std::cerr << "Connect failed: " << connected.errorValue() << std::endl;
        return 1;
    }

    int status = 0;
    if (actionName == "watch") {
        status = runWatch(
            client,
            kinds ? splitList(args::get(kinds)) : std::vector<std::string>{},
            timeoutMs,
            heartbeat ? args::get(heartbeat) : 20000);
    }
    else {
        status = runSend(client, args::get(kind), payload ? args::get(payload) : "", timeoutMs);
    }
    client.disconnect();
    return status;
}
