#include "BridgeExtension.h"
#include "ServerConfig.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "host/StandaloneEngine.h"
#include <args.hxx>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

using namespace StenoBridge;

static std::atomic<bool> g_exitRequested{ false };

void signalHandler(int /*signum*/)
{
    g_exitRequested = true;
}

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "StenoBridge Server",
        "Streams stenography engine events to authenticated WebSocket clients and relays "
        "their commands back to the engine.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory holding stenobridge-server.json", { "config-dir" });
    args::ValueFlag<std::string> hostArg(parser, "host", "Listen address (overrides config)", { "host" });
    args::ValueFlag<uint16_t> portArg(parser, "port", "Listen port (overrides config)", { 'p', "port" });
    args::ValueFlag<std::string> credentialArg(
        parser, "file", "Pre-shared key file (overrides config)", { 'k', "key-file" });
    args::ValueFlagList<std::string> dictionaries(
        parser, "dictionary", "Steno dictionary JSON used for lookups (repeatable)", { 'd', "dictionary" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., auth:debug,*:warn)",
        { 'C', "channels" });

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

    LoggingChannels::initializeFromConfig(args::get(logConfig), "server");
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        SLOG_INFO("Applied channel overrides: {}", args::get(logChannels));
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }
    auto loaded = ConfigLoader::loadOrDefault<Server::ServerConfig>("stenobridge-server.json");
    if (loaded.isError()) {
        SLOG_ERROR("{}", loaded.errorValue());
        return 1;
    }
    Server::ServerConfig config = loaded.value();
    if (hostArg) {
        config.host = args::get(hostArg);
    }
    if (portArg) {
        config.port = args::get(portArg);
    }
    if (credentialArg) {
        config.credentialPath = args::get(credentialArg);
    }

    Server::BridgeExtension extension(config);
    Host::StandaloneEngine engine(
        [&extension](Protocol::EngineEvent::Data event) { extension.onEngineEvent(std::move(event)); });

    std::vector<std::filesystem::path> dictionaryPaths;
    for (const auto& path : args::get(dictionaries)) {
        dictionaryPaths.emplace_back(path);
    }
    auto dictionariesLoaded = engine.loadDictionaries(dictionaryPaths);
    if (dictionariesLoaded.isError()) {
        SLOG_ERROR("{}", dictionariesLoaded.errorValue());
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto started = extension.start();
    if (started.isError()) {
        SLOG_ERROR("Failed to start server: {}", started.errorValue());
        return 1;
    }
    engine.start([&extension](Bridge::EngineHost& host) { return extension.processHostCalls(host); });

    while (!g_exitRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    SLOG_INFO("Shutting down...");
    extension.stop();
    engine.stop();
    SLOG_INFO("stenobridge-server shut down cleanly");
    return 0;
}
