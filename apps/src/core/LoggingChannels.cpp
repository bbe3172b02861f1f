#include "LoggingChannels.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace StenoBridge {

namespace {

constexpr const char* kDefaultLogFile = "stenobridge.log";
constexpr const char* kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";

constexpr LogChannel kAllChannels[] = {
    LogChannel::Auth,    LogChannel::Bridge,  LogChannel::Broadcast, LogChannel::Dispatch,
    LogChannel::Host,    LogChannel::Network, LogChannel::Protocol,  LogChannel::State,
};

std::string withComponent(const std::string& pattern, const std::string& componentName)
{
    if (componentName == "default") {
        return pattern;
    }

    // Inject component name after the timestamp.
    const size_t pos = pattern.find("] ");
    if (pos == std::string::npos) {
        return "[" + componentName + "] " + pattern;
    }
    return pattern.substr(0, pos + 2) + "[" + componentName + "] " + pattern.substr(pos + 2);
}

spdlog::sink_ptr makeConsoleSink(bool toStderr)
{
    if (toStderr) {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
}

} // namespace

// Static member initialization.
bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto consoleSink = makeConsoleSink(consoleToStderr);
    consoleSink->set_level(consoleLevel);

    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kDefaultLogFile, true);
    fileSink->set_level(fileLevel);

    sharedSinks_ = { consoleSink, fileSink };

    const std::string pattern = withComponent(kBasePattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::info);
    setChannelLevel(LogChannel::State, spdlog::level::debug);

    installDefaultLogger(componentName, consoleLevel, fileLevel, kDefaultLogFile, consoleToStderr);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_INFO("LoggingChannels initialized successfully");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    // Parse format: "channel:level,channel2:level2".
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = item.substr(0, colonPos);
        std::string levelStr = item.substr(colonPos + 1);

        channel.erase(0, channel.find_first_not_of(" \t"));
        channel.erase(channel.find_last_not_of(" \t") + 1);
        levelStr.erase(0, levelStr.find_first_not_of(" \t"));
        levelStr.erase(levelStr.find_last_not_of(" \t") + 1);

        auto level = parseLevelString(levelStr);

        if (channel == "*") {
            for (LogChannel c : kAllChannels) {
                if (auto logger = spdlog::get(toString(c))) {
                    logger->set_level(level);
                }
            }
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::createChannelLoggers(spdlog::level::level_enum level)
{
    for (LogChannel channel : kAllChannels) {
        createLogger(toString(channel), sharedSinks_, level);
    }
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    auto config = loadConfigFile(configPath);
    applyConfig(config, componentName);

    initialized_ = true;
    return true;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return nlohmann::json{
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kDefaultLogFile },
                { "truncate", true } } } } },
        { "channels",
          { { "auth", "info" },
            { "bridge", "info" },
            { "broadcast", "info" },
            { "dispatch", "info" },
            { "host", "info" },
            { "network", "info" },
            { "protocol", "info" },
            { "state", "debug" } } }
    };
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    // Try .local version first.
    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
        spdlog::info("Using default config: {}", configPath);
    }
    else {
        spdlog::info("Config file not found, creating default: {}", configPath);
        try {
            std::ofstream configFile(configPath);
            if (!configFile.is_open()) {
                spdlog::warn("Could not create config file, using built-in defaults");
                return defaultConfig();
            }
            configFile << defaultConfig().dump(2) << std::endl;
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to write default config file {}: {}", configPath, e.what());
        }
        return defaultConfig();
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("Cannot open config file {}, using built-in defaults", pathToUse);
            return defaultConfig();
        }

        nlohmann::json config = nlohmann::json::parse(configFile);
        spdlog::info("Loaded logging config from {}", pathToUse);
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse config file {}: {}", pathToUse, e.what());
        spdlog::error("Fix the JSON syntax or delete the file to regenerate defaults.");
        return defaultConfig();
    }
    catch (const std::exception& e) {
        spdlog::error("Error reading config file {}: {}", pathToUse, e.what());
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string pattern = kBasePattern;
    int flushIntervalMs = 1000;
    bool consoleEnabled = true;
    bool fileEnabled = true;
    bool truncate = true;
    std::string filePath = kDefaultLogFile;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            consoleLevel = parseLevelString(defaults.value("console_level", "info"));
            fileLevel = parseLevelString(defaults.value("file_level", "debug"));
            pattern = defaults.value("pattern", pattern);
            flushIntervalMs = defaults.value("flush_interval_ms", flushIntervalMs);
        }
        if (config.contains("sinks")) {
            const auto& sinks = config["sinks"];
            if (sinks.contains("console")) {
                consoleEnabled = sinks["console"].value("enabled", true);
                consoleLevel = parseLevelString(sinks["console"].value("level", "info"));
            }
            if (sinks.contains("file")) {
                fileEnabled = sinks["file"].value("enabled", true);
                fileLevel = parseLevelString(sinks["file"].value("level", "debug"));
                filePath = sinks["file"].value("path", filePath);
                truncate = sinks["file"].value("truncate", true);
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading logging config: {}, using built-in defaults", e.what());
    }

    sharedSinks_.clear();
    try {
        if (consoleEnabled) {
            auto consoleSink = makeConsoleSink(false);
            consoleSink->set_level(consoleLevel);
            sharedSinks_.push_back(consoleSink);
        }
        if (fileEnabled) {
            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, truncate);
            fileSink->set_level(fileLevel);
            sharedSinks_.push_back(fileSink);
        }
    }
    catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Error creating sinks from config: {}, logging to console only", e.what());
        sharedSinks_ = { makeConsoleSink(false) };
        fileEnabled = false;
    }

    const std::string componentPattern = withComponent(pattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(componentPattern);
    }

    createChannelLoggers(spdlog::level::trace);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    installDefaultLogger(
        componentName, consoleLevel, fileLevel, fileEnabled ? filePath : std::string(), false);

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
    SLOG_INFO("LoggingChannels configured (component={})", componentName);
}

void LoggingChannels::installDefaultLogger(
    const std::string& componentName,
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& filePath,
    bool consoleToStderr)
{
    // Separate sinks so the default logger's pattern (no channel name) doesn't leak.
    std::vector<spdlog::sink_ptr> defaultSinks;

    auto consoleSink = makeConsoleSink(consoleToStderr);
    consoleSink->set_level(consoleLevel);
    defaultSinks.push_back(consoleSink);

    if (!filePath.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, false);
        fileSink->set_level(fileLevel);
        defaultSinks.push_back(fileSink);
    }

    const std::string defaultPattern =
        withComponent("[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v", componentName);
    for (auto& sink : defaultSinks) {
        sink->set_pattern(defaultPattern);
    }

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    spdlog::drop(loggerName);
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);
}

} // namespace StenoBridge
