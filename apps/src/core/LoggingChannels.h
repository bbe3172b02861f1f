#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace StenoBridge {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Auth, Bridge, Broadcast, Dispatch, Host, Network, Protocol, State };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Auth:
            return "auth";
        case LogChannel::Bridge:
            return "bridge";
        case LogChannel::Broadcast:
            return "broadcast";
        case LogChannel::Dispatch:
            return "dispatch";
        case LogChannel::Host:
            return "host";
        case LogChannel::Network:
            return "network";
        case LogChannel::Protocol:
            return "protocol";
        case LogChannel::State:
            return "state";
    }
    return "";
}

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Provides named loggers for different subsystems so that, for example, the
 * handshake path can be traced without flooding the log with broadcast noise.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for the pattern (e.g., "server", "cli")
     * @param consoleToStderr Send console output to stderr instead of stdout
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath> if not found.
     * @return true if config was loaded successfully, false if using defaults
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    /**
     * @brief Get a specific channel logger.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "auth:trace,network:debug" - Set auth to trace, network to debug
     *   "*:off,dispatch:debug" - Disable all except dispatch
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static void createChannelLoggers(spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    /**
     * @brief Load JSON config from file, with .local override support.
     * Creates a default config file if neither exists.
     */
    static nlohmann::json loadConfigFile(const std::string& configPath);

    static nlohmann::json defaultConfig();

    static void applyConfig(const nlohmann::json& config, const std::string& componentName);

    static void installDefaultLogger(
        const std::string& componentName,
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& filePath,
        bool consoleToStderr);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// Undefine any existing LOG_* macros (e.g., from libdatachannel).
#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...)                                                             \
    SPDLOG_LOGGER_TRACE(                                                                    \
        ::StenoBridge::LoggingChannels::get(::StenoBridge::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...)                                                             \
    SPDLOG_LOGGER_DEBUG(                                                                    \
        ::StenoBridge::LoggingChannels::get(::StenoBridge::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...)                                                              \
    SPDLOG_LOGGER_INFO(                                                                     \
        ::StenoBridge::LoggingChannels::get(::StenoBridge::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...)                                                              \
    SPDLOG_LOGGER_WARN(                                                                     \
        ::StenoBridge::LoggingChannels::get(::StenoBridge::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...)                                                             \
    SPDLOG_LOGGER_ERROR(                                                                    \
        ::StenoBridge::LoggingChannels::get(::StenoBridge::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace StenoBridge
