#pragma once

#include "core/Result.h"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace StenoBridge {
namespace Server {

struct TlsConfig {
    std::string certPath;
    std::string keyPath;
};

/**
 * @brief Everything the lifecycle manager needs to run one server instance.
 *
 * Loaded by the executable (see ConfigLoader) and handed over as a value.
 * Every JSON key is optional; missing keys keep the defaults below.
 */
struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8086;
    std::string path = "/websocket";

    std::string credentialPath = "stenobridge.key";
    bool generateCredential = true;

    uint32_t challengeTimeoutMs = 10000;
    // Zero disables the idle check.
    uint32_t idleTimeoutMs = 60000;
    uint32_t maxConnections = 32;
    uint32_t outboundQueueCapacity = 256;
    uint32_t eventBufferCapacity = 1024;
    uint32_t shutdownGraceMs = 2000;
    uint32_t maxMessageBytes = 1024 * 1024;

    uint32_t authMaxFailures = 3;
    uint32_t authFailureWindowMs = 60000;
    uint32_t authLockoutMs = 60000;

    // Remote hosts allowed to connect. Empty allows everyone.
    std::vector<std::string> allowedOrigins;

    std::optional<TlsConfig> tls;

    Result<std::monostate, std::string> validate() const;
};

void from_json(const nlohmann::json& j, ServerConfig& cfg);
void to_json(nlohmann::json& j, const ServerConfig& cfg);

} // namespace Server
} // namespace StenoBridge
