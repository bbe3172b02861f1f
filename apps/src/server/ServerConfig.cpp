#include "ServerConfig.h"
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace StenoBridge {
namespace Server {

namespace {

// nlohmann's own number conversion wraps or truncates out-of-range values.
template <typename T>
T readUnsigned(const nlohmann::json& j, const char* key, T fallback)
{
    const auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " must be an integer, got " + it->dump());
    }
    if (it->is_number_unsigned()) {
        const auto value = it->get<uint64_t>();
        if (value > std::numeric_limits<T>::max()) {
            throw std::invalid_argument(
                std::string(key) + " must be at most " + std::to_string(std::numeric_limits<T>::max())
                + ", got " + it->dump());
        }
        return static_cast<T>(value);
    }
    throw std::invalid_argument(std::string(key) + " must not be negative, got " + it->dump());
}

} // namespace

Result<std::monostate, std::string> ServerConfig::validate() const
{
    using R = Result<std::monostate, std::string>;

    if (host.empty()) {
        return R::error("host must not be empty");
    }
    if (path.empty() || path.front() != '/') {
        return R::error("path must start with '/': " + path);
    }
    if (credentialPath.empty()) {
        return R::error("credential_path must not be empty");
    }
    if (challengeTimeoutMs == 0) {
        return R::error("challenge_timeout_ms must be positive");
    }
    if (maxConnections == 0) {
        return R::error("max_connections must be positive");
    }
    if (outboundQueueCapacity == 0) {
        return R::error("outbound_queue_capacity must be positive");
    }
    if (eventBufferCapacity == 0) {
        return R::error("event_buffer_capacity must be positive");
    }
    if (maxMessageBytes == 0) {
        return R::error("max_message_bytes must be positive");
    }
    if (tls.has_value() && (tls->certPath.empty() || tls->keyPath.empty())) {
        return R::error("tls needs both cert_path and key_path");
    }
    return R::okay(std::monostate{});
}

void from_json(const nlohmann::json& j, ServerConfig& cfg)
{
    if (!j.is_object()) {
        throw std::invalid_argument("server config must be a JSON object");
    }

    cfg.host = j.value("host", cfg.host);
    cfg.port = readUnsigned(j, "port", cfg.port);
    cfg.path = j.value("path", cfg.path);
    cfg.credentialPath = j.value("credential_path", cfg.credentialPath);
    cfg.generateCredential = j.value("generate_credential", cfg.generateCredential);
    cfg.challengeTimeoutMs = readUnsigned(j, "challenge_timeout_ms", cfg.challengeTimeoutMs);
    cfg.idleTimeoutMs = readUnsigned(j, "idle_timeout_ms", cfg.idleTimeoutMs);
    cfg.maxConnections = readUnsigned(j, "max_connections", cfg.maxConnections);
    cfg.outboundQueueCapacity = readUnsigned(j, "outbound_queue_capacity", cfg.outboundQueueCapacity);
    cfg.eventBufferCapacity = readUnsigned(j, "event_buffer_capacity", cfg.eventBufferCapacity);
    cfg.shutdownGraceMs = readUnsigned(j, "shutdown_grace_ms", cfg.shutdownGraceMs);
    cfg.maxMessageBytes = readUnsigned(j, "max_message_bytes", cfg.maxMessageBytes);
    cfg.authMaxFailures = readUnsigned(j, "auth_max_failures", cfg.authMaxFailures);
    cfg.authFailureWindowMs = readUnsigned(j, "auth_failure_window_ms", cfg.authFailureWindowMs);
    cfg.authLockoutMs = readUnsigned(j, "auth_lockout_ms", cfg.authLockoutMs);

    if (j.contains("allowed_origins")) {
        cfg.allowedOrigins = j.at("allowed_origins").get<std::vector<std::string>>();
    }

    if (j.contains("tls") && !j.at("tls").is_null()) {
        const auto& tls = j.at("tls");
        cfg.tls = TlsConfig{ .certPath = tls.value("cert_path", std::string()),
                             .keyPath = tls.value("key_path", std::string()) };
    }
}

void to_json(nlohmann::json& j, const ServerConfig& cfg)
{
    j = nlohmann::json{
        { "host", cfg.host },
        { "port", cfg.port },
        { "path", cfg.path },
        { "credential_path", cfg.credentialPath },
        { "generate_credential", cfg.generateCredential },
        { "challenge_timeout_ms", cfg.challengeTimeoutMs },
        { "idle_timeout_ms", cfg.idleTimeoutMs },
        { "max_connections", cfg.maxConnections },
        { "outbound_queue_capacity", cfg.outboundQueueCapacity },
        { "event_buffer_capacity", cfg.eventBufferCapacity },
        { "shutdown_grace_ms", cfg.shutdownGraceMs },
        { "max_message_bytes", cfg.maxMessageBytes },
        { "auth_max_failures", cfg.authMaxFailures },
        { "auth_failure_window_ms", cfg.authFailureWindowMs },
        { "auth_lockout_ms", cfg.authLockoutMs },
        { "allowed_origins", cfg.allowedOrigins },
    };
    if (cfg.tls.has_value()) {
        j["tls"] = { { "cert_path", cfg.tls->certPath }, { "key_path", cfg.tls->keyPath } };
    }
}

} // namespace Server
} // namespace StenoBridge
