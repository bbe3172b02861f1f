#include "server/ServerConfig.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace StenoBridge::Server;

TEST(ServerConfigTest, DefaultsAreValid)
{
    ServerConfig config;

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8086);
    EXPECT_EQ(config.path, "/websocket");
    EXPECT_FALSE(config.tls.has_value());
    EXPECT_TRUE(config.validate().isValue());
}

TEST(ServerConfigTest, ParsesSnakeCaseKeysAndKeepsDefaultsForMissingOnes)
{
    const auto j = nlohmann::json::parse(R"({
        "port": 9000,
        "challenge_timeout_ms": 5000,
        "idle_timeout_ms": 0,
        "allowed_origins": ["127.0.0.1", "::1"],
        "tls": { "cert_path": "cert.pem", "key_path": "key.pem" }
    })");

    const auto config = j.get<ServerConfig>();

    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.challengeTimeoutMs, 5000u);
    EXPECT_EQ(config.idleTimeoutMs, 0u);
    EXPECT_EQ(config.allowedOrigins, (std::vector<std::string>{ "127.0.0.1", "::1" }));
    ASSERT_TRUE(config.tls.has_value());
    EXPECT_EQ(config.tls->certPath, "cert.pem");
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.outboundQueueCapacity, 256u);
}

TEST(ServerConfigTest, WrongTypeThrows)
{
    EXPECT_THROW(nlohmann::json::parse(R"({"port": "eighty"})").get<ServerConfig>(), std::invalid_argument);
    EXPECT_THROW(nlohmann::json::parse(R"({"host": 7})").get<ServerConfig>(), nlohmann::json::exception);
    EXPECT_THROW(nlohmann::json::array().get<ServerConfig>(), std::invalid_argument);
}

/**
 * @brief Numbers that do not fit their field are refused rather than wrapped
 * or truncated into a different, valid-looking value.
 */
TEST(ServerConfigTest, OutOfRangeNumbersThrowNamingTheKey)
{
    auto parseError = [](const char* text) -> std::string {
        try {
            nlohmann::json::parse(text).get<ServerConfig>();
        }
        catch (const std::invalid_argument& e) {
            return e.what();
        }
        return "";
    };

    const auto port = parseError(R"({"port": 70000})");
    EXPECT_NE(port.find("port"), std::string::npos) << port;
    EXPECT_NE(port.find("65535"), std::string::npos) << port;

    const auto negative = parseError(R"({"idle_timeout_ms": -1})");
    EXPECT_NE(negative.find("idle_timeout_ms"), std::string::npos) << negative;
    EXPECT_NE(negative.find("negative"), std::string::npos) << negative;

    const auto fraction = parseError(R"({"max_connections": 2.5})");
    EXPECT_NE(fraction.find("max_connections"), std::string::npos) << fraction;

    EXPECT_FALSE(parseError(R"({"shutdown_grace_ms": 4294967296})").empty());
}

TEST(ServerConfigTest, LimitsOfEachTypeAreAccepted)
{
    const auto config = nlohmann::json::parse(R"({"port": 65535, "auth_lockout_ms": 4294967295, "idle_timeout_ms": 0})")
                            .get<ServerConfig>();

    EXPECT_EQ(config.port, 65535);
    EXPECT_EQ(config.authLockoutMs, 4294967295u);
    EXPECT_EQ(config.idleTimeoutMs, 0u);
}

TEST(ServerConfigTest, ValidateNamesTheBadField)
{
    ServerConfig config;
    config.path = "websocket";
    ASSERT_TRUE(config.validate().isError());
    EXPECT_NE(config.validate().errorValue().find("path"), std::string::npos);

    config = ServerConfig{};
    config.outboundQueueCapacity = 0;
    EXPECT_NE(config.validate().errorValue().find("outbound_queue_capacity"), std::string::npos);

    config = ServerConfig{};
    config.tls = TlsConfig{ .certPath = "cert.pem", .keyPath = "" };
    EXPECT_TRUE(config.validate().isError());
}

TEST(ServerConfigTest, SerializesWhatItParses)
{
    ServerConfig config;
    config.port = 9100;
    config.allowedOrigins = { "10.0.0.2" };

    const nlohmann::json j = config;
    const auto parsed = j.get<ServerConfig>();

    EXPECT_EQ(j.at("port"), 9100);
    EXPECT_FALSE(j.contains("tls"));
    EXPECT_EQ(parsed.port, 9100);
    EXPECT_EQ(parsed.allowedOrigins, config.allowedOrigins);
}
