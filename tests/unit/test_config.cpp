#include <gtest/gtest.h>
#include "mcpconn/config.hpp"
#include "mcpconn/error.hpp"
#include "mcpconn/logging.hpp"
#include <cstdlib>
#include <map>

using namespace mcpconn;

namespace {

RegistryConfig::EnvLookup lookup_from(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

} // anonymous namespace

TEST(RegistryConfig, Defaults) {
    RegistryConfig cfg;
    EXPECT_EQ(cfg.max_connections, 10u);
    EXPECT_EQ(cfg.connection_timeout, std::chrono::seconds(30));
    EXPECT_EQ(cfg.execution_timeout, std::chrono::seconds(60));
    EXPECT_EQ(cfg.discovery_timeout, std::chrono::seconds(5));
    EXPECT_EQ(cfg.termination_grace, std::chrono::seconds(5));
    EXPECT_TRUE(cfg.is_allowed(Protocol::Stdio));
    EXPECT_TRUE(cfg.is_allowed(Protocol::Sse));
    EXPECT_TRUE(cfg.is_allowed(Protocol::WebSocket));
    EXPECT_EQ(cfg.client_info.name, DEFAULT_CLIENT_NAME);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(RegistryConfig, EmptyEnvironmentGivesDefaults) {
    auto cfg = RegistryConfig::from_lookup(lookup_from({}));
    EXPECT_EQ(cfg.max_connections, 10u);
    EXPECT_EQ(cfg.allowed_protocols.size(), 3u);
}

TEST(RegistryConfig, ReadsAllVariables) {
    auto cfg = RegistryConfig::from_lookup(lookup_from({
        {"MAX_MCP_CONNECTIONS", "3"},
        {"ALLOWED_MCP_PROTOCOLS", " stdio , sse,stdio"},
        {"MCP_CONNECTION_TIMEOUT", "7"},
        {"MCP_EXECUTION_TIMEOUT", "90"},
        {"MCP_DISCOVERY_TIMEOUT", "2"},
        {"MCP_TERMINATION_GRACE", "1"},
        {"MCP_CLIENT_NAME", "gateway"},
        {"MCP_CLIENT_VERSION", "4.2"},
        {"LOG_LEVEL", "WARNING"},
    }));
    EXPECT_EQ(cfg.max_connections, 3u);
    ASSERT_EQ(cfg.allowed_protocols.size(), 2u);
    EXPECT_FALSE(cfg.is_allowed(Protocol::WebSocket));
    EXPECT_EQ(cfg.connection_timeout, std::chrono::seconds(7));
    EXPECT_EQ(cfg.execution_timeout, std::chrono::seconds(90));
    EXPECT_EQ(cfg.discovery_timeout, std::chrono::seconds(2));
    EXPECT_EQ(cfg.termination_grace, std::chrono::seconds(1));
    EXPECT_EQ(cfg.client_info, (Implementation{"gateway", "4.2"}));
    EXPECT_EQ(cfg.log_level, std::optional<spdlog::level::level_enum>(spdlog::level::warn));
}

TEST(RegistryConfig, RejectsMalformedNumbers) {
    EXPECT_THROW(RegistryConfig::from_lookup(lookup_from({{"MAX_MCP_CONNECTIONS", "ten"}})),
                 ConfigurationError);
    EXPECT_THROW(RegistryConfig::from_lookup(lookup_from({{"MAX_MCP_CONNECTIONS", "0"}})),
                 ConfigurationError);
    EXPECT_THROW(RegistryConfig::from_lookup(lookup_from({{"MCP_EXECUTION_TIMEOUT", "-5"}})),
                 ConfigurationError);
    EXPECT_THROW(RegistryConfig::from_lookup(lookup_from({{"MCP_CONNECTION_TIMEOUT", "3s"}})),
                 ConfigurationError);
}

TEST(RegistryConfig, RejectsTimeoutsThatWouldOverflow) {
    EXPECT_THROW(RegistryConfig::from_lookup(
                     lookup_from({{"MCP_EXECUTION_TIMEOUT", "10000000000000000"}})),
                 ConfigurationError);
    EXPECT_THROW(RegistryConfig::from_lookup(
                     lookup_from({{"MCP_CONNECTION_TIMEOUT", "99999999999999999999"}})),
                 ConfigurationError);
    EXPECT_THROW(RegistryConfig::from_lookup(lookup_from({{"MCP_DISCOVERY_TIMEOUT", "86401"}})),
                 ConfigurationError);

    auto cfg = RegistryConfig::from_lookup(lookup_from({{"MCP_EXECUTION_TIMEOUT", "86400"}}));
    EXPECT_EQ(cfg.execution_timeout, MAX_TIMEOUT);

    RegistryConfig hand_built;
    hand_built.execution_timeout = std::chrono::milliseconds::max();
    EXPECT_THROW(hand_built.validate(), ConfigurationError);
}

TEST(RegistryConfig, TerminationGraceMayBeZero) {
    auto cfg = RegistryConfig::from_lookup(lookup_from({{"MCP_TERMINATION_GRACE", "0"}}));
    EXPECT_EQ(cfg.termination_grace, std::chrono::milliseconds(0));
    EXPECT_THROW(RegistryConfig::from_lookup(lookup_from({{"MCP_TERMINATION_GRACE", "-1"}})),
                 ConfigurationError);
}

TEST(RegistryConfig, LogLevelUnsetByDefault) {
    EXPECT_FALSE(RegistryConfig{}.log_level.has_value());
    EXPECT_FALSE(RegistryConfig::from_lookup(lookup_from({})).log_level.has_value());
}

TEST(RegistryConfig, RejectsUnknownProtocol) {
    EXPECT_THROW(RegistryConfig::from_lookup(lookup_from({{"ALLOWED_MCP_PROTOCOLS", "stdio,grpc"}})),
                 ConfigurationError);
}

TEST(RegistryConfig, RejectsEmptyProtocolList) {
    EXPECT_THROW(RegistryConfig::from_lookup(lookup_from({{"ALLOWED_MCP_PROTOCOLS", " , "}})),
                 ConfigurationError);
}

TEST(RegistryConfig, RejectsUnknownLogLevel) {
    EXPECT_THROW(RegistryConfig::from_lookup(lookup_from({{"LOG_LEVEL", "chatty"}})),
                 ConfigurationError);
}

TEST(RegistryConfig, ValidateHandBuilt) {
    RegistryConfig cfg;
    cfg.max_connections = 0;
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg = RegistryConfig{};
    cfg.execution_timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(cfg.validate(), ConfigurationError);
}

TEST(RegistryConfig, FromProcessEnvironment) {
    ::setenv("MAX_MCP_CONNECTIONS", "4", 1);
    ::setenv("MCP_EXECUTION_TIMEOUT", "12", 1);
    auto cfg = RegistryConfig::from_env();
    ::unsetenv("MAX_MCP_CONNECTIONS");
    ::unsetenv("MCP_EXECUTION_TIMEOUT");

    EXPECT_EQ(cfg.max_connections, 4u);
    EXPECT_EQ(cfg.execution_timeout, std::chrono::seconds(12));
}

TEST(Logging, ParseLevel) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("Info"), spdlog::level::info);
    EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_THROW(parse_log_level("loud"), ConfigurationError);
}

TEST(Logging, SharedLogger) {
    auto a = logger();
    auto b = logger();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(a->name(), "mcpconn");
}
