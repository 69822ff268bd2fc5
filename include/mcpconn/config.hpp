#pragma once
#include "types.hpp"
#include "version.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/common.h>

namespace mcpconn {

struct RegistryConfig {
    std::size_t max_connections = 10;
    std::vector<Protocol> allowed_protocols{Protocol::Stdio, Protocol::Sse, Protocol::WebSocket};

    /// Bound on the `initialize` exchange.
    std::chrono::milliseconds connection_timeout{30000};
    /// Default bound on a tools/call when the caller passes none.
    std::chrono::milliseconds execution_timeout{60000};
    /// Bound on each of tools/list and resources/list during handshake.
    std::chrono::milliseconds discovery_timeout{5000};
    /// Wait between SIGTERM and SIGKILL.
    std::chrono::milliseconds termination_grace{5000};

    Implementation client_info{std::string(DEFAULT_CLIENT_NAME), std::string(LIBRARY_VERSION)};
    /// Applied by ConnectionRegistry to the process-wide "mcpconn" logger.
    /// Unset leaves the logger's current level alone.
    std::optional<spdlog::level::level_enum> log_level;

    /// Read overrides from the process environment:
    /// MAX_MCP_CONNECTIONS, ALLOWED_MCP_PROTOCOLS, MCP_CONNECTION_TIMEOUT,
    /// MCP_EXECUTION_TIMEOUT, MCP_DISCOVERY_TIMEOUT, MCP_TERMINATION_GRACE
    /// (timeouts in seconds), MCP_CLIENT_NAME, MCP_CLIENT_VERSION, LOG_LEVEL.
    /// Throws ConfigurationError on malformed values.
    [[nodiscard]] static RegistryConfig from_env();

    /// Same as from_env() with an injectable lookup, for tests.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
    [[nodiscard]] static RegistryConfig from_lookup(const EnvLookup& lookup);

    /// Throws ConfigurationError if the configuration cannot be used,
    /// including timeouts above MAX_TIMEOUT.
    void validate() const;

    [[nodiscard]] bool is_allowed(Protocol p) const;
};

} // namespace mcpconn
