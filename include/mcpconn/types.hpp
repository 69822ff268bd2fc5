#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpconn {

// ---------- Enumerations ----------

enum class Protocol {
    Stdio,
    Sse,
    WebSocket
};

[[nodiscard]] std::string_view protocol_to_string(Protocol p);
[[nodiscard]] std::optional<Protocol> protocol_from_string(std::string_view s);

enum class ConnectionStatus {
    Connecting,
    Connected,
    Error,
    Disconnected
};

[[nodiscard]] std::string_view status_to_string(ConnectionStatus s);

/// Error and Disconnected are terminal.
[[nodiscard]] constexpr bool is_terminal(ConnectionStatus s) noexcept {
    return s == ConnectionStatus::Error || s == ConnectionStatus::Disconnected;
}

// ---------- Identity ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

// ---------- Connection views ----------

using EnvMap = std::map<std::string, std::string>;

/// Milliseconds since the Unix epoch.
using TimestampMs = int64_t;

[[nodiscard]] TimestampMs now_ms();

/// Upper bound for any wait. Longer requests are clamped to it so that
/// `steady_clock::now() + timeout` cannot overflow.
constexpr std::chrono::milliseconds MAX_TIMEOUT = std::chrono::hours(24);

struct ConnectionSummary {
    std::string connection_id;
    std::string name;
    Protocol protocol = Protocol::Stdio;
    ConnectionStatus status = ConnectionStatus::Connecting;
    TimestampMs created_at = 0;
    std::optional<TimestampMs> last_activity;
    bool is_alive = false;
    std::size_t tools_count = 0;
    std::size_t resources_count = 0;
    std::optional<nlohmann::json> server_info;
};

struct ConnectionDetails : ConnectionSummary {
    std::vector<std::string> command;
    std::vector<std::string> args;
    nlohmann::json tools = nlohmann::json::array();
    nlohmann::json resources = nlohmann::json::array();
};

/// Raw `result` of a successful tools/call.
struct ToolResult {
    nlohmann::json result;

    bool operator==(const ToolResult& o) const { return result == o.result; }
};

// ---------- JSON conversions ----------

void to_json(nlohmann::json& j, const Implementation& i);
void from_json(const nlohmann::json& j, Implementation& i);

void to_json(nlohmann::json& j, const ConnectionSummary& s);
void to_json(nlohmann::json& j, const ConnectionDetails& d);

} // namespace mcpconn
