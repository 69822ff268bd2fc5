#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace mcpconn {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid configuration or request parameters (disallowed protocol, bad body).
class ConfigurationError : public McpError {
public:
    using McpError::McpError;
};

/// The registry already holds the configured maximum of live connections.
class CapacityError : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

/// The child process could not be spawned.
class LaunchError : public McpError {
public:
    int os_error;
    LaunchError(const std::string& msg, int os_error = 0)
        : McpError(msg), os_error(os_error) {}
};

/// `initialize` timed out, failed or returned something unusable.
class HandshakeError : public McpError {
public:
    using McpError::McpError;
};

class ParseError : public McpError {
public:
    using McpError::McpError;
};

/// Pipe I/O failed or the peer closed its end.
class TransportError : public McpError {
public:
    using McpError::McpError;
};

/// A response arrived that cannot be matched to a request by id.
class DesynchronizedError : public TransportError {
public:
    using TransportError::TransportError;
};

class TimeoutError : public McpError {
public:
    using McpError::McpError;
};

/// The server answered a request with a JSON-RPC error object.
class ToolExecutionError : public McpError {
public:
    int code;
    nlohmann::json error;
    ToolExecutionError(int code, const std::string& msg, nlohmann::json error = nullptr)
        : McpError(msg), code(code), error(std::move(error)) {}
};

class ToolNotFoundError : public ToolExecutionError {
public:
    using ToolExecutionError::ToolExecutionError;
};

class NotFoundError : public McpError {
public:
    using McpError::McpError;
};

class ProcessDeadError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

// ---------- Registry boundary ----------

enum class ErrorKind {
    ConfigurationError,
    CapacityError,
    LaunchError,
    HandshakeError,
    ToolNotFound,
    ToolExecutionError,
    Timeout,
    NotFound,
    ProcessDead,
    ProtocolError
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;
    /// Server-provided JSON-RPC error object, when there is one.
    std::optional<nlohmann::json> data;

    bool operator==(const Error& o) const {
        return kind == o.kind && message == o.message && data == o.data;
    }
};

/// Success value or structured error. No exception crosses the registry.
template <typename T>
using Result = std::variant<T, Error>;

/// Result of an operation with no payload.
struct Ok {
    bool operator==(const Ok&) const { return true; }
};

template <typename T>
[[nodiscard]] bool is_ok(const Result<T>& r) noexcept {
    return std::holds_alternative<T>(r);
}

template <typename T>
[[nodiscard]] const Error& get_error(const Result<T>& r) {
    return std::get<Error>(r);
}

template <typename T>
[[nodiscard]] const T& get_value(const Result<T>& r) {
    return std::get<T>(r);
}

/// Map the exception currently being handled to an Error. Must be called
/// from inside a catch block.
[[nodiscard]] Error error_from_current_exception();

void to_json(nlohmann::json& j, const Error& e);

} // namespace mcpconn
