#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "session.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace mcpconn {

/// What the handshake learned about the server.
struct HandshakeResult {
    /// The `result` object of the initialize response.
    nlohmann::json server_info;
    nlohmann::json tools = nlohmann::json::array();
    nlohmann::json resources = nlohmann::json::array();
};

/// One MCP session over one transport.
///
/// A reader thread runs the transport's read loop and routes every response
/// to the pending request with the same id; late or unknown responses are
/// logged and dropped. Calls are serialized: one request in flight at a time.
class ProtocolClient {
public:
    struct Options {
        Implementation client_info;
        std::chrono::milliseconds handshake_timeout{30000};
        std::chrono::milliseconds discovery_timeout{5000};
        /// Used in log lines.
        std::string label = "server";
    };

    explicit ProtocolClient(Options opts);
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    /// Take the transport and start reading from it.
    void connect(std::unique_ptr<ITransport> transport);

    /// initialize, notifications/initialized, tools/list, resources/list.
    /// Throws HandshakeError if initialize fails; discovery failures yield
    /// empty lists.
    [[nodiscard]] HandshakeResult initialize();

    /// tools/call. Throws ToolNotFoundError / ToolExecutionError for error
    /// responses, TimeoutError, TransportError (DesynchronizedError if the
    /// session lost id correlation).
    [[nodiscard]] ToolResult call_tool(const std::string& name,
                                       const nlohmann::json& arguments,
                                       std::chrono::milliseconds timeout);

    /// Shut the transport down and fail anything still pending.
    void close();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] bool is_connected() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpconn
