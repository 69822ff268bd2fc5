#pragma once
#include "client.hpp"
#include "config.hpp"
#include "process.hpp"
#include "types.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpconn {

class PipeTransport;

struct ConnectionSpec {
    std::string connection_id;
    std::string name;
    std::vector<std::string> command;
    std::vector<std::string> args;
    EnvMap env;
    Protocol protocol = Protocol::Stdio;
};

/// One child process and its MCP session.
///
/// Status moves connecting -> connected -> {error, disconnected} and never
/// back. The process handle is held exactly while the status is connecting
/// or connected. All members are guarded by one mutex that is never held
/// across pipe I/O, so a slow tool call does not block status queries.
class Connection {
public:
    explicit Connection(ConnectionSpec spec);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return spec_.connection_id; }
    [[nodiscard]] const ConnectionSpec& spec() const noexcept { return spec_; }

    /// Spawn the process and run the handshake. On failure the process is
    /// terminated, the status becomes error, and the exception is rethrown
    /// (LaunchError or HandshakeError).
    void open(const RegistryConfig& config);

    /// Non-blocking exit check. A connected child that has exited moves the
    /// connection to disconnected and drops its handle. Returns liveness.
    bool refresh_liveness();

    /// tools/call on this connection. Throws ProcessDeadError if the child
    /// is gone (checked before any I/O, and again after a transport failure),
    /// TimeoutError, ToolNotFoundError, ToolExecutionError, or
    /// DesynchronizedError (after which the connection is torn down).
    [[nodiscard]] ToolResult call_tool(const std::string& tool_name,
                                       const nlohmann::json& arguments,
                                       std::chrono::milliseconds timeout);

    /// Stop the session and terminate the child (SIGTERM, grace, SIGKILL).
    /// Idempotent.
    void close();

    [[nodiscard]] ConnectionStatus status() const;
    [[nodiscard]] std::optional<pid_t> pid() const;
    /// Known once the child has been reaped.
    [[nodiscard]] std::optional<int> exit_code() const;
    [[nodiscard]] ConnectionSummary summary() const;
    [[nodiscard]] ConnectionDetails details() const;
    [[nodiscard]] nlohmann::json tools() const;
    [[nodiscard]] nlohmann::json resources() const;

private:
    /// Detach process and client under the lock, stop them outside it.
    void teardown(ConnectionStatus final_status);
    bool wait_for_exit(std::chrono::milliseconds max_wait);
    void fill_summary(ConnectionSummary& s) const;

    const ConnectionSpec spec_;
    const TimestampMs created_at_;

    mutable std::mutex mutex_;
    ConnectionStatus status_{ConnectionStatus::Connecting};
    std::unique_ptr<ChildProcess> process_;
    std::shared_ptr<ProtocolClient> client_;
    std::chrono::milliseconds grace_{ChildProcess::DEFAULT_GRACE};
    std::optional<pid_t> pid_;
    std::optional<int> exit_code_;

    std::optional<nlohmann::json> server_info_;
    nlohmann::json tools_ = nlohmann::json::array();
    nlohmann::json resources_ = nlohmann::json::array();
    std::optional<TimestampMs> last_activity_;
};

} // namespace mcpconn
