#pragma once
#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpconn {

/// Owns every Connection. The only shared mutable map; all callers go
/// through it. Operations never throw: failures come back as Error values.
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(RegistryConfig config = {});
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// Spawn `command + args`, run the handshake, and register the result.
    /// `protocol` is parsed case-insensitively; only "stdio" is functional.
    [[nodiscard]] Result<ConnectionDetails> connect(const std::string& name,
                                                    const std::vector<std::string>& command,
                                                    const std::vector<std::string>& args = {},
                                                    const EnvMap& env = {},
                                                    const std::string& protocol = "stdio");

    /// Remove the entry and terminate its process. Exactly one of several
    /// concurrent calls for the same id succeeds.
    [[nodiscard]] Result<Ok> disconnect(const std::string& connection_id);

    /// Ordered by creation time. Refreshes liveness of every entry.
    [[nodiscard]] std::vector<ConnectionSummary> list();

    /// Refreshes liveness of the entry.
    [[nodiscard]] std::optional<ConnectionDetails> get_status(const std::string& connection_id);

    /// A zero `timeout` means the configured execution timeout.
    [[nodiscard]] Result<ToolResult> execute_tool(const std::string& connection_id,
                                                  const std::string& tool_name,
                                                  const nlohmann::json& arguments,
                                                  std::chrono::milliseconds timeout =
                                                      std::chrono::milliseconds::zero());

    /// Descriptors cached at handshake time.
    [[nodiscard]] std::optional<nlohmann::json> list_tools(const std::string& connection_id) const;
    [[nodiscard]] std::optional<nlohmann::json> list_resources(const std::string& connection_id) const;

    /// Disconnect everything.
    void shutdown();

    /// Number of entries, whatever their status.
    [[nodiscard]] std::size_t size() const;
    /// Entries with status connected, without refreshing liveness.
    [[nodiscard]] std::size_t live_count() const;

    [[nodiscard]] const RegistryConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<Connection> find(const std::string& connection_id) const;
    std::size_t live_count_locked() const;
    static std::string generate_id();

    const RegistryConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;
    /// connect() calls past the capacity check but not yet registered.
    std::size_t reserved_ = 0;
};

} // namespace mcpconn
