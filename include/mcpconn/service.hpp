#pragma once
#include "registry.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace mcpconn {

/// JSON front end over a ConnectionRegistry. Every call returns an object
/// with "status" set to "success" or "error"; error objects also carry
/// "error" and "error_type". Nothing throws.
class ConnectionService {
public:
    explicit ConnectionService(ConnectionRegistry& registry) : registry_(registry) {}

    /// Body: {"name": str, "command": str | [str], "args"?: [str],
    ///        "env"?: {str: str}, "protocol"?: str}
    [[nodiscard]] nlohmann::json connect(const nlohmann::json& body);
    [[nodiscard]] nlohmann::json disconnect(const std::string& connection_id);
    [[nodiscard]] nlohmann::json list_connections();
    [[nodiscard]] nlohmann::json get_connection_status(const std::string& connection_id);
    [[nodiscard]] nlohmann::json execute_tool(const std::string& connection_id,
                                              const std::string& tool_name,
                                              const nlohmann::json& arguments);
    [[nodiscard]] nlohmann::json list_tools(const std::string& connection_id);
    [[nodiscard]] nlohmann::json list_resources(const std::string& connection_id);

private:
    ConnectionRegistry& registry_;
};

} // namespace mcpconn
