/// mcpctl: connects to one stdio MCP server through a ConnectionRegistry,
/// prints what the handshake discovered and optionally calls a tool.
/// Usage: ./mcpctl [--call <tool> [<json-arguments>]] <server_command> [args...]
/// Example: ./mcpctl --call echo '{"text":"hi"}' ./fake_mcp_server
///
/// Registry limits and timeouts come from the environment
/// (MAX_MCP_CONNECTIONS, MCP_CONNECTION_TIMEOUT, LOG_LEVEL, ...).

#include <mcpconn/mcpconn.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--call <tool> [<json-arguments>]] <server_command> [args...]\n";
    std::cerr << "Example: " << prog << " --call echo '{\"text\":\"hi\"}' ./fake_mcp_server\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> tool;
    nlohmann::json arguments = nlohmann::json::object();

    int i = 1;
    if (i < argc && std::string(argv[i]) == "--call") {
        if (i + 1 >= argc) {
            usage(argv[0]);
            return 1;
        }
        tool = argv[i + 1];
        i += 2;
        // Optional JSON arguments, recognised by a leading '{'.
        if (i < argc && argv[i][0] == '{') {
            arguments = nlohmann::json::parse(argv[i], nullptr, false);
            if (arguments.is_discarded() || !arguments.is_object()) {
                std::cerr << "Tool arguments must be a JSON object\n";
                return 1;
            }
            ++i;
        }
    }
    if (i >= argc) {
        usage(argv[0]);
        return 1;
    }

    std::vector<std::string> command{argv[i]};
    std::vector<std::string> args(argv + i + 1, argv + argc);

    mcpconn::RegistryConfig config;
    try {
        config = mcpconn::RegistryConfig::from_env();
    } catch (const mcpconn::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    mcpconn::ConnectionRegistry registry{config};

    std::cout << "Connecting to: " << command.front() << "\n";
    auto connected = registry.connect("mcpctl", command, args);
    if (!mcpconn::is_ok(connected)) {
        const auto& err = mcpconn::get_error(connected);
        std::cerr << mcpconn::error_kind_to_string(err.kind) << ": " << err.message << "\n";
        return 1;
    }
    const auto& details = mcpconn::get_value(connected);

    if (details.server_info) {
        const auto& info = *details.server_info;
        auto server = info.value("serverInfo", nlohmann::json::object());
        std::cout << "Connected to: " << server.value("name", "?")
                  << " v" << server.value("version", "?")
                  << " (protocol " << info.value("protocolVersion", "?") << ")\n";
    }
    std::cout << "Connection id: " << details.connection_id << "\n";

    std::cout << "\n--- Tools ---\n";
    if (details.tools.empty()) std::cout << "  (none)\n";
    for (const auto& t : details.tools) {
        std::cout << "  " << t.value("name", "?");
        if (t.contains("description") && t["description"].is_string()) {
            std::cout << " - " << t["description"].get<std::string>();
        }
        std::cout << "\n";
    }

    std::cout << "\n--- Resources ---\n";
    if (details.resources.empty()) std::cout << "  (none)\n";
    for (const auto& r : details.resources) {
        std::cout << "  " << r.value("uri", "?") << " (" << r.value("name", "") << ")\n";
    }

    int rc = 0;
    if (tool) {
        std::cout << "\n--- Calling " << *tool << " ---\n";
        auto result = registry.execute_tool(details.connection_id, *tool, arguments);
        if (mcpconn::is_ok(result)) {
            std::cout << mcpconn::get_value(result).result.dump(2) << "\n";
        } else {
            nlohmann::json err = mcpconn::get_error(result);
            std::cerr << err.dump(2) << "\n";
            rc = 1;
        }
    }

    auto gone = registry.disconnect(details.connection_id);
    if (mcpconn::is_ok(gone)) {
        std::cout << "Disconnected.\n";
    }
    return rc;
}
