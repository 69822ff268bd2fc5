#include "mcpconn/service.hpp"
#include "mcpconn/error.hpp"

namespace mcpconn {

namespace {

nlohmann::json failure(ErrorKind kind, const std::string& message) {
    return Error{kind, message, std::nullopt};
}

nlohmann::json not_found(const std::string& connection_id) {
    return failure(ErrorKind::NotFound, "Connection not found: " + connection_id);
}

std::vector<std::string> string_list(const nlohmann::json& v, const char* field) {
    if (!v.is_array()) {
        throw ConfigurationError(std::string("'") + field + "' must be an array of strings");
    }
    std::vector<std::string> out;
    out.reserve(v.size());
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw ConfigurationError(std::string("'") + field + "' must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

struct ConnectRequest {
    std::string name;
    std::vector<std::string> command;
    std::vector<std::string> args;
    EnvMap env;
    std::string protocol = "stdio";
};

ConnectRequest parse_connect_body(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw ConfigurationError("Request body must be a JSON object");
    }

    ConnectRequest req;
    auto name = body.find("name");
    if (name == body.end() || !name->is_string() || name->get<std::string>().empty()) {
        throw ConfigurationError("'name' is required and must be a non-empty string");
    }
    req.name = name->get<std::string>();

    auto command = body.find("command");
    if (command == body.end()) {
        throw ConfigurationError("'command' is required");
    }
    if (command->is_string()) {
        req.command.push_back(command->get<std::string>());
    } else {
        req.command = string_list(*command, "command");
    }

    if (auto args = body.find("args"); args != body.end() && !args->is_null()) {
        req.args = string_list(*args, "args");
    }

    if (auto env = body.find("env"); env != body.end() && !env->is_null()) {
        if (!env->is_object()) {
            throw ConfigurationError("'env' must be an object of strings");
        }
        for (auto it = env->begin(); it != env->end(); ++it) {
            if (!it.value().is_string()) {
                throw ConfigurationError("'env' value for '" + it.key() + "' must be a string");
            }
            req.env[it.key()] = it.value().get<std::string>();
        }
    }

    if (auto protocol = body.find("protocol"); protocol != body.end() && !protocol->is_null()) {
        if (!protocol->is_string()) {
            throw ConfigurationError("'protocol' must be a string");
        }
        req.protocol = protocol->get<std::string>();
    }
    return req;
}

} // anonymous namespace

nlohmann::json ConnectionService::connect(const nlohmann::json& body) {
    ConnectRequest req;
    try {
        req = parse_connect_body(body);
    } catch (const ConfigurationError& e) {
        return failure(ErrorKind::ConfigurationError, e.what());
    }

    auto result = registry_.connect(req.name, req.command, req.args, req.env, req.protocol);
    if (!is_ok(result)) return get_error(result);

    const auto& d = get_value(result);
    return {
        {"status", "success"},
        {"connection_id", d.connection_id},
        {"name", d.name},
        {"server_info", d.server_info ? *d.server_info : nlohmann::json(nullptr)},
        {"tools", d.tools},
        {"resources", d.resources}
    };
}

nlohmann::json ConnectionService::disconnect(const std::string& connection_id) {
    auto result = registry_.disconnect(connection_id);
    if (!is_ok(result)) return get_error(result);
    return {{"status", "success"}, {"message", "Connection " + connection_id + " disconnected"}};
}

nlohmann::json ConnectionService::list_connections() {
    auto summaries = registry_.list();
    nlohmann::json connections = nlohmann::json::array();
    for (const auto& s : summaries) connections.push_back(s);
    return {{"status", "success"}, {"connections", connections}, {"count", summaries.size()}};
}

nlohmann::json ConnectionService::get_connection_status(const std::string& connection_id) {
    auto details = registry_.get_status(connection_id);
    if (!details) return not_found(connection_id);
    return {{"status", "success"}, {"connection_status", nlohmann::json(*details)}};
}

nlohmann::json ConnectionService::execute_tool(const std::string& connection_id,
                                               const std::string& tool_name,
                                               const nlohmann::json& arguments) {
    if (tool_name.empty()) {
        return failure(ErrorKind::ConfigurationError, "'tool_name' must not be empty");
    }
    if (!arguments.is_null() && !arguments.is_object()) {
        return failure(ErrorKind::ConfigurationError, "'arguments' must be an object");
    }
    auto result = registry_.execute_tool(connection_id, tool_name, arguments);
    if (!is_ok(result)) return get_error(result);
    return {{"status", "success"}, {"result", get_value(result).result}};
}

nlohmann::json ConnectionService::list_tools(const std::string& connection_id) {
    auto tools = registry_.list_tools(connection_id);
    if (!tools) return not_found(connection_id);
    return {{"status", "success"}, {"tools", *tools}, {"count", tools->size()}};
}

nlohmann::json ConnectionService::list_resources(const std::string& connection_id) {
    auto resources = registry_.list_resources(connection_id);
    if (!resources) return not_found(connection_id);
    return {{"status", "success"}, {"resources", *resources}, {"count", resources->size()}};
}

} // namespace mcpconn
