#include "mcpconn/types.hpp"
#include <chrono>

namespace mcpconn {

std::string_view protocol_to_string(Protocol p) {
    switch (p) {
        case Protocol::Stdio:     return "stdio";
        case Protocol::Sse:       return "sse";
        case Protocol::WebSocket: return "websocket";
    }
    return "stdio";
}

std::optional<Protocol> protocol_from_string(std::string_view s) {
    if (s == "stdio")     return Protocol::Stdio;
    if (s == "sse")       return Protocol::Sse;
    if (s == "websocket") return Protocol::WebSocket;
    return std::nullopt;
}

std::string_view status_to_string(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Error:        return "error";
        case ConnectionStatus::Disconnected: return "disconnected";
    }
    return "error";
}

TimestampMs now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void to_json(nlohmann::json& j, const Implementation& i) {
    j = nlohmann::json{{"name", i.name}, {"version", i.version}};
}

void from_json(const nlohmann::json& j, Implementation& i) {
    i.name = j.at("name").get<std::string>();
    i.version = j.value("version", "");
}

void to_json(nlohmann::json& j, const ConnectionSummary& s) {
    j = nlohmann::json::object();
    j["connection_id"] = s.connection_id;
    j["name"] = s.name;
    j["protocol"] = std::string(protocol_to_string(s.protocol));
    j["status"] = std::string(status_to_string(s.status));
    j["created_at"] = s.created_at;
    j["last_activity"] = s.last_activity ? nlohmann::json(*s.last_activity) : nlohmann::json(nullptr);
    j["is_alive"] = s.is_alive;
    j["tools_count"] = s.tools_count;
    j["resources_count"] = s.resources_count;
    j["server_info"] = s.server_info ? *s.server_info : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const ConnectionDetails& d) {
    to_json(j, static_cast<const ConnectionSummary&>(d));
    j.erase("tools_count");
    j.erase("resources_count");
    j["command"] = d.command;
    j["args"] = d.args;
    j["tools"] = d.tools;
    j["resources"] = d.resources;
}

} // namespace mcpconn
