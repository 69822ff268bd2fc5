#include "mcpconn/config.hpp"
#include "mcpconn/error.hpp"
#include "mcpconn/logging.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace mcpconn {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

long long parse_integer(const std::string& var, const std::string& raw) {
    std::string value = trim(raw);
    if (value.empty()) {
        throw ConfigurationError(var + " must not be empty");
    }
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError(var + " must be an integer, got '" + raw + "'");
    }
    if (consumed != value.size()) {
        throw ConfigurationError(var + " must be an integer, got '" + raw + "'");
    }
    return parsed;
}

long long parse_positive(const std::string& var, const std::string& raw) {
    long long parsed = parse_integer(var, raw);
    if (parsed <= 0) {
        throw ConfigurationError(var + " must be positive, got '" + raw + "'");
    }
    return parsed;
}

/// Whole seconds, bounded by MAX_TIMEOUT.
std::chrono::milliseconds parse_seconds(const std::string& var, const std::string& raw,
                                        bool allow_zero = false) {
    long long parsed = parse_integer(var, raw);
    if (parsed < 0 || (parsed == 0 && !allow_zero)) {
        throw ConfigurationError(var + " must be " + (allow_zero ? "non-negative" : "positive")
                                 + ", got '" + raw + "'");
    }
    const auto limit = std::chrono::duration_cast<std::chrono::seconds>(MAX_TIMEOUT).count();
    if (parsed > limit) {
        throw ConfigurationError(var + " must not exceed " + std::to_string(limit)
                                 + " seconds, got '" + raw + "'");
    }
    return std::chrono::seconds(parsed);
}

std::vector<Protocol> parse_protocols(const std::string& raw) {
    std::vector<Protocol> out;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        auto p = protocol_from_string(item);
        if (!p) {
            throw ConfigurationError("ALLOWED_MCP_PROTOCOLS: unknown protocol '" + item + "'");
        }
        if (std::find(out.begin(), out.end(), *p) == out.end()) out.push_back(*p);
    }
    return out;
}

} // anonymous namespace

RegistryConfig RegistryConfig::from_env() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (v == nullptr) return std::nullopt;
        return std::string(v);
    });
}

RegistryConfig RegistryConfig::from_lookup(const EnvLookup& lookup) {
    RegistryConfig cfg;

    if (auto v = lookup("MAX_MCP_CONNECTIONS")) {
        cfg.max_connections = static_cast<std::size_t>(parse_positive("MAX_MCP_CONNECTIONS", *v));
    }
    if (auto v = lookup("ALLOWED_MCP_PROTOCOLS")) {
        cfg.allowed_protocols = parse_protocols(*v);
    }
    if (auto v = lookup("MCP_CONNECTION_TIMEOUT")) {
        cfg.connection_timeout = parse_seconds("MCP_CONNECTION_TIMEOUT", *v);
    }
    if (auto v = lookup("MCP_EXECUTION_TIMEOUT")) {
        cfg.execution_timeout = parse_seconds("MCP_EXECUTION_TIMEOUT", *v);
    }
    if (auto v = lookup("MCP_DISCOVERY_TIMEOUT")) {
        cfg.discovery_timeout = parse_seconds("MCP_DISCOVERY_TIMEOUT", *v);
    }
    if (auto v = lookup("MCP_TERMINATION_GRACE")) {
        cfg.termination_grace = parse_seconds("MCP_TERMINATION_GRACE", *v, true);
    }
    if (auto v = lookup("MCP_CLIENT_NAME")) {
        if (!trim(*v).empty()) cfg.client_info.name = trim(*v);
    }
    if (auto v = lookup("MCP_CLIENT_VERSION")) {
        if (!trim(*v).empty()) cfg.client_info.version = trim(*v);
    }
    if (auto v = lookup("LOG_LEVEL")) {
        cfg.log_level = parse_log_level(trim(*v));
    }

    cfg.validate();
    return cfg;
}

void RegistryConfig::validate() const {
    if (max_connections == 0) {
        throw ConfigurationError("max_connections must be at least 1");
    }
    if (allowed_protocols.empty()) {
        throw ConfigurationError("At least one protocol must be allowed");
    }
    if (connection_timeout.count() <= 0 || execution_timeout.count() <= 0
        || discovery_timeout.count() <= 0) {
        throw ConfigurationError("Timeouts must be positive");
    }
    if (termination_grace.count() < 0) {
        throw ConfigurationError("termination_grace must not be negative");
    }
    for (auto t : {connection_timeout, execution_timeout, discovery_timeout, termination_grace}) {
        if (t > MAX_TIMEOUT) {
            throw ConfigurationError("Timeouts must not exceed "
                                     + std::to_string(MAX_TIMEOUT.count()) + " ms");
        }
    }
    if (client_info.name.empty()) {
        throw ConfigurationError("client_info.name must not be empty");
    }
}

bool RegistryConfig::is_allowed(Protocol p) const {
    return std::find(allowed_protocols.begin(), allowed_protocols.end(), p)
           != allowed_protocols.end();
}

} // namespace mcpconn
