#include "mcpconn/registry.hpp"
#include "mcpconn/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>

namespace mcpconn {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Releases a capacity reservation taken by connect().
class SlotReservation {
public:
    SlotReservation(std::mutex& m, std::size_t& reserved) : m_(m), reserved_(reserved) {}
    ~SlotReservation() {
        std::lock_guard<std::mutex> lock(m_);
        --reserved_;
    }
    SlotReservation(const SlotReservation&) = delete;
    SlotReservation& operator=(const SlotReservation&) = delete;

private:
    std::mutex& m_;
    std::size_t& reserved_;
};

} // anonymous namespace

ConnectionRegistry::ConnectionRegistry(RegistryConfig config)
    : config_(std::move(config)) {
    config_.validate();
    if (config_.log_level) set_log_level(*config_.log_level);
}

ConnectionRegistry::~ConnectionRegistry() {
    shutdown();
}

std::string ConnectionRegistry::generate_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);

    // RFC 4122 version 4, variant 1.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

std::shared_ptr<Connection> ConnectionRegistry::find(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return nullptr;
    return it->second;
}

std::size_t ConnectionRegistry::live_count_locked() const {
    return static_cast<std::size_t>(std::count_if(
        connections_.begin(), connections_.end(),
        [](const auto& kv) { return kv.second->status() == ConnectionStatus::Connected; }));
}

Result<ConnectionDetails> ConnectionRegistry::connect(const std::string& name,
                                                      const std::vector<std::string>& command,
                                                      const std::vector<std::string>& args,
                                                      const EnvMap& env,
                                                      const std::string& protocol) {
    try {
        auto proto = protocol_from_string(to_lower(protocol));
        if (!proto) {
            throw ConfigurationError("Unknown protocol: '" + protocol + "'");
        }
        if (!config_.is_allowed(*proto)) {
            throw ConfigurationError("Protocol '" + std::string(protocol_to_string(*proto))
                                     + "' is not allowed");
        }
        if (*proto != Protocol::Stdio) {
            throw ConfigurationError("Protocol '" + std::string(protocol_to_string(*proto))
                                     + "' is not implemented");
        }
        if (command.empty() || command.front().empty()) {
            throw ConfigurationError("Command must not be empty");
        }

        // Children that exited no longer hold a slot.
        std::vector<std::shared_ptr<Connection>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& kv : connections_) snapshot.push_back(kv.second);
        }
        for (const auto& c : snapshot) c->refresh_liveness();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (live_count_locked() + reserved_ >= config_.max_connections) {
                throw CapacityError("Maximum number of connections reached ("
                                    + std::to_string(config_.max_connections) + ")");
            }
            ++reserved_;
        }
        SlotReservation slot(mutex_, reserved_);

        ConnectionSpec spec;
        spec.connection_id = generate_id();
        spec.name = name;
        spec.command = command;
        spec.args = args;
        spec.env = env;
        spec.protocol = *proto;

        auto conn = std::make_shared<Connection>(std::move(spec));
        try {
            conn->open(config_);
        } catch (const std::exception& e) {
            logger()->error("Failed to connect '{}': {}", name, e.what());
            throw;
        }

        auto details = conn->details();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connections_.emplace(conn->id(), conn);
        }
        return details;
    } catch (...) {
        return error_from_current_exception();
    }
}

Result<Ok> ConnectionRegistry::disconnect(const std::string& connection_id) {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            return Error{ErrorKind::NotFound, "Connection not found: " + connection_id, std::nullopt};
        }
        conn = std::move(it->second);
        connections_.erase(it);
    }

    auto pid = conn->pid();
    conn->close();
    logger()->info("Disconnected '{}' ({}), pid {}", conn->spec().name, connection_id,
                   pid ? *pid : -1);
    return Ok{};
}

std::vector<ConnectionSummary> ConnectionRegistry::list() {
    std::vector<std::shared_ptr<Connection>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(connections_.size());
        for (const auto& kv : connections_) snapshot.push_back(kv.second);
    }

    std::vector<ConnectionSummary> out;
    out.reserve(snapshot.size());
    for (const auto& c : snapshot) {
        c->refresh_liveness();
        out.push_back(c->summary());
    }
    std::sort(out.begin(), out.end(), [](const ConnectionSummary& a, const ConnectionSummary& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.connection_id < b.connection_id;
    });
    return out;
}

std::optional<ConnectionDetails> ConnectionRegistry::get_status(const std::string& connection_id) {
    auto conn = find(connection_id);
    if (!conn) return std::nullopt;
    conn->refresh_liveness();
    return conn->details();
}

Result<ToolResult> ConnectionRegistry::execute_tool(const std::string& connection_id,
                                                    const std::string& tool_name,
                                                    const nlohmann::json& arguments,
                                                    std::chrono::milliseconds timeout) {
    auto conn = find(connection_id);
    if (!conn) {
        return Error{ErrorKind::NotFound, "Connection not found: " + connection_id, std::nullopt};
    }
    if (timeout.count() <= 0) timeout = config_.execution_timeout;
    timeout = std::min(timeout, MAX_TIMEOUT);

    try {
        return conn->call_tool(tool_name, arguments.is_null() ? nlohmann::json::object() : arguments,
                               timeout);
    } catch (...) {
        return error_from_current_exception();
    }
}

std::optional<nlohmann::json> ConnectionRegistry::list_tools(const std::string& connection_id) const {
    auto conn = find(connection_id);
    if (!conn) return std::nullopt;
    return conn->tools();
}

std::optional<nlohmann::json> ConnectionRegistry::list_resources(const std::string& connection_id) const {
    auto conn = find(connection_id);
    if (!conn) return std::nullopt;
    return conn->resources();
}

void ConnectionRegistry::shutdown() {
    std::map<std::string, std::shared_ptr<Connection>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(connections_);
    }
    if (!all.empty()) {
        logger()->info("Shutting down {} connection(s)", all.size());
    }
    for (auto& kv : all) {
        kv.second->close();
    }
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

std::size_t ConnectionRegistry::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_count_locked();
}

} // namespace mcpconn
