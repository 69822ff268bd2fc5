#include "mcpconn/connection.hpp"
#include "mcpconn/error.hpp"
#include "mcpconn/logging.hpp"
#include "mcpconn/transport/pipe_transport.hpp"

#include <thread>

namespace mcpconn {

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) {
        if (!out.empty()) out += " | ";
        out += l;
    }
    return out;
}

} // anonymous namespace

Connection::Connection(ConnectionSpec spec)
    : spec_(std::move(spec)), created_at_(now_ms()) {}

Connection::~Connection() {
    close();
}

void Connection::open(const RegistryConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = ConnectionStatus::Connecting;
        grace_ = config.termination_grace;
    }

    LaunchSpec launch;
    launch.argv = spec_.command;
    launch.argv.insert(launch.argv.end(), spec_.args.begin(), spec_.args.end());
    launch.env = spec_.env;

    const std::string label = spec_.name + "/" + spec_.connection_id.substr(0, 8);

    std::unique_ptr<ChildProcess> process;
    std::unique_ptr<PipeTransport> transport;
    try {
        process = ChildProcess::launch(launch);
        transport = std::make_unique<PipeTransport>(
            process->release_stdout(), process->release_stdin(), process->release_stderr(), label);
    } catch (const McpError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = ConnectionStatus::Error;
        throw;
    }
    PipeTransport* pipes = transport.get();

    ProtocolClient::Options opts;
    opts.client_info = config.client_info;
    opts.handshake_timeout = config.connection_timeout;
    opts.discovery_timeout = config.discovery_timeout;
    opts.label = label;
    auto client = std::make_shared<ProtocolClient>(opts);
    client->connect(std::move(transport));

    HandshakeResult hs;
    try {
        hs = client->initialize();
    } catch (const HandshakeError& e) {
        // Stop the child first so its remaining stderr is drained before
        // the transport goes away.
        process->terminate(grace_);
        pipes->wait_stderr_closed(std::chrono::milliseconds(200));
        auto stderr_tail = pipes->recent_stderr();
        client->close();

        std::string msg = e.what();
        if (auto code = process->exit_code(); code && *code >= 0) {
            msg += " (exit code " + std::to_string(*code) + ")";
        }
        if (!stderr_tail.empty()) {
            msg += "; stderr: " + join_lines(stderr_tail);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_ = ConnectionStatus::Error;
            exit_code_ = process->exit_code();
        }
        throw HandshakeError(msg);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = process->pid();
    process_ = std::move(process);
    client_ = std::move(client);
    server_info_ = std::move(hs.server_info);
    tools_ = std::move(hs.tools);
    resources_ = std::move(hs.resources);
    last_activity_ = now_ms();
    status_ = ConnectionStatus::Connected;
    logger()->info("Connected '{}' ({}), pid {}, {} tool(s), {} resource(s)",
                   spec_.name, spec_.connection_id, *pid_, tools_.size(), resources_.size());
}

bool Connection::refresh_liveness() {
    std::shared_ptr<ProtocolClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!process_) return false;
        if (process_->is_alive()) return true;

        exit_code_ = process_->exit_code();
        logger()->info("Server '{}' ({}) exited with code {}", spec_.name, spec_.connection_id,
                       exit_code_.value_or(-1));
        status_ = ConnectionStatus::Disconnected;
        process_.reset();
        client = std::move(client_);
    }
    if (client) client->close();
    return false;
}

bool Connection::wait_for_exit(std::chrono::milliseconds max_wait) {
    // The child's pipes close slightly before it becomes reapable.
    auto deadline = std::chrono::steady_clock::now() + max_wait;
    while (true) {
        if (!refresh_liveness()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

ToolResult Connection::call_tool(const std::string& tool_name,
                                 const nlohmann::json& arguments,
                                 std::chrono::milliseconds timeout) {
    if (!refresh_liveness()) {
        throw ProcessDeadError("Server process for connection " + spec_.connection_id
                               + " is not running");
    }

    std::shared_ptr<ProtocolClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = client_;
    }
    if (!client) {
        throw ProcessDeadError("Connection " + spec_.connection_id + " is closed");
    }

    try {
        auto result = client->call_tool(tool_name, arguments, timeout);
        std::lock_guard<std::mutex> lock(mutex_);
        last_activity_ = now_ms();
        return result;
    } catch (const DesynchronizedError& e) {
        logger()->error("Tearing down '{}' ({}): {}", spec_.name, spec_.connection_id, e.what());
        teardown(ConnectionStatus::Error);
        throw;
    } catch (const TransportError& e) {
        bool closed_elsewhere;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_elsewhere = process_ == nullptr;
        }
        if (closed_elsewhere) {
            throw ProcessDeadError("Connection " + spec_.connection_id
                                   + " was closed during tools/call");
        }
        if (wait_for_exit(std::chrono::milliseconds(200))) {
            throw ProcessDeadError("Server process for connection " + spec_.connection_id
                                   + " died during tools/call: " + e.what());
        }
        // Output closed but the process lingers: the session is unusable.
        logger()->error("Tearing down '{}' ({}): {}", spec_.name, spec_.connection_id, e.what());
        teardown(ConnectionStatus::Error);
        throw;
    }
}

void Connection::teardown(ConnectionStatus final_status) {
    std::unique_ptr<ChildProcess> process;
    std::shared_ptr<ProtocolClient> client;
    std::chrono::milliseconds grace;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_terminal(status_)) status_ = final_status;
        process = std::move(process_);
        client = std::move(client_);
        grace = grace_;
    }
    if (client) client->close();
    if (process) {
        process->terminate(grace);
        std::lock_guard<std::mutex> lock(mutex_);
        exit_code_ = process->exit_code();
    }
}

void Connection::close() {
    teardown(ConnectionStatus::Disconnected);
}

ConnectionStatus Connection::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<pid_t> Connection::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

std::optional<int> Connection::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

void Connection::fill_summary(ConnectionSummary& s) const {
    s.connection_id = spec_.connection_id;
    s.name = spec_.name;
    s.protocol = spec_.protocol;
    s.status = status_;
    s.created_at = created_at_;
    s.last_activity = last_activity_;
    s.is_alive = process_ != nullptr;
    s.tools_count = tools_.size();
    s.resources_count = resources_.size();
    s.server_info = server_info_;
}

ConnectionSummary Connection::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionSummary s;
    fill_summary(s);
    return s;
}

ConnectionDetails Connection::details() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionDetails d;
    fill_summary(d);
    d.command = spec_.command;
    d.args = spec_.args;
    d.tools = tools_;
    d.resources = resources_;
    return d;
}

nlohmann::json Connection::tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

nlohmann::json Connection::resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_;
}

} // namespace mcpconn
