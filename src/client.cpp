#include "mcpconn/client.hpp"
#include "mcpconn/error.hpp"
#include "mcpconn/logging.hpp"
#include "mcpconn/version.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <mutex>
#include <thread>

namespace mcpconn {

namespace {

// Bound on answering a server-initiated request from the reader thread.
constexpr std::chrono::milliseconds SERVER_REPLY_TIMEOUT{1000};

bool names_unknown_tool(const std::string& message) {
    std::string lower;
    lower.reserve(message.size());
    for (char c : message) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower.find("tool") == std::string::npos) return false;
    return lower.find("unknown") != std::string::npos || lower.find("not found") != std::string::npos;
}

} // anonymous namespace

struct ProtocolClient::Impl {
    Options opts;
    Session session;

    std::unique_ptr<ITransport> transport;
    std::thread reader_thread;
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};

    // One request in flight per session.
    std::timed_mutex call_mutex;

    explicit Impl(Options o) : opts(std::move(o)) {}

    void on_message(JsonRpcMessage msg) {
        if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            on_response(*resp);
            return;
        }
        if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            // This client exposes no server->client methods.
            logger()->debug("[{}] rejecting server request '{}'", opts.label, req->method);
            JsonRpcResponse reply;
            reply.id = req->id;
            reply.error = JsonRpcError{error::MethodNotFound,
                                       "Method not supported by client: " + req->method,
                                       std::nullopt};
            try {
                transport->send(reply, SERVER_REPLY_TIMEOUT);
            } catch (const DesynchronizedError& e) {
                fault(e.what());
            } catch (const McpError& e) {
                logger()->debug("[{}] could not answer server request: {}", opts.label, e.what());
            }
            return;
        }
        const auto& notif = std::get<JsonRpcNotification>(msg);
        logger()->debug("[{}] notification {}", opts.label, notif.method);
    }

    void on_response(const JsonRpcResponse& resp) {
        if (!resp.id) {
            if (session.pending_count() == 0) {
                logger()->warn("[{}] dropping response with null id", opts.label);
                return;
            }
            // Cannot tell which request this answers: the stream is no
            // longer trustworthy.
            fault("Server sent a response without an id; "
                  "responses can no longer be correlated");
            return;
        }
        if (session.complete_request(resp)) return;
        if (session.state() == SessionState::Handshaking) {
            // Only initialize is outstanding; anything else answers nothing.
            fail_handshake("initialize answered with unexpected id " + id_to_string(*resp.id));
        } else {
            logger()->warn("[{}] discarding response id {}: no pending request "
                           "(late or unknown)", opts.label, id_to_string(*resp.id));
        }
    }

    void on_error(std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const ParseError& e) {
            // Already logged by the transport with the offending line.
            if (session.state() == SessionState::Handshaking) {
                fail_handshake(std::string("unparseable initialize response: ") + e.what());
            }
        } catch (const std::exception& e) {
            logger()->warn("[{}] transport error: {}", opts.label, e.what());
        }
    }

    void fault(const std::string& reason) {
        logger()->error("[{}] session desynchronized: {}", opts.label, reason);
        session.set_state(SessionState::Faulted);
        session.fail_all(std::make_exception_ptr(DesynchronizedError(reason)));
    }

    void fail_handshake(const std::string& reason) {
        if (session.fail_all(std::make_exception_ptr(HandshakeError("Handshake failed: " + reason))) > 0) {
            logger()->error("[{}] handshake failed: {}", opts.label, reason);
        }
    }

    void on_closed() {
        connected = false;
        auto failed = session.fail_all(std::make_exception_ptr(
            TransportError("Server closed its output")));
        if (!closing) {
            logger()->info("[{}] output closed by server", opts.label);
            if (session.state() != SessionState::Faulted) {
                session.set_state(SessionState::Faulted);
            }
        }
        if (failed > 0) {
            logger()->debug("[{}] failed {} pending request(s) on close", opts.label, failed);
        }
    }

    void ensure_usable() const {
        auto st = session.state();
        if (st == SessionState::Closed) {
            throw TransportError("Session is closed");
        }
        if (!transport || !connected) {
            throw TransportError("Not connected");
        }
        if (st == SessionState::Faulted) {
            throw DesynchronizedError("Session is faulted");
        }
    }

    JsonRpcResponse send_request(const std::string& method, nlohmann::json params,
                                 std::chrono::milliseconds timeout) {
        timeout = std::min(timeout, MAX_TIMEOUT);
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        std::unique_lock<std::timed_mutex> call_lock(call_mutex, std::defer_lock);
        if (!call_lock.try_lock_until(deadline)) {
            throw TimeoutError(method + " timed out after " + std::to_string(timeout.count())
                               + " ms waiting for an earlier request");
        }
        ensure_usable();

        auto pending = session.register_request(method);
        if (!connected) {
            // Closed between the check above and registration.
            session.abandon(pending.id);
            throw TransportError("Server closed its output");
        }

        JsonRpcRequest req;
        req.id = pending.id;
        req.method = method;
        req.params = std::move(params);

        try {
            transport->send(req, timeout);
        } catch (const TimeoutError& e) {
            session.abandon(pending.id);
            throw TimeoutError(method + " timed out after " + std::to_string(timeout.count())
                               + " ms: " + e.what());
        } catch (const DesynchronizedError& e) {
            session.abandon(pending.id);
            fault(method + " request only partly written: " + e.what());
            throw;
        } catch (const TransportError&) {
            session.abandon(pending.id);
            throw;
        }

        if (pending.response.wait_until(deadline) == std::future_status::timeout) {
            // Stop waiting; if the answer shows up later the reader drops it.
            session.abandon(pending.id);
            throw TimeoutError(method + " timed out after " + std::to_string(timeout.count()) + " ms");
        }
        return pending.response.get();
    }

    nlohmann::json list(const std::string& method, const char* key,
                        std::chrono::milliseconds timeout) {
        auto resp = send_request(method, nlohmann::json::object(), timeout);
        if (resp.error) {
            throw ToolExecutionError(resp.error->code, method + " failed: " + resp.error->message,
                                     resp.raw_error.value_or(nullptr));
        }
        if (!resp.result || !resp.result->is_object() || !resp.result->contains(key)
            || !resp.result->at(key).is_array()) {
            throw ParseError(method + " result has no '" + key + "' array");
        }
        return resp.result->at(key);
    }

    nlohmann::json discover(const std::string& method, const char* key) {
        try {
            auto items = list(method, key, opts.discovery_timeout);
            logger()->debug("[{}] {} returned {} item(s)", opts.label, method, items.size());
            return items;
        } catch (const std::exception& e) {
            logger()->warn("[{}] {} failed, continuing without it: {}", opts.label, method, e.what());
            return nlohmann::json::array();
        }
    }
};

ProtocolClient::ProtocolClient(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {}

ProtocolClient::~ProtocolClient() {
    close();
}

void ProtocolClient::connect(std::unique_ptr<ITransport> transport) {
    if (impl_->transport) {
        throw TransportError("Client already has a transport");
    }
    impl_->transport = std::move(transport);
    impl_->connected = true;
    impl_->session.set_state(SessionState::Uninitialized);

    Impl* impl = impl_.get();
    impl_->reader_thread = std::thread([impl]() {
        impl->transport->start(
            [impl](JsonRpcMessage msg) { impl->on_message(std::move(msg)); },
            [impl](std::exception_ptr ep) { impl->on_error(ep); });
        impl->on_closed();
    });
}

HandshakeResult ProtocolClient::initialize() {
    auto& impl = *impl_;
    impl.session.set_state(SessionState::Handshaking);

    nlohmann::json params = {
        {"protocolVersion", std::string(PROTOCOL_VERSION)},
        {"capabilities", {{"tools", nlohmann::json::object()},
                          {"resources", nlohmann::json::object()}}},
        {"clientInfo", impl.opts.client_info}
    };

    JsonRpcResponse resp;
    try {
        resp = impl.send_request("initialize", std::move(params), impl.opts.handshake_timeout);
    } catch (const HandshakeError&) {
        impl.session.set_state(SessionState::Faulted);
        throw;
    } catch (const TimeoutError&) {
        impl.session.set_state(SessionState::Faulted);
        throw HandshakeError("Handshake timeout: no initialize response within "
                             + std::to_string(impl.opts.handshake_timeout.count()) + " ms");
    } catch (const McpError& e) {
        impl.session.set_state(SessionState::Faulted);
        throw HandshakeError(std::string("Handshake failed: ") + e.what());
    }

    if (resp.error) {
        impl.session.set_state(SessionState::Faulted);
        throw HandshakeError("Server rejected initialize: " + resp.error->message);
    }
    if (!resp.result) {
        impl.session.set_state(SessionState::Faulted);
        throw HandshakeError("Invalid handshake response: missing 'result'");
    }

    HandshakeResult result;
    result.server_info = *resp.result;

    try {
        JsonRpcNotification initialized;
        initialized.method = "notifications/initialized";
        impl.transport->send(initialized, impl.opts.handshake_timeout);
    } catch (const McpError& e) {
        impl.session.set_state(SessionState::Faulted);
        throw HandshakeError(std::string("Handshake failed: ") + e.what());
    }

    impl.session.set_state(SessionState::Ready);

    result.tools = impl.discover("tools/list", "tools");
    result.resources = impl.discover("resources/list", "resources");
    return result;
}

ToolResult ProtocolClient::call_tool(const std::string& name, const nlohmann::json& arguments,
                                     std::chrono::milliseconds timeout) {
    if (impl_->session.state() != SessionState::Ready) {
        impl_->ensure_usable();
        throw TransportError("Session is not ready");
    }

    nlohmann::json params = {{"name", name}, {"arguments", arguments}};
    auto resp = impl_->send_request("tools/call", std::move(params), timeout);

    if (resp.error) {
        const auto& err = *resp.error;
        nlohmann::json raw = resp.raw_error.value_or(nlohmann::json(err));
        if (err.code == error::MethodNotFound
            || (err.code == error::InvalidParams && names_unknown_tool(err.message))) {
            throw ToolNotFoundError(err.code, "Tool '" + name + "' not found: " + err.message, raw);
        }
        throw ToolExecutionError(err.code, "Tool '" + name + "' failed: " + err.message, raw);
    }
    if (!resp.result) {
        throw ToolExecutionError(error::InternalError,
                                 "Invalid response: neither 'result' nor 'error'");
    }
    return ToolResult{*resp.result};
}

void ProtocolClient::close() {
    if (!impl_) return;
    impl_->closing = true;
    if (impl_->session.state() != SessionState::Faulted) {
        impl_->session.set_state(SessionState::Closed);
    }
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
    if (impl_->reader_thread.joinable()) {
        impl_->reader_thread.join();
    }
    impl_->connected = false;
    impl_->session.fail_all(std::make_exception_ptr(TransportError("Session closed")));
}

SessionState ProtocolClient::state() const {
    return impl_->session.state();
}

bool ProtocolClient::is_connected() const noexcept {
    return impl_->connected;
}

} // namespace mcpconn
