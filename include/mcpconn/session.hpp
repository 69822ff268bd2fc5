#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mcpconn {

enum class SessionState {
    Uninitialized,
    Handshaking,
    Ready,
    Faulted,
    Closed
};

[[nodiscard]] std::string_view session_state_to_string(SessionState s);

/// Protocol state plus the table of requests awaiting a response.
/// Ids are assigned monotonically from 1, so the first request of a
/// session (initialize) always carries id 1.
class Session {
public:
    struct Pending {
        RequestId id;
        std::future<JsonRpcResponse> response;
    };

    Session();

    SessionState state() const;
    void set_state(SessionState s);

    /// Allocate an id and a one-shot slot for its response.
    Pending register_request(const std::string& method);

    /// Deliver a response to the request with the same id.
    /// Returns false (and leaves the table untouched) if no such request
    /// is pending: unknown, already answered, or abandoned after a timeout.
    bool complete_request(const JsonRpcResponse& resp);

    /// Forget a request whose caller stopped waiting. A response arriving
    /// later no longer matches anything.
    bool abandon(const RequestId& id);

    /// Fail every pending request with `error` and clear the table.
    std::size_t fail_all(std::exception_ptr error);

    [[nodiscard]] std::size_t pending_count() const;
    [[nodiscard]] bool has_pending_request(const RequestId& id) const;
    [[nodiscard]] std::optional<std::string> pending_method(const RequestId& id) const;

private:
    struct Entry {
        std::string method;
        std::chrono::steady_clock::time_point created_at;
        std::promise<JsonRpcResponse> promise;
    };

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::map<int64_t, Entry> pending_;
    int64_t next_id_{1};
};

} // namespace mcpconn
