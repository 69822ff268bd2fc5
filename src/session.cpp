#include "mcpconn/session.hpp"

namespace mcpconn {

std::string_view session_state_to_string(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Handshaking:   return "handshaking";
        case SessionState::Ready:         return "ready";
        case SessionState::Faulted:       return "faulted";
        case SessionState::Closed:        return "closed";
    }
    return "faulted";
}

Session::Session() = default;

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::set_state(SessionState s) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = s;
}

Session::Pending Session::register_request(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t id = next_id_++;
    Entry entry;
    entry.method = method;
    entry.created_at = std::chrono::steady_clock::now();
    auto fut = entry.promise.get_future();
    pending_.emplace(id, std::move(entry));
    return Pending{RequestId{id}, std::move(fut)};
}

bool Session::complete_request(const JsonRpcResponse& resp) {
    if (!resp.id) return false;
    const auto* int_id = std::get_if<int64_t>(&*resp.id);
    if (int_id == nullptr) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(*int_id);
    if (it == pending_.end()) return false;
    it->second.promise.set_value(resp);
    pending_.erase(it);
    return true;
}

bool Session::abandon(const RequestId& id) {
    const auto* int_id = std::get_if<int64_t>(&id);
    if (int_id == nullptr) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(*int_id) > 0;
}

std::size_t Session::fail_all(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = pending_.size();
    for (auto& [id, entry] : pending_) {
        entry.promise.set_exception(error);
    }
    pending_.clear();
    return n;
}

std::size_t Session::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool Session::has_pending_request(const RequestId& id) const {
    const auto* int_id = std::get_if<int64_t>(&id);
    if (int_id == nullptr) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(*int_id) > 0;
}

std::optional<std::string> Session::pending_method(const RequestId& id) const {
    const auto* int_id = std::get_if<int64_t>(&id);
    if (int_id == nullptr) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(*int_id);
    if (it == pending_.end()) return std::nullopt;
    return it->second.method;
}

} // namespace mcpconn
