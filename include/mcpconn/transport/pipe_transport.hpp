#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpconn {

/// Newline-delimited JSON over a child's pipes: reads the child's stdout,
/// writes its stdin, and drains its stderr into the log.
class PipeTransport : public ITransport {
public:
    static constexpr std::size_t STDERR_HISTORY = 20;

    /// Takes ownership of all descriptors. `stderr_fd` may be -1.
    PipeTransport(int read_fd, int write_fd, int stderr_fd = -1,
                  std::string label = "server");

    ~PipeTransport() override;

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg, std::chrono::milliseconds timeout) override;
    void shutdown() override;
    bool is_connected() const override;

    /// Write pre-framed bytes (must end in '\n') before `deadline`. Used by send().
    void write_raw(const std::string& framed, std::chrono::steady_clock::time_point deadline);

    /// The last few lines the child wrote to stderr.
    [[nodiscard]] std::vector<std::string> recent_stderr() const;

    /// Block until the child's stderr reaches EOF or `timeout` passes.
    bool wait_stderr_closed(std::chrono::milliseconds timeout);

private:
    void read_loop(MessageCallback on_message, ErrorCallback on_error);
    void stderr_loop();
    void wake() noexcept;

    int read_fd_;
    int write_fd_;
    int stderr_fd_;
    std::string label_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{true};
    std::atomic<bool> shutdown_requested_{false};

    std::timed_mutex write_mutex_;
    std::thread stderr_thread_;

    mutable std::mutex stderr_mutex_;
    std::condition_variable stderr_cv_;
    std::deque<std::string> stderr_lines_;
    bool stderr_closed_ = false;

    int wakeup_pipe_[2]{-1, -1};  // readable once shutdown() is called
};

} // namespace mcpconn
