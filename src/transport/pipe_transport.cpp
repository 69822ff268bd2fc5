#include "mcpconn/transport/pipe_transport.hpp"
#include "mcpconn/error.hpp"
#include "mcpconn/framing.hpp"
#include "mcpconn/logging.hpp"
#include "mcpconn/types.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace mcpconn {

PipeTransport::PipeTransport(int read_fd, int write_fd, int stderr_fd, std::string label)
    : read_fd_(read_fd), write_fd_(write_fd), stderr_fd_(stderr_fd), label_(std::move(label)) {
    if (::pipe2(wakeup_pipe_, O_CLOEXEC) < 0) {
        int err = errno;
        for (int fd : {read_fd_, write_fd_, stderr_fd_}) {
            if (fd >= 0) ::close(fd);
        }
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(err));
    }
    // Writes to the child go through poll() so shutdown() can interrupt a
    // child that stopped reading its stdin.
    int flags = ::fcntl(write_fd_, F_GETFL, 0);
    if (flags >= 0) ::fcntl(write_fd_, F_SETFL, flags | O_NONBLOCK);

    if (stderr_fd_ >= 0) {
        stderr_thread_ = std::thread([this]() { stderr_loop(); });
    } else {
        stderr_closed_ = true;
    }
}

PipeTransport::~PipeTransport() {
    shutdown();
    if (stderr_thread_.joinable()) stderr_thread_.join();
    if (read_fd_ >= 0)   ::close(read_fd_);
    if (write_fd_ >= 0)  ::close(write_fd_);
    if (stderr_fd_ >= 0) ::close(stderr_fd_);
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void PipeTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    read_loop(std::move(on_message), std::move(on_error));
    running_ = false;
}

void PipeTransport::read_loop(MessageCallback on_message, ErrorCallback on_error) {
    LineFramer framer;
    std::string line;
    char chunk[4096];

    auto report = [&on_error](auto&& ex) {
        if (!on_error) return;
        try {
            throw ex;
        } catch (...) {
            on_error(std::current_exception());
        }
    };

    while (!shutdown_requested_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(TransportError(std::string("poll failed: ") + std::strerror(errno)));
            break;
        }

        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            report(TransportError(std::string("Read error: ") + std::strerror(errno)));
            break;
        }
        if (n == 0) {
            logger()->debug("[{}] stdout closed", label_);
            break;
        }

        try {
            framer.feed(std::string_view(chunk, static_cast<size_t>(n)));
        } catch (const TransportError& e) {
            report(e);
            break;
        }

        while (framer.next_line(line)) {
            JsonRpcMessage msg;
            try {
                msg = Codec::parse(line);
            } catch (const ParseError& e) {
                logger()->warn("[{}] dropping unparseable line: {} ({})", label_, line, e.what());
                report(e);
                continue;
            }
            on_message(std::move(msg));
        }
    }

    if (framer.pending_bytes() > 0) {
        logger()->debug("[{}] discarding {} bytes of unterminated output", label_,
                        framer.pending_bytes());
    }
    connected_ = false;
}

void PipeTransport::stderr_loop() {
    LineFramer framer;
    std::string line;
    char chunk[4096];

    while (true) {
        struct pollfd fds[2];
        fds[0].fd = stderr_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;

        try {
            framer.feed(std::string_view(chunk, static_cast<size_t>(n)));
        } catch (const TransportError&) {
            // Overlong stderr line; the framer has dropped it.
            continue;
        }
        while (framer.next_line(line)) {
            logger()->debug("[{} stderr] {}", label_, line);
            std::lock_guard<std::mutex> lock(stderr_mutex_);
            stderr_lines_.push_back(line);
            if (stderr_lines_.size() > STDERR_HISTORY) stderr_lines_.pop_front();
        }
    }

    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_closed_ = true;
    stderr_cv_.notify_all();
}

void PipeTransport::write_raw(const std::string& framed,
                              std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        throw TimeoutError("Timed out waiting to write to " + label_);
    }
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }

    const char* data = framed.data();
    size_t remaining = framed.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (left.count() <= 0) {
                    if (remaining == framed.size()) {
                        throw TimeoutError(label_ + " is not reading its stdin");
                    }
                    // Part of the line is on the wire; the stream is corrupt.
                    connected_ = false;
                    throw DesynchronizedError(label_ + " stopped reading its stdin after "
                                              + std::to_string(framed.size() - remaining)
                                              + " of " + std::to_string(framed.size())
                                              + " bytes");
                }
                struct pollfd fds[2];
                fds[0].fd = write_fd_;
                fds[0].events = POLLOUT;
                fds[0].revents = 0;
                fds[1].fd = wakeup_pipe_[0];
                fds[1].events = POLLIN;
                fds[1].revents = 0;
                // Round up so a sub-millisecond remainder still waits.
                int ret = ::poll(fds, 2, static_cast<int>(std::min<long long>(left.count() + 1, 60000)));
                if (ret < 0 && errno != EINTR) {
                    throw TransportError(std::string("poll failed: ") + std::strerror(errno));
                }
                if (fds[1].revents & POLLIN) {
                    throw TransportError("Transport shut down during write");
                }
                continue;
            }
            connected_ = false;
            throw TransportError(std::string("Write to ") + label_ + " failed: " + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void PipeTransport::send(const JsonRpcMessage& msg, std::chrono::milliseconds timeout) {
    write_raw(LineFramer::frame(Codec::serialize(msg)),
              std::chrono::steady_clock::now() + std::min(timeout, MAX_TIMEOUT));
}

void PipeTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    connected_ = false;
    wake();
}

void PipeTransport::wake() noexcept {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
        (void)ignored;
    }
}

bool PipeTransport::is_connected() const {
    return connected_;
}

bool PipeTransport::wait_stderr_closed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stderr_mutex_);
    return stderr_cv_.wait_for(lock, timeout, [this] { return stderr_closed_; });
}

std::vector<std::string> PipeTransport::recent_stderr() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return {stderr_lines_.begin(), stderr_lines_.end()};
}

} // namespace mcpconn
