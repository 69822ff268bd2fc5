#pragma once
#include "types.hpp"
#include <sys/types.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpconn {

struct LaunchSpec {
    /// argv[0] is looked up through PATH.
    std::vector<std::string> argv;
    /// Merged over the parent environment; these values win.
    EnvMap env;
};

/// Build the child environment as "KEY=VALUE" entries: the parent's
/// environment with `overrides` applied on top.
[[nodiscard]] std::vector<std::string> merge_environment(const EnvMap& overrides);

/// A spawned child with stdin/stdout/stderr connected to pipes.
/// Owning the handle means owning the process: destruction terminates it.
class ChildProcess {
public:
    static constexpr std::chrono::milliseconds DEFAULT_GRACE{5000};

    /// Spawn the child. Throws LaunchError if the pipes cannot be created,
    /// fork fails, or exec fails (executable missing, not permitted, ...).
    [[nodiscard]] static std::unique_ptr<ChildProcess> launch(const LaunchSpec& spec);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// Hand the pipe ends over to a transport, which then owns and closes
    /// them. Each returns -1 once released.
    [[nodiscard]] int release_stdin() noexcept;
    [[nodiscard]] int release_stdout() noexcept;
    [[nodiscard]] int release_stderr() noexcept;

    /// Non-blocking exit check (waitpid with WNOHANG); reaps the child.
    [[nodiscard]] bool is_alive();

    /// Exit code once reaped: the exit status, or 128 + signal number.
    /// -1 if the status could not be collected.
    [[nodiscard]] std::optional<int> exit_code() const;

    /// SIGTERM, wait up to `grace`, then SIGKILL and reap. Idempotent.
    void terminate(std::chrono::milliseconds grace = DEFAULT_GRACE);

private:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    bool reap_locked(bool block);
    void close_fds() noexcept;

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    mutable std::mutex mutex_;
    std::optional<int> exit_code_;
};

} // namespace mcpconn
