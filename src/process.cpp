#include "mcpconn/process.hpp"
#include "mcpconn/error.hpp"
#include "mcpconn/logging.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace mcpconn {

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int fds[2]{-1, -1};
    ~PipePair() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }
};

void make_pipe(PipePair& p, const char* what) {
    if (::pipe2(p.fds, O_CLOEXEC) < 0) {
        int err = errno;
        throw LaunchError(std::string("Failed to create ") + what + " pipe: " + std::strerror(err), err);
    }
}

void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::string describe(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // anonymous namespace

std::vector<std::string> merge_environment(const EnvMap& overrides) {
    std::vector<std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (overrides.count(key) > 0) continue;
        merged.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) {
        merged.push_back(key + "=" + value);
    }
    return merged;
}

std::unique_ptr<ChildProcess> ChildProcess::launch(const LaunchSpec& spec) {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        throw LaunchError("Empty command");
    }
    for (const auto& [key, value] : spec.env) {
        if (key.empty() || key.find('=') != std::string::npos) {
            throw LaunchError("Invalid environment variable name: '" + key + "'");
        }
    }

    ignore_sigpipe_once();

    // Everything the child needs is built before fork().
    std::vector<std::string> argv_store = spec.argv;
    std::vector<char*> argv;
    argv.reserve(argv_store.size() + 1);
    for (auto& a : argv_store) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_store = merge_environment(spec.env);
    std::vector<char*> envp;
    envp.reserve(env_store.size() + 1);
    for (auto& e : env_store) envp.push_back(e.data());
    envp.push_back(nullptr);

    PipePair in, out, err, status;
    make_pipe(in, "stdin");
    make_pipe(out, "stdout");
    make_pipe(err, "stderr");
    make_pipe(status, "status");

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        throw LaunchError(std::string("Failed to fork process: ") + std::strerror(e), e);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::dup2(in.fds[0], STDIN_FILENO);
        ::dup2(out.fds[1], STDOUT_FILENO);
        ::dup2(err.fds[1], STDERR_FILENO);

        // The parent ignores SIGPIPE; ignored dispositions survive exec.
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        environ = envp.data();
        ::execvp(argv[0], argv.data());

        int e = errno;
        ssize_t ignored = ::write(status.fds[1], &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    close_fd(in.fds[0]);
    close_fd(out.fds[1]);
    close_fd(err.fds[1]);
    close_fd(status.fds[1]);

    // The status pipe is close-on-exec: EOF means exec succeeded.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status.fds[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int wstatus = 0;
        while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
        throw LaunchError("Failed to launch '" + describe(spec.argv) + "': "
                          + std::strerror(exec_errno), exec_errno);
    }

    auto child = std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, in.fds[1], out.fds[0], err.fds[0]));
    in.fds[1] = -1;
    out.fds[0] = -1;
    err.fds[0] = -1;

    logger()->debug("Spawned pid {}: {}", pid, describe(spec.argv));
    return child;
}

ChildProcess::ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {
}

ChildProcess::~ChildProcess() {
    close_fds();
    terminate(DEFAULT_GRACE);
}

int ChildProcess::release_stdin() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ChildProcess::release_stdout() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

int ChildProcess::release_stderr() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    int fd = stderr_fd_;
    stderr_fd_ = -1;
    return fd;
}

bool ChildProcess::reap_locked(bool block) {
    if (exit_code_) return true;

    int wstatus = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &wstatus, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exit_code_ = decode_status(wstatus);
        return true;
    }
    if (r < 0) {
        // ECHILD: already reaped elsewhere; the status is gone.
        exit_code_ = -1;
        return true;
    }
    return false;
}

bool ChildProcess::is_alive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !reap_locked(false);
}

std::optional<int> ChildProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reap_locked(false)) return;
        ::kill(pid_, SIGTERM);
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reap_locked(false)) {
                logger()->debug("pid {} exited after SIGTERM (code {})", pid_, *exit_code_);
                return;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (reap_locked(false)) return;
    logger()->warn("pid {} ignored SIGTERM for {} ms, sending SIGKILL", pid_, grace.count());
    ::kill(pid_, SIGKILL);
    reap_locked(true);
}

void ChildProcess::close_fds() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

} // namespace mcpconn
