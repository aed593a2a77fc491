#include "build/subprocess.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pypack::build {

// ============================================================================
// Interrupt handling
// ============================================================================

namespace {

std::atomic<CancellationToken*> g_interrupt_token{nullptr};

extern "C" void on_interrupt(int /*signo*/) {
    if (auto* token = g_interrupt_token.load()) {
        token->cancel();
    }
}

constexpr int GRACE_PERIOD_MS = 2000;
constexpr int POLL_INTERVAL_MS = 50;

} // namespace

void install_interrupt_handler(CancellationToken* token) {
    g_interrupt_token.store(token);

    struct sigaction action {};
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    action.sa_handler = token ? on_interrupt : SIG_DFL;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

// ============================================================================
// Helpers
// ============================================================================

fs::path find_executable(const std::string& program) {
    std::error_code ec;
    if (program.find('/') != std::string::npos) {
        if (fs::is_regular_file(program, ec) && access(program.c_str(), X_OK) == 0) {
            return program;
        }
        return {};
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return {};
    }

    std::string paths = path_env;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t colon = paths.find(':', start);
        auto dir =
            paths.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = fs::path(dir) / program;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return {};
}

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
    std::string out = program;
    for (const auto& arg : args) {
        out += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            out += '"' + arg + '"';
        } else {
            out += arg;
        }
    }
    return out;
}

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/// Reads what is available. Returns false once the pipe is at EOF.
bool drain(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

// ============================================================================
// run_subprocess
// ============================================================================

SubprocessResult run_subprocess(const std::string& program, const std::vector<std::string>& args,
                                const SubprocessOptions& options) {
    using Clock = std::chrono::steady_clock;
    auto start = Clock::now();

    SubprocessResult result;

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.launch_error = std::string("failed to create pipes: ") + std::strerror(errno);
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                        &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }

    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);
    std::string cwd = options.cwd.string();

    PYPACK_LOG_DEBUG("subprocess", "exec: " << format_command(program, args));

    pid_t pid = fork();
    if (pid < 0) {
        result.launch_error = std::string("fork failed: ") + std::strerror(errno);
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                        &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        struct sigaction action {};
        sigemptyset(&action.sa_mask);
        action.sa_handler = SIG_DFL;
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);

        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        close(exec_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        int err = 0;
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            err = errno;
        } else {
            execvp(program.c_str(), c_args.data());
            err = errno;
        }
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent: set the group here too so kill(-pid) works before the child runs.
    setpgid(pid, pid);

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        result.launch_error = "cannot run '" + program + "': " + std::strerror(exec_errno);
        result.stderr_output = result.launch_error;
        result.duration_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
        return result;
    }

    result.launched = true;

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    bool has_deadline = options.timeout_seconds > 0;
    auto deadline = start + std::chrono::seconds(options.timeout_seconds);

    int status = 0;
    bool finished = false;
    bool terminating = false;
    Clock::time_point kill_at{};
    Clock::time_point finished_at{};

    while (true) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds++] = {stdout_pipe[0], POLLIN, 0};
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds++] = {stderr_pipe[0], POLLIN, 0};
        }

        if (nfds > 0) {
            poll(fds, nfds, POLL_INTERVAL_MS);
        } else if (!finished) {
            usleep(POLL_INTERVAL_MS * 1000);
        }

        if (stdout_pipe[0] >= 0 && !drain(stdout_pipe[0], result.stdout_output)) {
            close_fd(stdout_pipe[0]);
        }
        if (stderr_pipe[0] >= 0 && !drain(stderr_pipe[0], result.stderr_output)) {
            close_fd(stderr_pipe[0]);
        }

        auto now = Clock::now();
        if (!finished) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                finished = true;
                finished_at = now;
            } else if (ret < 0 && errno != EINTR) {
                status = -1;
                finished = true;
                finished_at = now;
            }
        }

        if (finished) {
            // Grandchildren may keep the pipes open; stop waiting on them.
            bool pipes_closed = stdout_pipe[0] < 0 && stderr_pipe[0] < 0;
            if (pipes_closed || terminating ||
                now - finished_at >= std::chrono::milliseconds(GRACE_PERIOD_MS)) {
                break;
            }
            continue;
        }

        if (!terminating) {
            bool cancel = options.cancel && options.cancel->is_cancelled();
            bool expired = has_deadline && now >= deadline;
            if (cancel || expired) {
                result.cancelled = cancel;
                result.timed_out = !cancel && expired;
                terminating = true;
                kill_at = now + std::chrono::milliseconds(GRACE_PERIOD_MS);
                kill(-pid, SIGTERM);
                PYPACK_LOG_DEBUG("subprocess", "Stopping process group "
                                                   << pid
                                                   << (cancel ? " (cancelled)" : " (timeout)"));
            }
        } else if (now >= kill_at) {
            kill(-pid, SIGKILL);
            kill_at = now + std::chrono::hours(1);
        }
    }

    if (terminating) {
        kill(-pid, SIGKILL);
    }
    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    if (result.timed_out) {
        result.stderr_output +=
            "\npypack: timed out after " + std::to_string(options.timeout_seconds) + "s";
    }

    result.duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    return result;
}

} // namespace pypack::build
