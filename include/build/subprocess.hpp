//! # Subprocess Execution
//!
//! Runs one external tool with captured output, a timeout, and cooperative
//! cancellation.
//!
//! ## Isolation
//!
//! Each child runs in its own process group, so stopping it also stops
//! anything it spawned (a C compiler under `setup.py`, the PyInstaller
//! bootloader build). On cancellation or timeout the group receives SIGTERM,
//! then SIGKILL after a short grace period.
//!
//! ## Platform Support
//!
//! - **Unix**: fork + execvp, stdout/stderr pipes drained with poll()

#ifndef PYPACK_BUILD_SUBPROCESS_HPP
#define PYPACK_BUILD_SUBPROCESS_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace pypack::build {

/// Shared stop flag. Set once, never cleared.
class CancellationToken {
public:
    void cancel() {
        cancelled_.store(true, std::memory_order_relaxed);
    }

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/// Routes SIGINT and SIGTERM to `token.cancel()`. The token must outlive the
/// handler; pass nullptr to restore the default handlers.
void install_interrupt_handler(CancellationToken* token);

struct SubprocessOptions {
    fs::path cwd;            ///< Empty = inherit
    int timeout_seconds = 0; ///< 0 = no limit
    const CancellationToken* cancel = nullptr;
};

struct SubprocessResult {
    bool launched = false; ///< False if the program could not be started
    int exit_code = -1;    ///< -1 unless the child exited normally
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_output;
    std::string stderr_output;
    std::string launch_error; ///< Reason when !launched
    int64_t duration_ms = 0;

    bool success() const {
        return launched && !timed_out && !cancelled && exit_code == 0;
    }
};

/// Runs `program args...`. `program` is looked up on PATH unless it has a slash.
SubprocessResult run_subprocess(const std::string& program, const std::vector<std::string>& args,
                                const SubprocessOptions& options = {});

/// Finds `program` on PATH. Returns an empty path if not found.
fs::path find_executable(const std::string& program);

/// Joins a command line for log output.
std::string format_command(const std::string& program, const std::vector<std::string>& args);

} // namespace pypack::build

#endif // PYPACK_BUILD_SUBPROCESS_HPP
