//! # Backend Invoker
//!
//! Runs planned steps on a bounded pool of worker threads.
//!
//! ## Components
//!
//! | Class            | Description                                  |
//! |------------------|----------------------------------------------|
//! | `BuildUnitResult`| Outcome of one step                          |
//! | `BuildQueue`     | Thread-safe queue of step indices            |
//! | `BuildStats`     | Atomic counters for progress output          |
//! | `BackendInvoker` | Availability check, worker pool, results     |
//!
//! ## Thread Safety
//!
//! | Component        | Synchronization                          |
//! |------------------|------------------------------------------|
//! | BuildQueue       | Mutex + condition variable               |
//! | BuildStats       | Atomic counters                          |
//! | Result slots     | One preallocated slot per step           |
//! | Scratch dirs     | One directory per step                   |

#ifndef PYPACK_BUILD_INVOKER_HPP
#define PYPACK_BUILD_INVOKER_HPP

#include "build/backend.hpp"
#include "build/build_plan.hpp"
#include "build/subprocess.hpp"
#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace pypack::build {

enum class UnitStatus { Succeeded, Failed, Skipped };

const char* unit_status_name(UnitStatus status);

struct BuildUnitResult {
    fs::path unit;
    StepKind kind = StepKind::CompileNative;
    UnitStatus status = UnitStatus::Skipped;
    fs::path artifact;       ///< Final location once installed (scratch location before)
    std::string diagnostics; ///< Captured tool output, verbatim
    std::optional<PackError> error;
    bool cached = false;
    bool banner_applied = false;
    int64_t duration_ms = 0;
    fs::path scratch_dir; ///< Kept for inspection when the step failed
};

/**
 * Build statistics for progress reporting
 */
struct BuildStats {
    std::atomic<int> total{0};
    std::atomic<int> succeeded{0};
    std::atomic<int> failed{0};
    std::atomic<int> skipped{0};
    std::chrono::steady_clock::time_point start_time;

    void reset(int steps) {
        total = steps;
        succeeded = 0;
        failed = 0;
        skipped = 0;
        start_time = std::chrono::steady_clock::now();
    }

    int64_t elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

/**
 * Thread-safe work queue of step indices
 */
class BuildQueue {
public:
    void push(size_t index);

    /// Waits up to `timeout_ms`; nullopt if still empty or stopped.
    std::optional<size_t> pop(int timeout_ms = 100);

    void stop();
    bool is_empty();
    size_t size();

private:
    std::queue<size_t> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_flag_ = false;
};

struct InvokerOptions {
    int jobs = 0;         ///< 0 = hardware concurrency
    fs::path scratch_root; ///< Parent of the per-step scratch directories
    fs::path project_root;
};

class BackendInvoker {
public:
    BackendInvoker(const BackendSet& backends, InvokerOptions options);

    /// Checks the backend of every step kind present. Returns the first failure.
    std::optional<PackError> check_availability(const std::vector<BuildStep>& steps);

    /// Runs every step. Results are in step order.
    std::vector<BuildUnitResult> run(const std::vector<BuildStep>& steps,
                                     const CancellationToken& cancel);

    /// Worker threads that would be used for `step_count` steps.
    int worker_count(size_t step_count) const;

    const BuildStats& stats() const {
        return stats_;
    }

private:
    const BackendSet& backends_;
    InvokerOptions options_;
    BuildStats stats_;

    void worker_thread(const std::vector<BuildStep>& steps, std::vector<BuildUnitResult>& results,
                       BuildQueue& queue, const CancellationToken& cancel);

    BuildUnitResult run_step(size_t index, const BuildStep& step, const CancellationToken& cancel);
};

} // namespace pypack::build

#endif // PYPACK_BUILD_INVOKER_HPP
