//! # Backend Invoker
//!
//! ```text
//! run(steps)
//!   ├─ push every step index into BuildQueue
//!   ├─ start min(jobs, steps) workers
//!   │    └─ worker_thread(): pop → run_step() → result slot
//!   └─ join, return results in step order
//! ```
//!
//! After cancellation, workers keep draining the queue but mark each popped
//! step `Skipped` without starting it.

#include "build/invoker.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

namespace pypack::build {

const char* unit_status_name(UnitStatus status) {
    switch (status) {
    case UnitStatus::Succeeded:
        return "ok";
    case UnitStatus::Failed:
        return "failed";
    case UnitStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

// ============================================================================
// BuildQueue
// ============================================================================

void BuildQueue::push(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(index);
    cv_.notify_one();
}

std::optional<size_t> BuildQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !queue_.empty() || stop_flag_; });
    }

    if (queue_.empty()) {
        return std::nullopt;
    }

    auto index = queue_.front();
    queue_.pop();
    return index;
}

void BuildQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_flag_ = true;
    cv_.notify_all();
}

bool BuildQueue::is_empty() {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t BuildQueue::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// BackendInvoker
// ============================================================================

BackendInvoker::BackendInvoker(const BackendSet& backends, InvokerOptions options)
    : backends_(backends), options_(std::move(options)) {}

int BackendInvoker::worker_count(size_t step_count) const {
    int jobs = options_.jobs;
    if (jobs <= 0) {
        jobs = static_cast<int>(std::thread::hardware_concurrency());
        if (jobs <= 0) {
            jobs = 1;
        }
    }
    return static_cast<int>(std::min<size_t>(static_cast<size_t>(jobs), step_count));
}

std::optional<PackError> BackendInvoker::check_availability(const std::vector<BuildStep>& steps) {
    std::vector<StepKind> checked;
    for (const auto& step : steps) {
        if (std::find(checked.begin(), checked.end(), step.kind) != checked.end()) {
            continue;
        }
        checked.push_back(step.kind);

        auto* backend = backends_.get(step.kind);
        if (!backend) {
            return make_error(ErrorKind::BackendUnavailable, {},
                              std::string("no backend for ") + step_kind_name(step.kind));
        }
        if (auto err = backend->check_available()) {
            return err;
        }
    }
    return std::nullopt;
}

std::vector<BuildUnitResult> BackendInvoker::run(const std::vector<BuildStep>& steps,
                                                 const CancellationToken& cancel) {
    std::vector<BuildUnitResult> results(steps.size());
    for (size_t i = 0; i < steps.size(); ++i) {
        results[i].unit = steps[i].unit;
        results[i].kind = steps[i].kind;
    }
    if (steps.empty()) {
        return results;
    }

    stats_.reset(static_cast<int>(steps.size()));

    BuildQueue queue;
    for (size_t i = 0; i < steps.size(); ++i) {
        queue.push(i);
    }

    int num_workers = worker_count(steps.size());
    PYPACK_LOG_INFO("invoker", "Running " << steps.size() << " step(s) on " << num_workers
                                          << " worker(s)");

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(num_workers));
    for (int i = 0; i < num_workers; ++i) {
        workers.emplace_back(&BackendInvoker::worker_thread, this, std::cref(steps),
                             std::ref(results), std::ref(queue), std::cref(cancel));
    }

    for (auto& worker : workers) {
        worker.join();
    }

    PYPACK_LOG_INFO("invoker", "Done in " << stats_.elapsed_ms() << " ms: " << stats_.succeeded.load()
                                          << " ok, " << stats_.failed.load() << " failed, "
                                          << stats_.skipped.load() << " skipped");
    return results;
}

void BackendInvoker::worker_thread(const std::vector<BuildStep>& steps,
                                   std::vector<BuildUnitResult>& results, BuildQueue& queue,
                                   const CancellationToken& cancel) {
    while (true) {
        auto index = queue.pop(0);
        if (!index) {
            break;
        }

        if (cancel.is_cancelled()) {
            auto& result = results[*index];
            result.status = UnitStatus::Skipped;
            result.error = make_error(ErrorKind::Cancelled, result.unit, "not started");
            stats_.skipped++;
            continue;
        }

        results[*index] = run_step(*index, steps[*index], cancel);
        switch (results[*index].status) {
        case UnitStatus::Succeeded:
            stats_.succeeded++;
            break;
        case UnitStatus::Failed:
            stats_.failed++;
            break;
        case UnitStatus::Skipped:
            stats_.skipped++;
            break;
        }
    }
}

BuildUnitResult BackendInvoker::run_step(size_t index, const BuildStep& step,
                                         const CancellationToken& cancel) {
    auto start = std::chrono::steady_clock::now();

    BuildUnitResult result;
    result.unit = step.unit;
    result.kind = step.kind;
    result.scratch_dir =
        options_.scratch_root / ("step-" + std::to_string(index) + "-" + step.unit.stem().string());

    auto finish = [&start, &result]() {
        result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - start)
                                 .count();
        return result;
    };

    std::error_code ec;
    fs::create_directories(result.scratch_dir, ec);
    if (ec) {
        result.status = UnitStatus::Failed;
        result.error = make_error(ErrorKind::BackendInvocationFailed, step.unit,
                                  "cannot create scratch directory " +
                                      result.scratch_dir.string() + ": " + ec.message());
        return finish();
    }

    auto* backend = backends_.get(step.kind);
    if (!backend) {
        result.status = UnitStatus::Failed;
        result.error = make_error(ErrorKind::BackendUnavailable, step.unit,
                                  std::string("no backend for ") + step_kind_name(step.kind));
        return finish();
    }

    PYPACK_LOG_DEBUG("invoker", backend->name() << ": " << step.unit.filename().string());

    StepContext ctx;
    ctx.scratch_dir = result.scratch_dir;
    ctx.project_root = options_.project_root;
    ctx.cancel = &cancel;

    auto outcome = backend->run(step, ctx);
    result.diagnostics = std::move(outcome.diagnostics);
    result.error = std::move(outcome.error);

    if (outcome.cancelled) {
        result.status = UnitStatus::Skipped;
    } else if (outcome.success) {
        result.status = UnitStatus::Succeeded;
        result.artifact = outcome.artifact;
    } else {
        result.status = UnitStatus::Failed;
        if (!result.error) {
            result.error = make_error(ErrorKind::BackendInvocationFailed, step.unit,
                                      std::string(backend->name()) + " failed");
        }
        PYPACK_LOG_WARN("invoker", result.error->to_string());
    }

    return finish();
}

} // namespace pypack::build
