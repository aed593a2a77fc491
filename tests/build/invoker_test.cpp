// Backend Invoker Tests
// Tests for BuildQueue, worker pool, failure isolation and cancellation

#include "build/invoker.hpp"
#include "support/test_support.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace pypack;
using namespace pypack::build;
using pypack::test_support::TempDir;

namespace {

/// Writes `<stem>.out` into the scratch directory; fails for units named `bad*`.
class RecordingBackend : public Backend {
public:
    std::atomic<int> runs{0};
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    int delay_ms = 0;
    std::optional<PackError> unavailable;
    CancellationToken* cancel_after_first = nullptr;

    auto name() const -> std::string_view override {
        return "recording";
    }

    auto check_available() -> std::optional<PackError> override {
        return unavailable;
    }

    auto run(const BuildStep& step, const StepContext& ctx) -> StepOutcome override {
        runs++;
        int now = ++active;
        int prev = max_active.load();
        while (now > prev && !max_active.compare_exchange_weak(prev, now)) {
        }
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        active--;

        if (cancel_after_first) {
            cancel_after_first->cancel();
        }

        StepOutcome outcome;
        auto stem = step.unit.stem().string();
        if (stem.starts_with("bad")) {
            outcome.diagnostics = "error: cannot build " + stem + "\n";
            outcome.error = make_error(ErrorKind::BackendInvocationFailed, step.unit,
                                       "recording exited with status 1");
            return outcome;
        }

        auto artifact = ctx.scratch_dir / (stem + ".out");
        pypack::test_support::write_file(artifact, stem);
        outcome.success = true;
        outcome.artifact = artifact;
        return outcome;
    }
};

BuildStep compile_step(const std::string& name) {
    return BuildStep{StepKind::CompileNative, fs::path("/project") / name, {},
                     fs::path(name).replace_extension(".so"), true};
}

} // namespace

// ============================================================================
// BuildQueue
// ============================================================================

TEST(BuildQueueTest, FifoOrder) {
    BuildQueue queue;
    queue.push(3);
    queue.push(1);
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.pop(0), std::optional<size_t>(3));
    EXPECT_EQ(queue.pop(0), std::optional<size_t>(1));
    EXPECT_TRUE(queue.is_empty());
    EXPECT_FALSE(queue.pop(0).has_value());
}

TEST(BuildQueueTest, StopWakesWaiter) {
    BuildQueue queue;
    std::thread stopper([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        queue.stop();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop(5000).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
    stopper.join();
}

// ============================================================================
// BackendInvoker
// ============================================================================

class InvokerTest : public ::testing::Test {
protected:
    TempDir dir{"pypack_invoker_test"};
    std::shared_ptr<RecordingBackend> backend = std::make_shared<RecordingBackend>();
    BackendSet backends;

    void SetUp() override {
        backends.set(StepKind::CompileNative, backend);
    }

    InvokerOptions options(int jobs) {
        InvokerOptions opts;
        opts.jobs = jobs;
        opts.scratch_root = dir.path();
        opts.project_root = "/project";
        return opts;
    }
};

TEST_F(InvokerTest, ResultsFollowStepOrder) {
    std::vector<BuildStep> steps = {compile_step("a.py"), compile_step("b.py"),
                                    compile_step("c.py"), compile_step("d.py")};

    BackendInvoker invoker(backends, options(4));
    CancellationToken cancel;
    auto results = invoker.run(steps, cancel);

    ASSERT_EQ(results.size(), 4u);
    for (size_t i = 0; i < steps.size(); ++i) {
        EXPECT_EQ(results[i].unit, steps[i].unit);
        EXPECT_EQ(results[i].status, UnitStatus::Succeeded);
        EXPECT_EQ(results[i].artifact.filename(), steps[i].unit.stem().string() + ".out");
        EXPECT_TRUE(fs::exists(results[i].artifact));
    }
    EXPECT_EQ(invoker.stats().succeeded.load(), 4);
    EXPECT_EQ(backend->runs.load(), 4);
}

TEST_F(InvokerTest, EachStepGetsItsOwnScratchDirectory) {
    std::vector<BuildStep> steps = {compile_step("a.py"), compile_step("pkg/a.py")};

    BackendInvoker invoker(backends, options(2));
    CancellationToken cancel;
    auto results = invoker.run(steps, cancel);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_NE(results[0].scratch_dir, results[1].scratch_dir);
    EXPECT_EQ(results[0].scratch_dir.parent_path(), dir.path());
}

TEST_F(InvokerTest, FailureDoesNotStopOtherSteps) {
    std::vector<BuildStep> steps = {compile_step("a.py"), compile_step("bad.py"),
                                    compile_step("c.py")};

    BackendInvoker invoker(backends, options(1));
    CancellationToken cancel;
    auto results = invoker.run(steps, cancel);

    EXPECT_EQ(results[0].status, UnitStatus::Succeeded);
    EXPECT_EQ(results[1].status, UnitStatus::Failed);
    EXPECT_EQ(results[2].status, UnitStatus::Succeeded);

    ASSERT_TRUE(results[1].error.has_value());
    EXPECT_EQ(results[1].error->kind, ErrorKind::BackendInvocationFailed);
    EXPECT_EQ(results[1].diagnostics, "error: cannot build bad\n");
    EXPECT_EQ(invoker.stats().failed.load(), 1);
    EXPECT_EQ(invoker.stats().succeeded.load(), 2);
}

TEST_F(InvokerTest, JobsBoundConcurrency) {
    backend->delay_ms = 50;
    std::vector<BuildStep> steps;
    for (int i = 0; i < 6; ++i) {
        steps.push_back(compile_step("m" + std::to_string(i) + ".py"));
    }

    BackendInvoker invoker(backends, options(2));
    CancellationToken cancel;
    auto results = invoker.run(steps, cancel);

    EXPECT_EQ(invoker.stats().succeeded.load(), 6);
    EXPECT_LE(backend->max_active.load(), 2);
}

TEST_F(InvokerTest, SequentialWithOneJob) {
    backend->delay_ms = 10;
    std::vector<BuildStep> steps = {compile_step("a.py"), compile_step("b.py"),
                                    compile_step("c.py")};

    BackendInvoker invoker(backends, options(1));
    CancellationToken cancel;
    invoker.run(steps, cancel);

    EXPECT_EQ(backend->max_active.load(), 1);
}

TEST_F(InvokerTest, WorkerCount) {
    BackendInvoker four(backends, options(4));
    EXPECT_EQ(four.worker_count(2), 2);
    EXPECT_EQ(four.worker_count(10), 4);

    BackendInvoker automatic(backends, options(0));
    EXPECT_GE(automatic.worker_count(64), 1);
    EXPECT_EQ(automatic.worker_count(1), 1);
}

TEST_F(InvokerTest, EmptyPlanRunsNothing) {
    BackendInvoker invoker(backends, options(2));
    CancellationToken cancel;
    EXPECT_TRUE(invoker.run({}, cancel).empty());
    EXPECT_EQ(backend->runs.load(), 0);
}

TEST_F(InvokerTest, CancelledBeforeStartSkipsEverything) {
    std::vector<BuildStep> steps = {compile_step("a.py"), compile_step("b.py")};

    BackendInvoker invoker(backends, options(2));
    CancellationToken cancel;
    cancel.cancel();
    auto results = invoker.run(steps, cancel);

    EXPECT_EQ(backend->runs.load(), 0);
    for (const auto& result : results) {
        EXPECT_EQ(result.status, UnitStatus::Skipped);
        ASSERT_TRUE(result.error.has_value());
        EXPECT_EQ(result.error->kind, ErrorKind::Cancelled);
    }
    EXPECT_EQ(invoker.stats().skipped.load(), 2);
}

TEST_F(InvokerTest, CancellationSkipsRemainingSteps) {
    CancellationToken cancel;
    backend->cancel_after_first = &cancel;
    std::vector<BuildStep> steps = {compile_step("a.py"), compile_step("b.py"),
                                    compile_step("c.py")};

    BackendInvoker invoker(backends, options(1));
    auto results = invoker.run(steps, cancel);

    EXPECT_EQ(backend->runs.load(), 1);
    EXPECT_EQ(results[0].status, UnitStatus::Succeeded);
    EXPECT_EQ(results[1].status, UnitStatus::Skipped);
    EXPECT_EQ(results[2].status, UnitStatus::Skipped);
}

TEST_F(InvokerTest, AvailabilityCheck) {
    BackendInvoker invoker(backends, options(1));
    std::vector<BuildStep> steps = {compile_step("a.py")};
    EXPECT_FALSE(invoker.check_availability(steps).has_value());

    backend->unavailable = make_error(ErrorKind::BackendUnavailable, "python3", "missing");
    auto err = invoker.check_availability(steps);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::BackendUnavailable);
}

TEST_F(InvokerTest, MissingBackendIsUnavailable) {
    BackendInvoker invoker(backends, options(1));
    std::vector<BuildStep> steps = {
        BuildStep{StepKind::PackArchive, "/project/a.py", {}, "a.zip", true}};

    auto err = invoker.check_availability(steps);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::BackendUnavailable);
    EXPECT_NE(err->message.find("no backend"), std::string::npos);
}

TEST(UnitStatusTest, Names) {
    EXPECT_STREQ(unit_status_name(UnitStatus::Succeeded), "ok");
    EXPECT_STREQ(unit_status_name(UnitStatus::Failed), "failed");
    EXPECT_STREQ(unit_status_name(UnitStatus::Skipped), "skipped");
}
