// Subprocess Tests
// Tests for run_subprocess, find_executable, format_command

#include "build/subprocess.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace pypack::build;
namespace fs = std::filesystem;

TEST(SubprocessTest, CapturesStdoutStderrAndExitCode) {
    auto result = run_subprocess("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"});

    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST(SubprocessTest, SuccessfulCommand) {
    auto result = run_subprocess("sh", {"-c", "printf 'a b'"});

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdout_output, "a b");
}

TEST(SubprocessTest, LargeOutputIsNotTruncated) {
    auto result = run_subprocess("/bin/sh", {"-c", "i=0; while [ $i -lt 5000 ]; do "
                                                   "echo 0123456789abcdef; i=$((i+1)); done"});

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.stdout_output.size(), 5000u * 17u);
}

TEST(SubprocessTest, MissingProgramIsLaunchFailure) {
    auto result = run_subprocess("pypack-no-such-program-xyz", {});

    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.launch_error.find("cannot run 'pypack-no-such-program-xyz'"),
              std::string::npos);
}

TEST(SubprocessTest, RunsInWorkingDirectory) {
    auto dir = fs::canonical(fs::temp_directory_path());
    SubprocessOptions options;
    options.cwd = dir;

    auto result = run_subprocess("/bin/sh", {"-c", "pwd -P"}, options);
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.stdout_output, dir.string() + "\n");
}

TEST(SubprocessTest, MissingWorkingDirectoryIsLaunchFailure) {
    SubprocessOptions options;
    options.cwd = fs::temp_directory_path() / "pypack-no-such-dir-xyz";

    auto result = run_subprocess("/bin/sh", {"-c", "true"}, options);
    EXPECT_FALSE(result.launched);
}

TEST(SubprocessTest, TimeoutStopsTheProcess) {
    SubprocessOptions options;
    options.timeout_seconds = 1;

    auto start = std::chrono::steady_clock::now();
    auto result = run_subprocess("/bin/sh", {"-c", "sleep 30"}, options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.stderr_output.find("timed out after 1s"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(SubprocessTest, CancellationStopsTheProcess) {
    CancellationToken token;
    SubprocessOptions options;
    options.cancel = &token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = run_subprocess("/bin/sh", {"-c", "sleep 30"}, options);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.success());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(SubprocessTest, FindExecutable) {
    EXPECT_FALSE(find_executable("sh").empty());
    EXPECT_EQ(find_executable("/bin/sh"), fs::path("/bin/sh"));
    EXPECT_TRUE(find_executable("pypack-no-such-program-xyz").empty());
    EXPECT_TRUE(find_executable("/nonexistent/dir/sh").empty());
}

TEST(SubprocessTest, FormatCommandQuotesSpaces) {
    EXPECT_EQ(format_command("python3", {"-m", "PyInstaller", "my file.py", ""}),
              "python3 -m PyInstaller \"my file.py\" \"\"");
}
