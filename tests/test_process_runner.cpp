#include <chrono>
#include <csignal>

#include "gtest/gtest.h"
#include "../libmetawipe/include/process_runner.hpp"

namespace metawipe {
namespace {

TEST(PosixProcessRunnerTest, ReportsExitCode) {
    PosixProcessRunner runner;
    const auto result = runner.run({"sh", "-c", "exit 3"}, std::chrono::seconds(10));
    EXPECT_FALSE(result.launch_failed);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.ok());
}

TEST(PosixProcessRunnerTest, SuccessIsOk) {
    PosixProcessRunner runner;
    EXPECT_TRUE(runner.run({"true"}, std::chrono::seconds(10)).ok());
}

TEST(PosixProcessRunnerTest, CapturesStderrButNotStdout) {
    PosixProcessRunner runner;
    const auto result = runner.run({"sh", "-c", "echo visible; echo broken header >&2"}, std::chrono::seconds(10));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.stderr_output.find("broken header"), std::string::npos);
    EXPECT_EQ(result.stderr_output.find("visible"), std::string::npos);
}

TEST(PosixProcessRunnerTest, MissingBinaryIsLaunchFailure) {
    PosixProcessRunner runner;
    const auto result = runner.run({"/nonexistent/metawipe-no-such-tool", "-all="}, std::chrono::seconds(10));
    EXPECT_TRUE(result.launch_failed);
    EXPECT_FALSE(result.ok());
}

TEST(PosixProcessRunnerTest, EmptyCommandIsLaunchFailure) {
    PosixProcessRunner runner;
    EXPECT_TRUE(runner.run({}, std::chrono::seconds(1)).launch_failed);
}

TEST(PosixProcessRunnerTest, ReportsDeathBySignal) {
    PosixProcessRunner runner;
    const auto result = runner.run({"sh", "-c", "kill -INT $$"}, std::chrono::seconds(10));
    EXPECT_TRUE(result.signaled);
    EXPECT_EQ(result.term_signal, SIGINT);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.ok());
}

TEST(PosixProcessRunnerTest, KillsChildAfterTimeout) {
    PosixProcessRunner runner;
    const auto start = std::chrono::steady_clock::now();
    const auto result = runner.run({"sleep", "30"}, std::chrono::seconds(1));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.ok());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(FindExecutableTest, LocatesBinariesOnPath) {
    const auto sh = find_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(sh->is_absolute() || sh->has_parent_path());
    EXPECT_FALSE(find_executable("metawipe-definitely-not-installed").has_value());
    EXPECT_FALSE(find_executable("").has_value());
}

TEST(FindExecutableTest, AcceptsExplicitPath) {
    const auto sh = find_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(find_executable(sh->string()).has_value());
    EXPECT_FALSE(find_executable("/nonexistent/dir/tool").has_value());
}

} // namespace
} // namespace metawipe
