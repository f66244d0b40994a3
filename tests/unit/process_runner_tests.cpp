#include <gtest/gtest.h>
#include "runtime/process_runner.hpp"
#include <cerrno>
#include <system_error>

using namespace remoteops::runtime;

TEST(ProcessRunnerTest, CapturesStdoutAndStderr) {
    ProcessResult result = ProcessRunner::run("/bin/sh", {"-c", "echo out; echo err >&2"});

    ASSERT_TRUE(result.spawned);
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "out\n");
    EXPECT_EQ(result.stderr_data, "err\n");
}

TEST(ProcessRunnerTest, ReportsExitCode) {
    ProcessResult result = ProcessRunner::run("/bin/sh", {"-c", "exit 4"});

    EXPECT_TRUE(result.spawned);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_code, 4);
    EXPECT_EQ(result.term_signal, 0);
}

TEST(ProcessRunnerTest, ReportsTerminatingSignal) {
    ProcessResult result = ProcessRunner::run("/bin/sh", {"-c", "kill -9 $$"});

    EXPECT_TRUE(result.spawned);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.term_signal, 9);
    EXPECT_EQ(result.exit_code, -1);
}

TEST(ProcessRunnerTest, MissingProgramIsSpawnFailure) {
    ProcessResult result = ProcessRunner::run("/nonexistent/program");

    EXPECT_FALSE(result.spawned);
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.error.find("/nonexistent/program"), std::string::npos);
    EXPECT_NE(result.error.find(std::error_code(ENOENT, std::generic_category()).message()),
              std::string::npos);
}

TEST(ProcessRunnerTest, RunDoesNotSearchPath) {
    EXPECT_FALSE(ProcessRunner::run("sh", {"-c", "true"}).spawned);
}

TEST(ProcessRunnerTest, RunToolSearchesPath) {
    ProcessResult result = ProcessRunner::run_tool("sh", {"-c", "echo tool"});
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdout_data, "tool\n");
}

TEST(ProcessRunnerTest, LargeOutputOnBothStreams) {
    // Larger than a pipe buffer on each stream, so both must be drained together
    ProcessResult result = ProcessRunner::run("/bin/sh",
        {"-c", "head -c 200000 /dev/zero; head -c 150000 /dev/zero >&2"});

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.stdout_data.size(), 200000u);
    EXPECT_EQ(result.stderr_data.size(), 150000u);
}

TEST(ProcessRunnerTest, StdinIsEmpty) {
    ProcessResult result = ProcessRunner::run("/bin/sh", {"-c", "cat; echo done"});
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdout_data, "done\n");
}
