#include "test_support.hpp"
#include <managers/command_executor.hpp>
#include <platform/process.hpp>
#include <chrono>

// The tool token is mapped to /bin/sh so "lxc -c '...'" runs a shell snippet.
class CommandExecutorTest : public StateDirTest {
protected:
    ProcessCommandExecutor exec{"/bin/sh", 5};
};

TEST_F(CommandExecutorTest, ReturnsTrimmedStdout) {
    auto r = exec.execute("lxc -c 'echo \"  hello  \"'");
    ASSERT_TRUE(r.is_ok()) << r.describe();
    EXPECT_EQ(r.value, "hello");
}

TEST_F(CommandExecutorTest, EmptyStdoutIsOkMarker) {
    auto r = exec.execute("lxc -c true");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "ok");
}

TEST_F(CommandExecutorTest, NonZeroExitReportsStderr) {
    auto r = exec.execute("lxc -c 'echo \"Error: not found\" >&2; exit 1'");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Execution);
    EXPECT_EQ(r.error, "Error: not found");
}

TEST_F(CommandExecutorTest, NonZeroExitWithoutStderr) {
    auto r = exec.execute("lxc -c 'exit 3'");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "command failed with exit code 3");
}

TEST_F(CommandExecutorTest, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    auto r = exec.execute("lxc -c 'sleep 30'", 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "timed out after 1s");
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(CommandExecutorTest, OtherProgramsRunUnchanged) {
    auto r = exec.execute("echo direct");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "direct");
}

TEST_F(CommandExecutorTest, MissingProgramFails) {
    auto r = exec.execute("warden-no-such-program-xyz");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Execution);
}

TEST_F(CommandExecutorTest, UnbalancedQuoteFails) {
    auto r = exec.execute("lxc -c 'echo");
    ASSERT_TRUE(r.is_err());
}

TEST_F(CommandExecutorTest, ResolveTool) {
    EXPECT_TRUE(ProcessCommandExecutor::resolve_tool("sh").is_ok());
    EXPECT_TRUE(ProcessCommandExecutor::resolve_tool("/bin/sh").is_ok());
    EXPECT_TRUE(ProcessCommandExecutor::resolve_tool("warden-no-such-tool-xyz").is_err());
}

TEST(Process, RunCapturedCollectsBothStreams) {
    CommandOutput r = platform::run_captured("/bin/sh", {"-c", "echo out; echo err >&2; exit 2"}, 5000);
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.stdout_data, "out\n");
    EXPECT_EQ(r.stderr_data, "err\n");
}

TEST(Process, CapturePipesAreNotInherited) {
    auto open_fds = [] {
        CommandOutput r = platform::run_captured("/bin/sh", {"-c", "ls /proc/self/fd | wc -l"}, 5000);
        EXPECT_EQ(r.exit_code, 0);
        return std::stoi(r.stdout_data);
    };
    int baseline = open_fds();

    // A running child still holds the read ends of its pipes in this process
    platform::ProcessHandle sleeper = platform::spawn("/bin/sh", {"-c", "sleep 5"}, true);
    ASSERT_TRUE(sleeper.valid());
    EXPECT_EQ(open_fds(), baseline);
    sleeper.terminate();
}
