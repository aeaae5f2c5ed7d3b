#include "normfmt/exec/process_runner.hpp"
#include <gtest/gtest.h>

namespace normfmt {

class ProcessRunnerTest : public ::testing::Test {
protected:
    auto shell(const std::string& script, const EnvOverrides& env = {}) -> ProcessResult {
        return runner_.run({"/bin/sh", "-c", script}, env);
    }

    ProcessRunner runner_;
};

TEST_F(ProcessRunnerTest, CapturesStreamsAndExitCode)
{
    auto result = shell("echo out; echo err >&2; exit 4");

    EXPECT_EQ(result.exit_code, 4);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST_F(ProcessRunnerTest, MissingProgramReports127)
{
    auto result = runner_.run({"/nonexistent/normfmt-no-such-tool"}, {});

    EXPECT_EQ(result.exit_code, kExecFailureExitCode);
}

TEST_F(ProcessRunnerTest, EmptyArgvIsRejected)
{
    auto result = runner_.run({}, {});

    EXPECT_EQ(result.exit_code, kExecFailureExitCode);
    EXPECT_FALSE(result.stderr_output.empty());
}

TEST_F(ProcessRunnerTest, EnvironmentOverridesReachTheChild)
{
    auto result = shell("printf '%s' \"$NORMFMT_TEST_VALUE\"", {{"NORMFMT_TEST_VALUE", "a b=c"}});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "a b=c");
}

TEST_F(ProcessRunnerTest, ArgumentsAreNotShellExpanded)
{
    auto result = runner_.run({"/bin/echo", "$HOME", "*"}, {});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "$HOME *\n");
}

TEST_F(ProcessRunnerTest, LargeOutputDoesNotBlock)
{
    // More than a pipe buffer on both streams at once
    auto result = shell("dd if=/dev/zero bs=1024 count=256 2>/dev/null; "
                        "dd if=/dev/zero bs=1024 count=128 2>/dev/null >&2");

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output.size(), 262144);
    EXPECT_EQ(result.stderr_output.size(), 131072);
}

TEST_F(ProcessRunnerTest, SignalledChildReportsNegativeSignal)
{
    auto result = shell("kill -KILL $$");

    EXPECT_EQ(result.exit_code, -9);
}

} // namespace normfmt
