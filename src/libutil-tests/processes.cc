#include "chunkcache/util/processes.hh"
#include "chunkcache/util/serialise.hh"

#include <gtest/gtest.h>

#include <sys/wait.h>

namespace chunkcache {

using namespace std::chrono_literals;

/* ----------------------------------------------------------------------------
 * statusOk
 * --------------------------------------------------------------------------*/

TEST(statusOk, zeroIsOk)
{
    ASSERT_EQ(statusOk(0), true);
    ASSERT_EQ(statusOk(1), false);
}

/* ----------------------------------------------------------------------------
 * runProgram
 * --------------------------------------------------------------------------*/

TEST(runProgram, capturesStdout)
{
    ASSERT_EQ(runProgram("/bin/sh", false, {"-c", "echo hello"}), "hello\n");
}

TEST(runProgram, failureThrowsExecError)
{
    try {
        runProgram("/bin/sh", false, {"-c", "exit 7"});
        FAIL() << "expected ExecError";
    } catch (ExecError & e) {
        EXPECT_TRUE(WIFEXITED(e.status));
        EXPECT_EQ(WEXITSTATUS(e.status), 7);
        EXPECT_FALSE(e.timedOut);
    }
}

/* ----------------------------------------------------------------------------
 * runProgram2
 * --------------------------------------------------------------------------*/

TEST(runProgram2, mergesStderr)
{
    StringSink out;
    runProgram2({
        .program = "sh",
        .args = {"-c", "echo out; echo err >&2"},
        .standardOut = &out,
        .mergeStderrToStdout = true,
    });
    ASSERT_EQ(out.s, "out\nerr\n");
}

TEST(runProgram2, passesEnvironment)
{
    StringSink out;
    runProgram2({
        .program = "sh",
        .args = {"-c", "printf '%s' \"$CHUNKCACHE_TEST_VAR\""},
        .environment = {{"CHUNKCACHE_TEST_VAR", "42"}},
        .standardOut = &out,
    });
    ASSERT_EQ(out.s, "42");
}

TEST(runProgram2, timeoutKillsProcessGroup)
{
    auto start = std::chrono::steady_clock::now();
    try {
        runProgram2({
            .program = "sh",
            .args = {"-c", "sleep 30 & sleep 30"},
            .timeout = 1s,
        });
        FAIL() << "expected ExecError";
    } catch (ExecError & e) {
        EXPECT_TRUE(e.timedOut);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 15s);
}

TEST(runProgram2, fastProgramIsNotKilled)
{
    StringSink out;
    runProgram2({
        .program = "sh",
        .args = {"-c", "echo done"},
        .standardOut = &out,
        .timeout = 10s,
    });
    ASSERT_EQ(out.s, "done\n");
}

TEST(runProgram2, exitRacingTheDeadline)
{
    /* The child exits right around the deadline. Either outcome is
       fine, but a timeout must be reported as one, and a clean exit
       must not be turned into a kill. */
    for (int i = 0; i < 3; ++i) {
        StringSink out;
        try {
            runProgram2({
                .program = "sh",
                .args = {"-c", "sleep 1; echo finished"},
                .standardOut = &out,
                .timeout = 1s,
            });
            EXPECT_EQ(out.s, "finished\n");
        } catch (ExecError & e) {
            EXPECT_TRUE(e.timedOut);
        }
    }
}

} // namespace chunkcache
