#include <gtest/gtest.h>
#include "../include/ActionRunner.hpp"
#include "../include/Errors.hpp"
#include "TmpDir.hpp"
#include <cstdlib>
#include <sstream>
#include <sys/wait.h>

using namespace ordo;

TEST(ActionRunner, ReturnsExitStatus)
{
    std::ostringstream out, err;
    const ActionRunner runner(out, err);
    EXPECT_EQ(runner.run(Command::shell("exit 0"), {}, {}), 0);
    EXPECT_EQ(runner.run(Command::shell("exit 3"), {}, {}), 3);
    EXPECT_EQ(runner.run(Command{{"false"}}, {}, {}), 1);
}

TEST(ActionRunner, SignalledChildMapsTo128PlusSignal)
{
    std::ostringstream out, err;
    const ActionRunner runner(out, err);
    EXPECT_EQ(runner.run(Command::shell("kill -TERM $$"), {}, {}), 128 + 15);
}

TEST(ActionRunner, ForwardsStdoutAndStderrSeparately)
{
    std::ostringstream out, err;
    const ActionRunner runner(out, err);
    ASSERT_EQ(runner.run(Command::shell("echo to-out; echo to-err >&2; echo again"), {}, {}), 0);
    EXPECT_EQ(out.str(), "to-out\nagain\n");
    EXPECT_EQ(err.str(), "to-err\n");
}

TEST(ActionRunner, ForwardsLargeOutputWithoutDeadlock)
{
    // Far more than a pipe buffer on both streams.
    std::ostringstream out, err;
    const ActionRunner runner(out, err);
    ASSERT_EQ(runner.run(Command::shell("i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done"),
                         {}, {}), 0);
    EXPECT_NE(out.str().find("line19999\n"), std::string::npos);
    EXPECT_NE(err.str().find("err19999\n"), std::string::npos);
}

TEST(ActionRunner, OverridesWinOverAmbientEnvironment)
{
    setenv("ORDO_TEST_AMBIENT", "ambient", 1);
    setenv("ORDO_TEST_CLASH", "ambient", 1);
    std::ostringstream out, err;
    const ActionRunner runner(out, err);
    const EnvOverrides env{{"ORDO_TEST_CLASH", "override"}, {"ORDO_TEST_NEW", "fresh"}};
    ASSERT_EQ(runner.run(Command::shell("echo $ORDO_TEST_AMBIENT $ORDO_TEST_CLASH $ORDO_TEST_NEW"), env, {}), 0);
    EXPECT_EQ(out.str(), "ambient override fresh\n");

    // The engine's own environment is left alone.
    EXPECT_STREQ(std::getenv("ORDO_TEST_CLASH"), "ambient");
    EXPECT_EQ(std::getenv("ORDO_TEST_NEW"), nullptr);
    unsetenv("ORDO_TEST_AMBIENT");
    unsetenv("ORDO_TEST_CLASH");
}

TEST(ActionRunner, MergedEnvironmentHasNoDuplicateKeys)
{
    setenv("ORDO_TEST_DUP", "old", 1);
    const auto block = ChildProcess::merged_environment({{"ORDO_TEST_DUP", "new"}});
    int seen = 0;
    for (const auto &e: block) {
        if (e.rfind("ORDO_TEST_DUP=", 0) == 0) {
            ++seen;
            EXPECT_EQ(e, "ORDO_TEST_DUP=new");
        }
    }
    EXPECT_EQ(seen, 1);
    unsetenv("ORDO_TEST_DUP");
}

TEST(ActionRunner, RunsInWorkingDirectory)
{
    TmpDir dir;
    std::ostringstream out, err;
    const ActionRunner runner(out, err);
    ASSERT_EQ(runner.run(Command::shell("echo made > here.txt"), {}, dir.path), 0);
    EXPECT_EQ(dir.read("here.txt"), "made\n");
}

TEST(ActionRunner, MissingProgramExits127)
{
    std::ostringstream out, err;
    const ActionRunner runner(out, err);
    EXPECT_EQ(runner.run(Command{{"ordo-no-such-program-xyz"}}, {}, {}), 127);
    EXPECT_NE(err.str().find("ordo-no-such-program-xyz"), std::string::npos);
}

TEST(ActionRunner, MissingDirectoryExits127)
{
    std::ostringstream out, err;
    const ActionRunner runner(out, err);
    EXPECT_EQ(runner.run(Command::shell("true"), {}, "/nonexistent/ordo/dir"), 127);
}

TEST(ActionRunner, EmptyCommandThrows)
{
    std::ostringstream out, err;
    const ActionRunner runner(out, err);
    EXPECT_THROW((void) runner.run(Command{}, {}, {}), ActionFailure);
}

TEST(ChildProcess, DestructorReapsUnwaitedChild)
{
    pid_t pid;
    {
        auto child = ChildProcess::spawn({"/bin/sh", "-c", "exit 0"}, {}, {});
        pid = child.id();
        ASSERT_GT(pid, 0);
    }
    // Already reaped: no child with that pid is left to wait for.
    EXPECT_EQ(waitpid(pid, nullptr, WNOHANG), -1);
}
