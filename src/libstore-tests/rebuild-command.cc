#include <gtest/gtest.h>

#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/rebuild-command.hh"
#include "chunkcache/store/tests/libstore.hh"

namespace chunkcache {

using namespace std::chrono_literals;

class RebuildCommandTest : public LibStoreTest
{
protected:
    /* `script` sees the artifact name as $1 and the destination as $2. */
    RebuildFunction shell(const std::string & script, std::chrono::seconds timeout = 10s)
    {
        return makeCommandRebuilder({"/bin/sh", "-c", script, "rebuild"}, timeout);
    }
};

TEST_F(RebuildCommandTest, producesDestination)
{
    auto rebuild = shell("echo building $1; printf '%s' \"$1\" > \"$2\"");
    auto dest = tmpDir + "/out";

    EXPECT_EQ(rebuild("wiki", dest), dest);
    EXPECT_EQ(readFile(dest), "wiki");
}

TEST_F(RebuildCommandTest, failingCommand)
{
    auto rebuild = shell("echo oops >&2; exit 3");
    ASSERT_THROW(rebuild("wiki", tmpDir + "/out"), RebuildFailure);
}

TEST_F(RebuildCommandTest, missingOutput)
{
    auto rebuild = shell("true");
    ASSERT_THROW(rebuild("wiki", tmpDir + "/out"), RebuildFailure);
}

TEST_F(RebuildCommandTest, emptyCommand)
{
    auto rebuild = makeCommandRebuilder({}, 10s);
    ASSERT_THROW(rebuild("wiki", tmpDir + "/out"), RebuildFailure);
}

TEST_F(RebuildCommandTest, missingProgram)
{
    auto rebuild = makeCommandRebuilder({tmpDir + "/does-not-exist"}, 10s);
    ASSERT_THROW(rebuild("wiki", tmpDir + "/out"), RebuildFailure);
}

TEST_F(RebuildCommandTest, timeoutKillsTheCommand)
{
    auto rebuild = shell("sleep 30 & wait; touch \"$2\"", 1s);

    auto start = std::chrono::steady_clock::now();
    ASSERT_THROW(rebuild("wiki", tmpDir + "/out"), RebuildFailure);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 20s);
    EXPECT_FALSE(pathExists(tmpDir + "/out"));
}

} // namespace chunkcache
