#include "chunkcache/util/file-descriptor.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/strings.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fcntl.h>

namespace chunkcache {

class JSONLoggerTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    Path logPath;
    AutoCloseFD fd;
    std::unique_ptr<Logger> jsonLogger;

    void SetUp() override
    {
        auto tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
        logPath = tmpDir + "/log";
        fd = open(logPath.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        ASSERT_TRUE(fd);
        jsonLogger = makeJSONLogger(fd.get());
    }

    std::vector<nlohmann::json> lines()
    {
        std::vector<nlohmann::json> res;
        for (auto & line : tokenizeString<Strings>(readFile(logPath), "\n"))
            res.push_back(nlohmann::json::parse(line));
        return res;
    }
};

TEST_F(JSONLoggerTest, messageIsOneObjectPerLine)
{
    jsonLogger->log(lvlInfo, "hello");
    jsonLogger->log(lvlError, "\e[31mred\e[0m");

    auto l = lines();
    ASSERT_EQ(l.size(), 2);
    EXPECT_EQ(l[0]["action"], "msg");
    EXPECT_EQ(l[0]["level"], lvlInfo);
    EXPECT_EQ(l[0]["msg"], "hello");
    // Colours are stripped.
    EXPECT_EQ(l[1]["msg"], "red");
}

TEST_F(JSONLoggerTest, errorCarriesTraces)
{
    Error e("chunk %d is missing", 3);
    e.addTrace("while restoring '%s'", "wiki");
    jsonLogger->logEI(e.info());

    auto l = lines();
    ASSERT_EQ(l.size(), 1);
    EXPECT_EQ(l[0]["raw_msg"], "chunk 3 is missing");
    ASSERT_EQ(l[0]["trace"].size(), 1);
    EXPECT_EQ(l[0]["trace"][0], "while restoring 'wiki'");
}

TEST_F(JSONLoggerTest, activityLifecycle)
{
    {
        Activity act(*jsonLogger, lvlInfo, actRestore, "restoring 'wiki'");
        act.progress(10, 100);
        act.result(resRebuildLogLine, "a line");
    }

    auto l = lines();
    ASSERT_EQ(l.size(), 4);
    EXPECT_EQ(l[0]["action"], "start");
    EXPECT_EQ(l[0]["type"], actRestore);
    EXPECT_EQ(l[0]["text"], "restoring 'wiki'");
    auto id = l[0]["id"];

    EXPECT_EQ(l[1]["action"], "result");
    EXPECT_EQ(l[1]["type"], resProgress);
    EXPECT_EQ(l[1]["fields"][0], 10);
    EXPECT_EQ(l[1]["fields"][1], 100);

    EXPECT_EQ(l[2]["type"], resRebuildLogLine);
    EXPECT_EQ(l[2]["fields"][0], "a line");

    EXPECT_EQ(l[3]["action"], "stop");
    EXPECT_EQ(l[3]["id"], id);
}

TEST_F(JSONLoggerTest, pushedActivityBecomesParent)
{
    {
        Activity outer(*jsonLogger, lvlInfo, actEnsure, "ensuring 'wiki'");
        PushActivity pact(outer.id);
        Activity inner(*jsonLogger, lvlInfo, actRebuild, "rebuilding 'wiki'");
    }
    Activity after(*jsonLogger, lvlInfo, actUpload, "uploading 'wiki'");

    auto l = lines();
    ASSERT_EQ(l.size(), 5);
    EXPECT_EQ(l[1]["action"], "start");
    EXPECT_EQ(l[1]["parent"], l[0]["id"]);
    EXPECT_EQ(l[4]["action"], "start");
    EXPECT_EQ(l[4]["parent"], 0);
}

} // namespace chunkcache
