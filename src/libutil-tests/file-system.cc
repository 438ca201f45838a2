#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/util.hh"

#include <gtest/gtest.h>

#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chunkcache {

/* ----------------------------------------------------------------------------
 * absPath
 * --------------------------------------------------------------------------*/

TEST(absPath, doesntChangeRoot)
{
    ASSERT_EQ(absPath("/"), "/");
}

TEST(absPath, turnsEmptyPathIntoCWD)
{
    char cwd[PATH_MAX + 1];
    ASSERT_NE(getcwd(cwd, PATH_MAX), nullptr);

    ASSERT_EQ(absPath(""), cwd);
}

TEST(absPath, usesOptionalBasePathWhenGiven)
{
    ASSERT_EQ(absPath("artifacts", "/var/lib/chunkcache"), "/var/lib/chunkcache/artifacts");
}

TEST(absPath, pathIsCanonicalised)
{
    auto p1 = absPath("/some/path/with/trailing/dot/.");
    auto p2 = absPath(p1);

    ASSERT_EQ(p1, "/some/path/with/trailing/dot");
    ASSERT_EQ(p1, p2);
}

/* ----------------------------------------------------------------------------
 * canonPath
 * --------------------------------------------------------------------------*/

TEST(canonPath, removesTrailingSlashes)
{
    ASSERT_EQ(canonPath("/this/is/a/path//"), "/this/is/a/path");
}

TEST(canonPath, removesDots)
{
    ASSERT_EQ(canonPath("/this/./is/a/path/./"), "/this/is/a/path");
    ASSERT_EQ(canonPath("/this/a/../is/a////path/foo/.."), "/this/is/a/path");
}

TEST(canonPath, requiresAbsolutePath)
{
    ASSERT_THROW(canonPath("."), Error);
    ASSERT_THROW(canonPath("../"), Error);
    ASSERT_THROW(canonPath(""), Error);
}

/* ----------------------------------------------------------------------------
 * dirOf / baseNameOf
 * --------------------------------------------------------------------------*/

TEST(dirOf, returnsFirstPathComponent)
{
    ASSERT_EQ(dirOf("/"), "/");
    ASSERT_EQ(dirOf("/dir/"), "/dir");
    ASSERT_EQ(dirOf("/dir"), "/");
    ASSERT_EQ(dirOf("relative"), ".");
}

TEST(baseNameOf, misc)
{
    ASSERT_EQ(baseNameOf(""), "");
    ASSERT_EQ(baseNameOf("/dir"), "dir");
    ASSERT_EQ(baseNameOf("dir/"), "dir");
    ASSERT_EQ(baseNameOf("/var/lib/chunkcache/wiki.lock"), "wiki.lock");
}

/* ----------------------------------------------------------------------------
 * files
 * --------------------------------------------------------------------------*/

class FileSystemTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    Path tmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
    }
};

TEST_F(FileSystemTest, writeAndReadBack)
{
    auto path = tmpDir + "/file";
    std::string contents("with\0nul", 8);
    writeFile(path, contents, 0600, FsSync::Yes);

    ASSERT_EQ(readFile(path), contents);
    ASSERT_EQ(stat(path).st_mode & 0777, 0600);
}

TEST_F(FileSystemTest, readMissingFileThrows)
{
    ASSERT_THROW(readFile(tmpDir + "/nope"), SysError);
    ASSERT_FALSE(maybeStat(tmpDir + "/nope"));
    ASSERT_FALSE(pathExists(tmpDir + "/nope"));
}

TEST_F(FileSystemTest, createDirsAndDelete)
{
    auto dir = tmpDir + "/a/b/c";
    createDirs(dir);
    writeFile(dir + "/f", "x");
    ASSERT_TRUE(S_ISDIR(stat(dir).st_mode));

    deletePath(tmpDir + "/a");
    ASSERT_FALSE(pathExists(tmpDir + "/a"));
    // Deleting something that is not there is fine.
    deletePath(tmpDir + "/a");
}

TEST_F(FileSystemTest, moveFileReplacesTarget)
{
    writeFile(tmpDir + "/old", "old");
    writeFile(tmpDir + "/new", "new");
    moveFile(tmpDir + "/new", tmpDir + "/old");

    ASSERT_EQ(readFile(tmpDir + "/old"), "new");
    ASSERT_FALSE(pathExists(tmpDir + "/new"));
}

TEST_F(FileSystemTest, setWriteTime)
{
    auto path = tmpDir + "/file";
    writeFile(path, "x");
    setWriteTime(path, 1000000000);

    ASSERT_EQ(stat(path).st_mtime, 1000000000);
}

TEST_F(FileSystemTest, makeTempPathIsUniqueAndBesideRoot)
{
    auto root = tmpDir + "/wiki";
    auto p1 = makeTempPath(root, ".restore");
    auto p2 = makeTempPath(root, ".restore");

    ASSERT_NE(p1, p2);
    ASSERT_TRUE(hasPrefix(p1, root + ".restore-"));
    ASSERT_EQ(dirOf(p1), tmpDir);
}

TEST_F(FileSystemTest, autoDeleteCanBeCancelled)
{
    auto kept = tmpDir + "/kept";
    auto gone = tmpDir + "/gone";
    writeFile(kept, "");
    writeFile(gone, "");
    {
        AutoDelete a(kept, false);
        AutoDelete b(gone, false);
        a.cancel();
    }
    ASSERT_TRUE(pathExists(kept));
    ASSERT_FALSE(pathExists(gone));
}

} // namespace chunkcache
