#include "chunkcache/store/pathlocks.hh"
#include "chunkcache/util/file-system.hh"

#include <gtest/gtest.h>

#include <chrono>

#include <sys/wait.h>
#include <unistd.h>

namespace chunkcache {

using namespace std::chrono_literals;

/**
 * Another cache client: a child process that takes the write lock on a
 * lock file, holds it for a while and exits. The constructor returns
 * once the lock is held.
 */
class OtherClient
{
    pid_t pid;

public:
    OtherClient(const Path & lockPath, unsigned int holdSeconds)
    {
        Pipe ready;
        ready.create();

        pid = fork();
        if (pid == -1)
            throw SysError("forking lock holder");
        if (pid == 0) {
            auto fd = openLockFile(lockPath, true);
            lockFile(fd.get(), ltWrite, true);
            ready.readSide.close();
            writeFull(ready.writeSide.get(), "x", false);
            sleep(holdSeconds);
            _exit(0);
        }

        ready.writeSide.close();
        char c;
        if (read(ready.readSide.get(), &c, 1) != 1)
            throw Error("lock holder died before taking the lock");
    }

    ~OtherClient()
    {
        int status;
        waitpid(pid, &status, 0);
    }
};

class LockTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> cleanup;

protected:
    Path lockPath;

    void SetUp() override
    {
        auto dir = createTempDir();
        cleanup = std::make_unique<AutoDelete>(dir, true);
        lockPath = dir + "/wiki.lock";
    }
};

TEST_F(LockTest, uncontendedLockIsImmediate)
{
    auto fd = openLockFile(lockPath, true);
    ASSERT_TRUE(fd);
    EXPECT_TRUE(lockFileWithTimeout(fd.get(), ltWrite, 5));
}

TEST_F(LockTest, zeroTimeoutBlocks)
{
    auto fd = openLockFile(lockPath, true);
    EXPECT_TRUE(lockFileWithTimeout(fd.get(), ltWrite, 0));
}

TEST_F(LockTest, sharedLocksCoexist)
{
    auto a = openLockFile(lockPath, true);
    auto b = openLockFile(lockPath, true);
    EXPECT_TRUE(lockFileWithTimeout(a.get(), ltRead, 1));
    EXPECT_TRUE(lockFileWithTimeout(b.get(), ltRead, 1));
    EXPECT_FALSE(lockFile(openLockFile(lockPath, true).get(), ltWrite, false));
}

TEST_F(LockTest, missingFileWithoutCreate)
{
    EXPECT_FALSE(openLockFile(lockPath, false));
    EXPECT_FALSE(pathExists(lockPath));
}

TEST_F(LockTest, contendedLockGivesUpAfterTimeout)
{
    OtherClient other(lockPath, 3);

    auto fd = openLockFile(lockPath, true);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(lockFileWithTimeout(fd.get(), ltWrite, 1));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 900ms);
}

TEST_F(LockTest, waiterGetsLockWhenHolderExits)
{
    OtherClient other(lockPath, 1);

    auto fd = openLockFile(lockPath, true);
    EXPECT_TRUE(lockFileWithTimeout(fd.get(), ltWrite, 10));
}

TEST_F(LockTest, pathLockTimeoutThrows)
{
    OtherClient other(lockPath, 3);

    ASSERT_THROW(PathLock(lockPath, 1, "wiki"), LockTimeout);
}

TEST_F(LockTest, pathLockIsScoped)
{
    {
        PathLock lock(lockPath, 1, "wiki");
        EXPECT_EQ(lock.lockPath(), lockPath);
        EXPECT_FALSE(lockFile(openLockFile(lockPath, true).get(), ltWrite, false));
    }

    EXPECT_TRUE(lockFile(openLockFile(lockPath, true).get(), ltWrite, false));
    EXPECT_TRUE(pathExists(lockPath));
}

} // namespace chunkcache
