#include "chunkcache/util/backpressure-sink.hh"
#include "chunkcache/util/file-descriptor.hh"
#include "chunkcache/util/file-system.hh"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

namespace chunkcache {

class AsyncFdSinkTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    Path tmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
    }

    AutoCloseFD openOutput(const Path & path)
    {
        AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (!fd)
            throw SysError("opening '%s'", path);
        return fd;
    }
};

TEST_F(AsyncFdSinkTest, writesInOrder)
{
    auto path = tmpDir + "/out";
    auto fd = openOutput(path);

    std::string expected;
    {
        AsyncFdSink sink(fd.get(), 100);
        for (int i = 0; i < 1000; ++i) {
            auto s = std::to_string(i) + ",";
            sink.waitReady();
            sink(s);
            expected += s;
        }
        sink.finish();
        EXPECT_EQ(sink.bytesWritten(), expected.size());
        EXPECT_TRUE(sink.good());
    }
    fd.close();

    EXPECT_EQ(readFile(path), expected);
}

TEST_F(AsyncFdSinkTest, queueStaysBounded)
{
    Pipe pipe;
    pipe.create();

    std::string received;
    std::thread reader([&]() {
        char buf[512];
        while (true) {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            auto n = read(pipe.readSide.get(), buf, sizeof(buf));
            if (n <= 0)
                break;
            received.append(buf, n);
        }
    });

    {
        AsyncFdSink sink(pipe.writeSide.get(), 3000);
        for (int i = 0; i < 200; ++i) {
            sink.waitReady();
            sink(std::string(1000, 'a' + i % 26));
        }
        sink.finish();
        EXPECT_LE(sink.highWaterMark(), 3000);
        EXPECT_GE(sink.highWaterMark(), 1000);
    }
    pipe.writeSide.close();
    reader.join();

    EXPECT_EQ(received.size(), 200 * 1000);
}

TEST_F(AsyncFdSinkTest, oversizedPieceIsAcceptedWhenIdle)
{
    auto path = tmpDir + "/out";
    auto fd = openOutput(path);

    AsyncFdSink sink(fd.get(), 10);
    sink(std::string(100, 'x'));
    sink.finish();

    EXPECT_EQ(sink.highWaterMark(), 100);
    EXPECT_EQ(readFile(path).size(), 100);
}

TEST_F(AsyncFdSinkTest, writeErrorsAreReported)
{
    AutoCloseFD fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    ASSERT_TRUE(fd);

    AsyncFdSink sink(fd.get(), 100);
    sink("data");
    ASSERT_THROW(sink.finish(), SysError);
    EXPECT_FALSE(sink.good());
}

TEST_F(AsyncFdSinkTest, errorSurfacesInWaitReady)
{
    AutoCloseFD fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    ASSERT_TRUE(fd);

    AsyncFdSink sink(fd.get(), 1);
    sink("data");
    // The queue cannot drain, so this only returns by throwing.
    ASSERT_THROW(sink.waitReady(), SysError);
}

TEST_F(AsyncFdSinkTest, emptyQueueIsRejected)
{
    ASSERT_THROW(AsyncFdSink(0, 0), Error);
}

TEST_F(AsyncFdSinkTest, abandonedSinkShutsDown)
{
    auto fd = openOutput(tmpDir + "/out");
    AsyncFdSink sink(fd.get(), 1 << 20);
    sink("unfinished");
}

} // namespace chunkcache
