#include <gtest/gtest.h>

#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/chunk-restorer.hh"
#include "chunkcache/store/chunk-writer.hh"
#include "chunkcache/store/integrity-validator.hh"
#include "chunkcache/store/tests/artifacts.hh"
#include "chunkcache/store/tests/faulty-chunk-store.hh"
#include "chunkcache/store/tests/libstore.hh"
#include "chunkcache/util/backpressure-sink.hh"
#include "chunkcache/util/compression.hh"
#include "chunkcache/util/serialise.hh"

namespace chunkcache {

static constexpr uint64_t W = 4096;

class ChunkRestorerTest : public LibStoreTest
{
protected:
    AcceptAllValidator acceptAll;

    ChunkWriterParams writerParams(uint64_t chunkSize = W)
    {
        ChunkWriterParams p;
        p.chunkSize = chunkSize;
        p.compression = "br";
        p.storeRetries = 2;
        p.leaseHolder = "test:1";
        return p;
    }

    ChunkRestorerParams restorerParams(uint64_t chunkSize = W)
    {
        ChunkRestorerParams p;
        p.storeRetries = 2;
        p.reclaimInterval = 3;
        p.bufferSize = 2 * chunkSize;
        return p;
    }

    void upload(std::string_view name, const std::string & data, uint64_t chunkSize = W)
    {
        ChunkWriter writer(store, acceptAll, writerParams(chunkSize));
        StringSource source(data);
        writer.writeFrom(name, source, data.size());
    }
};

class ChunkRestorerSizeTest : public ChunkRestorerTest, public ::testing::WithParamInterface<uint64_t>
{};

TEST_P(ChunkRestorerSizeTest, restoresByteIdentical)
{
    auto data = makeNoise(GetParam(), 42);
    upload("a", data);

    auto dest = tmpDir + "/out/a";
    ChunkRestorer restorer(store, acceptAll, restorerParams());
    auto res = restorer.restore("a", dest);

    EXPECT_EQ(res.status, RestoreStatus::Restored);
    EXPECT_EQ(res.bytes, data.size());
    EXPECT_EQ(res.chunks, std::max<uint64_t>(1, (data.size() + W - 1) / W));
    EXPECT_EQ(readFile(dest), data);
}

INSTANTIATE_TEST_SUITE_P(
    Sizes, ChunkRestorerSizeTest, ::testing::Values(0, 1, W - 1, W, W + 1, 10 * W));

TEST_F(ChunkRestorerTest, missingArtifactIsNotCached)
{
    ChunkRestorer restorer(store, acceptAll, restorerParams());
    auto dest = tmpDir + "/a";
    EXPECT_EQ(restorer.restore("a", dest).status, RestoreStatus::NotCached);
    EXPECT_FALSE(pathExists(dest));
}

TEST_F(ChunkRestorerTest, unfinishedUploadIsIncomplete)
{
    for (uint64_t i = 0; i < 3; ++i)
        store->insertChunk("a", i, compress("br", "x"), totalChunksUnknown, 1, "br");

    ChunkRestorer restorer(store, acceptAll, restorerParams());
    auto dest = tmpDir + "/a";
    EXPECT_EQ(restorer.restore("a", dest).status, RestoreStatus::Incomplete);
    EXPECT_FALSE(pathExists(dest));
}

TEST_F(ChunkRestorerTest, twoOfThreeChunksIsIncomplete)
{
    upload("a", makeNoise(3 * W - 10));
    for (auto & c : store->getChunksOrdered("a"))
        if (c.index != 1)
            store->insertChunk("b", c.index, c.data, 3, c.rawSize, c.compression);

    ChunkRestorer restorer(store, acceptAll, restorerParams());
    auto dest = tmpDir + "/b";
    EXPECT_EQ(restorer.restore("b", dest).status, RestoreStatus::Incomplete);
    EXPECT_EQ(restorer.verify("b").status, RestoreStatus::Incomplete);
    EXPECT_FALSE(pathExists(dest));
}

TEST_F(ChunkRestorerTest, wrongRawSizeIsDetected)
{
    store->insertChunk("a", 0, compress("br", "hello"), totalChunksUnknown, 6, "br");
    store->finalizeTotalChunks("a", 1);

    ChunkRestorer restorer(store, acceptAll, restorerParams());
    auto dest = tmpDir + "/a";
    ASSERT_THROW(restorer.restore("a", dest), SizeMismatchError);
    ASSERT_THROW(restorer.verify("a"), SizeMismatchError);
    EXPECT_FALSE(pathExists(dest));
}

TEST_F(ChunkRestorerTest, corruptPayloadIsDetected)
{
    auto compressed = compress("br", makeNoise(1000));
    store->insertChunk("a", 0, compressed.substr(0, compressed.size() / 2), totalChunksUnknown, 1000, "br");
    store->finalizeTotalChunks("a", 1);

    ChunkRestorer restorer(store, acceptAll, restorerParams());
    ASSERT_THROW(restorer.restore("a", tmpDir + "/a"), CompressionError);
}

TEST_F(ChunkRestorerTest, failedRestoreKeepsExistingFile)
{
    auto dest = tmpDir + "/a";
    writeFile(dest, "previous contents");

    upload("a", makeNoise(2 * W));
    RejectAllValidator rejectAll;
    ChunkRestorer restorer(store, rejectAll, restorerParams());
    ASSERT_THROW(restorer.restore("a", dest), CorruptArtifactError);

    EXPECT_EQ(rejectAll.calls, 1);
    EXPECT_EQ(readFile(dest), "previous contents");
}

TEST_F(ChunkRestorerTest, restoreReplacesExistingFile)
{
    auto dest = tmpDir + "/a";
    writeFile(dest, "previous contents");

    auto data = makeNoise(2 * W + 3);
    upload("a", data);
    ChunkRestorer restorer(store, acceptAll, restorerParams());
    restorer.restore("a", dest);

    EXPECT_EQ(readFile(dest), data);
}

TEST_F(ChunkRestorerTest, memoryStaysBounded)
{
    auto data = makeNoise(50 * W, 3);
    upload("a", data);

    ChunkRestorer restorer(store, acceptAll, restorerParams());
    auto res = restorer.restore("a", tmpDir + "/a");

    EXPECT_EQ(res.chunks, 50);
    EXPECT_GT(res.peakQueued, 0);
    EXPECT_LE(res.peakQueued, 2 * W);
}

TEST_F(ChunkRestorerTest, transientFetchFailuresAreRetried)
{
    auto data = makeNoise(3 * W);
    upload("a", data);

    auto faulty = make_ref<FaultyChunkStore>(store);
    faulty->failGets = 1;

    ChunkRestorer restorer(faulty, acceptAll, restorerParams());
    auto dest = tmpDir + "/a";
    restorer.restore("a", dest);
    EXPECT_EQ(readFile(dest), data);
}

TEST_F(ChunkRestorerTest, verifyDoesNotWrite)
{
    upload("a", makeNoise(3 * W + 1));

    ChunkRestorer restorer(store, acceptAll, restorerParams());
    auto res = restorer.verify("a");
    EXPECT_EQ(res.status, RestoreStatus::Restored);
    EXPECT_EQ(res.chunks, 4);
    EXPECT_EQ(res.bytes, 3 * W + 1);
}

/* A 25 MiB database cut into 10 MiB windows, scaled down. */
TEST_F(ChunkRestorerTest, databaseRoundTrip)
{
    auto src = tmpDir + "/src.sqlite";
    makeSampleArtifact(src, 200, "wikipedia_articles", 500);
    auto original = readFile(src);
    auto chunkSize = original.size() * 2 / 5 + 1;

    SQLiteArtifactValidator validator("wikipedia_articles", 1);

    ChunkWriter writer(store, validator, writerParams(chunkSize));
    auto written = writer.write("wiki", src);
    EXPECT_EQ(written.chunks, 3);

    auto dest = tmpDir + "/restored.sqlite";
    ChunkRestorer restorer(store, validator, restorerParams(chunkSize));
    auto res = restorer.restore("wiki", dest);

    EXPECT_EQ(res.status, RestoreStatus::Restored);
    EXPECT_EQ(res.chunks, 3);
    EXPECT_EQ(readFile(dest), original);
}

namespace {

struct VectorChunkSource : ChunkSource
{
    std::vector<Chunk> chunks;
    size_t pos = 0;

    std::optional<Chunk> next() override
    {
        if (pos == chunks.size())
            return std::nullopt;
        return chunks[pos++];
    }
};

struct CheckingSink : BackpressureSink
{
    std::string data;
    unsigned int waits = 0;

    void operator()(std::string_view s) override
    {
        data.append(s);
    }

    void waitReady() override
    {
        waits++;
    }

    void finish() override {}
};

Chunk makeChunk(uint64_t index, const std::string & raw)
{
    Chunk c;
    c.name = "s";
    c.index = index;
    c.totalChunks = 2;
    c.data = compress("br", raw);
    c.compressedSize = c.data.size();
    c.rawSize = raw.size();
    c.compression = "br";
    c.createdAt = 0;
    return c;
}

} // namespace

TEST_F(ChunkRestorerTest, streamWaitsBeforeEveryChunk)
{
    VectorChunkSource source;
    source.chunks = {makeChunk(0, "abc"), makeChunk(1, "def")};
    CheckingSink sink;

    ChunkRestorer restorer(store, acceptAll, restorerParams());
    EXPECT_EQ(restorer.streamChunks("s", source, sink, 6), 6);
    EXPECT_EQ(sink.data, "abcdef");
    EXPECT_EQ(sink.waits, 3);
}

TEST_F(ChunkRestorerTest, streamRejectsOutOfOrderChunks)
{
    VectorChunkSource source;
    source.chunks = {makeChunk(1, "def"), makeChunk(0, "abc")};
    CheckingSink sink;

    ChunkRestorer restorer(store, acceptAll, restorerParams());
    ASSERT_THROW(restorer.streamChunks("s", source, sink, 6), IncompleteCacheError);
}

} // namespace chunkcache
