#include <gtest/gtest.h>

#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/chunk-writer.hh"
#include "chunkcache/store/tests/artifacts.hh"
#include "chunkcache/store/tests/faulty-chunk-store.hh"
#include "chunkcache/store/tests/libstore.hh"
#include "chunkcache/util/compression.hh"
#include "chunkcache/util/serialise.hh"

namespace chunkcache {

using namespace std::chrono_literals;

class ChunkWriterTest : public LibStoreTest
{
protected:
    AcceptAllValidator acceptAll;

    ChunkWriterParams params()
    {
        ChunkWriterParams p;
        p.chunkSize = 1000;
        p.compression = "br";
        p.storeRetries = 2;
        p.leaseHolder = "test:1";
        return p;
    }

    ChunkWriter::Result writeString(ref<ChunkStore> s, std::string_view name, const std::string & data)
    {
        ChunkWriter writer(s, acceptAll, params());
        StringSource source(data);
        return writer.writeFrom(name, source, data.size());
    }
};

TEST_F(ChunkWriterTest, splitsIntoWindows)
{
    auto data = makeNoise(2500);
    auto res = writeString(store, "a", data);

    EXPECT_EQ(res.chunks, 3);
    EXPECT_EQ(res.rawBytes, 2500);

    auto chunks = store->getChunksOrdered("a");
    ASSERT_EQ(chunks.size(), 3);
    EXPECT_EQ(chunks[0].rawSize, 1000);
    EXPECT_EQ(chunks[1].rawSize, 1000);
    EXPECT_EQ(chunks[2].rawSize, 500);

    std::string joined;
    for (auto & c : chunks) {
        EXPECT_EQ(c.totalChunks, 3);
        EXPECT_EQ(c.compression, "br");
        // Every chunk decompresses on its own.
        joined += decompress(c.compression, c.data);
    }
    EXPECT_EQ(joined, data);
}

TEST_F(ChunkWriterTest, exactMultipleHasNoEmptyTail)
{
    auto res = writeString(store, "a", makeNoise(2000));
    EXPECT_EQ(res.chunks, 2);
    EXPECT_EQ(store->getMetadata("a")->totalChunks, 2);
}

TEST_F(ChunkWriterTest, emptyArtifactIsOneEmptyChunk)
{
    auto res = writeString(store, "empty", "");
    EXPECT_EQ(res.chunks, 1);

    auto md = store->getMetadata("empty");
    ASSERT_TRUE(md);
    EXPECT_TRUE(md->isComplete());
    EXPECT_EQ(md->artifactSize, 0);
}

TEST_F(ChunkWriterTest, rewriteReplacesOldChunks)
{
    writeString(store, "a", makeNoise(5000));
    ASSERT_EQ(store->getMetadata("a")->chunksPresent, 5);

    writeString(store, "a", makeNoise(1500, 7));

    auto md = store->getMetadata("a");
    EXPECT_EQ(md->chunksPresent, 2);
    EXPECT_EQ(md->totalChunks, 2);
    EXPECT_EQ(md->artifactSize, 1500);
}

TEST_F(ChunkWriterTest, shortSourceFails)
{
    ChunkWriter writer(store, acceptAll, params());
    auto data = makeNoise(1500);
    StringSource source(data);

    ASSERT_THROW(writer.writeFrom("a", source, 3000), ShortReadError);

    // The partial upload is never finalized.
    auto md = store->getMetadata("a");
    ASSERT_TRUE(md);
    EXPECT_FALSE(md->isComplete());
}

TEST_F(ChunkWriterTest, transientInsertFailuresAreRetried)
{
    auto faulty = make_ref<FaultyChunkStore>(store);
    faulty->failInserts = 1;

    auto res = writeString(faulty, "a", makeNoise(2500));
    EXPECT_EQ(res.chunks, 3);
    EXPECT_TRUE(store->getMetadata("a")->isComplete());
}

TEST_F(ChunkWriterTest, persistentInsertFailureLeavesIncompleteSet)
{
    auto faulty = make_ref<FaultyChunkStore>(store);
    faulty->failInsertIndex = 1;

    ASSERT_THROW(writeString(faulty, "a", makeNoise(2500)), TransientStoreError);

    auto md = store->getMetadata("a");
    ASSERT_TRUE(md);
    EXPECT_EQ(md->chunksPresent, 1);
    EXPECT_FALSE(md->isComplete());
}

TEST_F(ChunkWriterTest, writeUploadsAFile)
{
    auto path = tmpDir + "/a.sqlite";
    makeSampleArtifact(path, 50);

    ChunkWriter writer(store, acceptAll, params());
    auto res = writer.write("a", path);

    auto size = readFile(path).size();
    EXPECT_EQ(res.rawBytes, size);
    EXPECT_EQ(res.chunks, (size + 999) / 1000);
    EXPECT_TRUE(store->getMetadata("a")->isComplete());

    // The lease is released afterwards.
    EXPECT_TRUE(store->acquireLease("a", "someone-else", 60s));
}

TEST_F(ChunkWriterTest, writeRefusesInvalidArtifact)
{
    auto path = tmpDir + "/bad";
    writeFile(path, "not a database");

    RejectAllValidator rejectAll;
    ChunkWriter writer(store, rejectAll, params());
    ASSERT_THROW(writer.write("a", path), CorruptArtifactError);
    EXPECT_FALSE(store->getMetadata("a"));
}

TEST_F(ChunkWriterTest, writeRespectsForeignLease)
{
    auto path = tmpDir + "/a";
    writeFile(path, "data");
    ASSERT_TRUE(store->acquireLease("a", "other:2", 60s));

    ChunkWriter writer(store, acceptAll, params());
    ASSERT_THROW(writer.write("a", path), LeaseUnavailable);
    EXPECT_FALSE(store->getMetadata("a"));
}

TEST_F(ChunkWriterTest, rejectsBadParams)
{
    auto p = params();
    p.chunkSize = 0;
    ASSERT_THROW(ChunkWriter writer(store, acceptAll, p), UsageError);

    p = params();
    p.compression = "lzma9000";
    ASSERT_THROW(ChunkWriter writer(store, acceptAll, p), UnknownCompressionMethod);
}

TEST_F(ChunkWriterTest, noneCompressionStoresRawBytes)
{
    auto p = params();
    p.compression = "none";
    ChunkWriter writer(store, acceptAll, p);
    std::string data = "hello";
    StringSource source(data);
    writer.writeFrom("a", source, data.size());

    auto chunk = store->getChunk("a", 0);
    ASSERT_TRUE(chunk);
    EXPECT_EQ(chunk->data, "hello");
    EXPECT_EQ(chunk->compression, "none");
}

} // namespace chunkcache
