#include <gtest/gtest.h>

#include "chunkcache/store/chunk-store.hh"
#include "chunkcache/store/globals.hh"
#include "chunkcache/store/memory-chunk-store.hh"
#include "chunkcache/store/sqlite-chunk-store.hh"
#include "chunkcache/util/error.hh"
#include "chunkcache/util/file-system.hh"

#include <thread>

namespace chunkcache {

using namespace std::chrono_literals;

class ChunkStoreTest : public ::testing::TestWithParam<std::string>
{
    AutoDelete delTmpDir;

protected:
    Path tmpDir;
    std::shared_ptr<ChunkStore> store;

    void SetUp() override
    {
        initLibStore(false);
        tmpDir = createTempDir();
        delTmpDir.reset(tmpDir, true);
        store = openStore();
    }

    ref<ChunkStore> openStore()
    {
        if (GetParam() == "sqlite")
            return openChunkStore("sqlite://" + tmpDir + "/chunks.sqlite");
        return openChunkStore("memory://");
    }

    void putChunks(std::string_view name, const Strings & payloads, bool finalize = true)
    {
        uint64_t i = 0;
        for (auto & p : payloads)
            store->insertChunk(name, i++, p, totalChunksUnknown, p.size(), "none");
        if (finalize)
            store->finalizeTotalChunks(name, payloads.size());
    }
};

TEST_P(ChunkStoreTest, missingArtifactHasNoMetadata)
{
    ASSERT_FALSE(store->getMetadata("nope"));
    ASSERT_TRUE(store->getChunkHeaders("nope").empty());
    ASSERT_FALSE(store->getChunk("nope", 0));
}

TEST_P(ChunkStoreTest, unfinishedUploadIsIncomplete)
{
    putChunks("a", {"xx", "yyy"}, false);

    auto md = store->getMetadata("a");
    ASSERT_TRUE(md);
    EXPECT_EQ(md->chunksPresent, 2);
    EXPECT_EQ(md->totalChunks, totalChunksUnknown);
    EXPECT_FALSE(md->isComplete());
}

TEST_P(ChunkStoreTest, finalizedUploadIsComplete)
{
    putChunks("a", {"xx", "yyy", ""});

    auto md = store->getMetadata("a");
    ASSERT_TRUE(md);
    EXPECT_EQ(md->chunksPresent, 3);
    EXPECT_EQ(md->totalChunks, 3);
    EXPECT_EQ(md->totalSize, 5);
    EXPECT_EQ(md->artifactSize, 5);
    EXPECT_TRUE(md->isComplete());
    EXPECT_GT(md->updatedAt, 0);
}

TEST_P(ChunkStoreTest, chunksComeBackInIndexOrder)
{
    store->insertChunk("a", 2, "c", totalChunksUnknown, 1, "none");
    store->insertChunk("a", 0, "a", totalChunksUnknown, 1, "none");
    store->insertChunk("a", 1, "b", totalChunksUnknown, 1, "none");
    store->finalizeTotalChunks("a", 3);

    auto chunks = store->getChunksOrdered("a");
    ASSERT_EQ(chunks.size(), 3);
    for (uint64_t i = 0; i < 3; ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].totalChunks, 3);
        EXPECT_EQ(chunks[i].data, std::string(1, 'a' + i));
    }

    auto headers = store->getChunkHeaders("a");
    ASSERT_EQ(headers.size(), 3);
    EXPECT_EQ(headers[2].index, 2);
    EXPECT_EQ(headers[2].compressedSize, 1);
    EXPECT_EQ(headers[2].compression, "none");
}

TEST_P(ChunkStoreTest, insertOverwritesTheSameIndex)
{
    putChunks("a", {"old"});
    store->insertChunk("a", 0, "new!", totalChunksUnknown, 4, "none");

    auto chunk = store->getChunk("a", 0);
    ASSERT_TRUE(chunk);
    EXPECT_EQ(chunk->data, "new!");
    EXPECT_EQ(chunk->rawSize, 4);
    EXPECT_EQ(store->getChunksOrdered("a").size(), 1);
}

TEST_P(ChunkStoreTest, emptyPayloadIsStored)
{
    putChunks("empty", {""});

    auto chunk = store->getChunk("empty", 0);
    ASSERT_TRUE(chunk);
    EXPECT_EQ(chunk->data, "");
    EXPECT_EQ(chunk->compressedSize, 0);
    EXPECT_TRUE(store->getMetadata("empty")->isComplete());
}

TEST_P(ChunkStoreTest, binaryPayloadSurvives)
{
    std::string payload("\0\1\2\xff\0", 5);
    store->insertChunk("bin", 0, payload, totalChunksUnknown, 5, "none");

    EXPECT_EQ(store->getChunk("bin", 0)->data, payload);
}

TEST_P(ChunkStoreTest, deleteAllOnlyAffectsOneName)
{
    putChunks("a", {"1", "2"});
    putChunks("b", {"3"});

    store->deleteAll("a");
    store->deleteAll("never-existed");

    EXPECT_FALSE(store->getMetadata("a"));
    EXPECT_TRUE(store->getMetadata("b"));
}

TEST_P(ChunkStoreTest, listArtifacts)
{
    putChunks("b", {"3"});
    putChunks("a", {"1", "2"}, false);

    auto list = store->listArtifacts();
    ASSERT_EQ(list.size(), 2);
    EXPECT_EQ(list[0].name, "a");
    EXPECT_FALSE(list[0].isComplete());
    EXPECT_EQ(list[1].name, "b");
    EXPECT_TRUE(list[1].isComplete());
}

TEST_P(ChunkStoreTest, leaseIsExclusive)
{
    EXPECT_TRUE(store->acquireLease("a", "host:1", 60s));
    EXPECT_FALSE(store->acquireLease("a", "host:2", 60s));
    // Renewal by the holder.
    EXPECT_TRUE(store->acquireLease("a", "host:1", 60s));
    // Leases are per name.
    EXPECT_TRUE(store->acquireLease("b", "host:2", 60s));

    store->releaseLease("a", "host:2");
    EXPECT_FALSE(store->acquireLease("a", "host:2", 60s));

    store->releaseLease("a", "host:1");
    EXPECT_TRUE(store->acquireLease("a", "host:2", 60s));
}

TEST_P(ChunkStoreTest, expiredLeaseCanBeTakenOver)
{
    EXPECT_TRUE(store->acquireLease("a", "host:1", 0s));
    EXPECT_TRUE(store->acquireLease("a", "host:2", 60s));
    EXPECT_FALSE(store->acquireLease("a", "host:1", 60s));
}

TEST_P(ChunkStoreTest, concurrentInsertsOfDistinctChunks)
{
    std::vector<std::thread> threads;
    for (uint64_t t = 0; t < 4; ++t)
        threads.emplace_back([&, t]() {
            for (uint64_t i = t; i < 40; i += 4)
                store->insertChunk("c", i, std::to_string(i), totalChunksUnknown, std::to_string(i).size(), "none");
        });
    for (auto & t : threads)
        t.join();
    store->finalizeTotalChunks("c", 40);

    auto md = store->getMetadata("c");
    ASSERT_TRUE(md);
    EXPECT_EQ(md->chunksPresent, 40);
    EXPECT_TRUE(md->isComplete());
}

INSTANTIATE_TEST_SUITE_P(Backends, ChunkStoreTest, ::testing::Values("memory", "sqlite"));

TEST(ChunkStoreSQLite, dataSurvivesReopening)
{
    initLibStore(false);
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);
    auto uri = "sqlite://" + tmpDir + "/chunks.sqlite";

    {
        auto store = openChunkStore(uri);
        store->insertChunk("a", 0, "payload", totalChunksUnknown, 7, "none");
        store->finalizeTotalChunks("a", 1);
    }

    auto store = openChunkStore(uri);
    EXPECT_EQ(store->getUri(), uri);
    EXPECT_TRUE(store->getMetadata("a")->isComplete());
    EXPECT_EQ(store->getChunk("a", 0)->data, "payload");
}

TEST(ChunkStoreSQLite, twoConnectionsShareLeases)
{
    initLibStore(false);
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);
    auto uri = "sqlite://" + tmpDir + "/chunks.sqlite";

    auto a = openChunkStore(uri);
    auto b = openChunkStore(uri);

    EXPECT_TRUE(a->acquireLease("x", "a", 60s));
    EXPECT_FALSE(b->acquireLease("x", "b", 60s));
    a->releaseLease("x", "a");
    EXPECT_TRUE(b->acquireLease("x", "b", 60s));
}

TEST(openChunkStore, rejectsUnknownScheme)
{
    ASSERT_THROW(openChunkStore("postgres://localhost/db"), UsageError);
    ASSERT_THROW(openChunkStore("chunks.sqlite"), UsageError);
}

TEST(metadataFromHeaders, disagreeingTotalsAreUnknown)
{
    std::vector<ChunkHeader> headers{
        {.name = "a", .index = 0, .totalChunks = 2, .compressedSize = 1, .rawSize = 3, .compression = "br", .createdAt = 10},
        {.name = "a", .index = 1, .totalChunks = 3, .compressedSize = 1, .rawSize = 3, .compression = "br", .createdAt = 20},
    };

    auto md = metadataFromHeaders("a", headers);
    ASSERT_TRUE(md);
    EXPECT_EQ(md->totalChunks, totalChunksUnknown);
    EXPECT_EQ(md->updatedAt, 20);
    EXPECT_EQ(md->artifactSize, 6);
    EXPECT_FALSE(md->isComplete());

    EXPECT_FALSE(metadataFromHeaders("a", {}));
}

} // namespace chunkcache
