#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/cache-orchestrator.hh"
#include "chunkcache/store/integrity-validator.hh"
#include "chunkcache/store/pathlocks.hh"
#include "chunkcache/store/tests/artifacts.hh"
#include "chunkcache/store/tests/faulty-chunk-store.hh"
#include "chunkcache/store/tests/libstore.hh"
#include "chunkcache/util/serialise.hh"

#include <stdexcept>

#include <sys/stat.h>

namespace chunkcache {

using namespace std::chrono_literals;
using ::testing::ElementsAre;

namespace {

constexpr auto CheckLocal = CacheState::CheckLocal;
constexpr auto CheckCache = CacheState::CheckCache;
constexpr auto Restore = CacheState::Restore;
constexpr auto Invalidate = CacheState::Invalidate;
constexpr auto Rebuild = CacheState::Rebuild;
constexpr auto CacheWrite = CacheState::CacheWrite;
constexpr auto Ready = CacheState::Ready;
constexpr auto Degraded = CacheState::Degraded;

} // namespace

class CacheOrchestratorTest : public LibStoreTest
{
protected:
    SQLiteArtifactValidator validator{"wikipedia_articles", 1};
    unsigned int rebuilds = 0;
    bool rebuildFails = false;

    OrchestratorParams params()
    {
        OrchestratorParams p;
        p.artifactDir = tmpDir + "/artifacts";
        p.maxAge = 3600s;
        p.lockTimeout = 1;
        p.storeRetries = 2;
        p.validateLocal = false;
        p.writer.chunkSize = 4096;
        p.writer.compression = "br";
        p.writer.storeRetries = 2;
        p.writer.leaseHolder = "test:1";
        p.restorer.storeRetries = 2;
        p.restorer.bufferSize = 8192;
        return p;
    }

    RebuildFunction rebuilder()
    {
        return [this](std::string_view name, const Path & dest) -> Path {
            rebuilds++;
            if (rebuildFails)
                throw RebuildFailure("source dump for '%s' is unreachable", name);
            makeSampleArtifact(dest, 20);
            return dest;
        };
    }

    CacheOrchestrator
    orchestrator(std::optional<ref<ChunkStore>> s = std::nullopt, std::optional<OrchestratorParams> p = std::nullopt)
    {
        return CacheOrchestrator(s ? *s : store, validator, rebuilder(), p ? *p : params());
    }

    Path artifact(std::string_view name)
    {
        return tmpDir + "/artifacts/" + std::string(name);
    }

    /* Put a valid artifact into the store under `name`. */
    void seedCache(std::string_view name, uint64_t records = 30)
    {
        auto src = tmpDir + "/seed.sqlite";
        makeSampleArtifact(src, records);
        ChunkWriter writer(store, validator, params().writer);
        writer.write(name, src);
        deletePath(src);
    }

    void seedLocal(std::string_view name, time_t age = 0)
    {
        createDirs(tmpDir + "/artifacts");
        makeSampleArtifact(artifact(name), 10);
        if (age)
            setWriteTime(artifact(name), time(0) - age);
    }
};

TEST_F(CacheOrchestratorTest, freshLocalCopyWins)
{
    seedLocal("wiki");
    seedCache("wiki");

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_TRUE(res.ready());
    EXPECT_EQ(res.source, ArtifactSource::Local);
    EXPECT_EQ(*res.path, artifact("wiki"));
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, Ready));
    EXPECT_EQ(rebuilds, 0);
}

TEST_F(CacheOrchestratorTest, coldStartRebuildsAndCaches)
{
    auto res = orchestrator().ensureReady("wiki");

    EXPECT_TRUE(res.ready());
    EXPECT_EQ(res.source, ArtifactSource::Rebuild);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Rebuild, CacheWrite, Ready));
    EXPECT_EQ(rebuilds, 1);
    EXPECT_TRUE(validator.validate(artifact("wiki")));

    auto md = store->getMetadata("wiki");
    ASSERT_TRUE(md);
    EXPECT_TRUE(md->isComplete());
    EXPECT_EQ(md->artifactSize, readFile(artifact("wiki")).size());

    // The next run is served locally.
    auto again = orchestrator().ensureReady("wiki");
    EXPECT_EQ(again.source, ArtifactSource::Local);
    EXPECT_EQ(rebuilds, 1);
}

TEST_F(CacheOrchestratorTest, restoresFromCache)
{
    seedCache("wiki");

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_TRUE(res.ready());
    EXPECT_EQ(res.source, ArtifactSource::Cache);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Restore, Ready));
    EXPECT_EQ(rebuilds, 0);

    // The local copy inherits the age of the chunk set.
    EXPECT_EQ(stat(artifact("wiki")).st_mtime, store->getMetadata("wiki")->updatedAt);
}

TEST_F(CacheOrchestratorTest, staleLocalIsRefreshedFromCache)
{
    seedLocal("wiki", 7200);
    seedCache("wiki", 40);

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_EQ(res.source, ArtifactSource::Cache);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Restore, Ready));
    EXPECT_EQ(readFile(artifact("wiki")).size(), store->getMetadata("wiki")->artifactSize);
}

TEST_F(CacheOrchestratorTest, incompleteCacheIsRebuilt)
{
    seedCache("wiki", 200);
    auto chunks = store->getChunksOrdered("wiki");
    ASSERT_EQ(chunks.size(), 3);
    store->deleteAll("wiki");
    // Two of three chunks.
    for (auto & c : chunks)
        if (c.index < 2)
            store->insertChunk("wiki", c.index, c.data, 3, c.rawSize, c.compression);

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_TRUE(res.ready());
    EXPECT_EQ(res.source, ArtifactSource::Rebuild);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Rebuild, CacheWrite, Ready));
    EXPECT_TRUE(store->getMetadata("wiki")->isComplete());
}

TEST_F(CacheOrchestratorTest, corruptCacheIsInvalidated)
{
    {
        AcceptAllValidator acceptAll;
        ChunkWriter writer(store, acceptAll, params().writer);
        auto junk = makeNoise(10000);
        StringSource source(junk);
        writer.writeFrom("wiki", source, junk.size());
    }

    rebuildFails = true;
    auto res = orchestrator().ensureReady("wiki");

    EXPECT_FALSE(res.ready());
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Restore, Invalidate, Rebuild, Degraded));
    EXPECT_FALSE(store->getMetadata("wiki"));
    EXPECT_FALSE(pathExists(artifact("wiki")));
}

TEST_F(CacheOrchestratorTest, corruptCacheIsReplacedByRebuild)
{
    {
        AcceptAllValidator acceptAll;
        ChunkWriter writer(store, acceptAll, params().writer);
        auto junk = makeNoise(10000);
        StringSource source(junk);
        writer.writeFrom("wiki", source, junk.size());
    }

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_EQ(res.source, ArtifactSource::Rebuild);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Restore, Invalidate, Rebuild, CacheWrite, Ready));
    EXPECT_EQ(store->getMetadata("wiki")->artifactSize, readFile(artifact("wiki")).size());
}

TEST_F(CacheOrchestratorTest, nothingAvailableDegrades)
{
    rebuildFails = true;
    auto res = orchestrator().ensureReady("wiki");

    EXPECT_FALSE(res.ready());
    EXPECT_EQ(res.state, Degraded);
    EXPECT_FALSE(res.path);
    EXPECT_EQ(res.source, ArtifactSource::None);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Rebuild, Degraded));
}

TEST_F(CacheOrchestratorTest, noRebuildFunctionDegrades)
{
    CacheOrchestrator o(store, validator, nullptr, params());
    auto res = o.ensureReady("wiki");
    EXPECT_EQ(res.state, Degraded);
}

TEST_F(CacheOrchestratorTest, foreignRebuildExceptionDegrades)
{
    CacheOrchestrator o(
        store,
        validator,
        [](std::string_view, const Path &) -> Path { throw std::runtime_error("dataset download failed"); },
        params());

    EnsureResult res;
    ASSERT_NO_THROW(res = o.ensureReady("wiki"));
    EXPECT_EQ(res.state, Degraded);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Rebuild, Degraded));
    EXPECT_FALSE(pathExists(artifact("wiki")));
}

TEST_F(CacheOrchestratorTest, invalidRebuildOutputDegrades)
{
    CacheOrchestrator o(
        store,
        validator,
        [&](std::string_view, const Path & dest) {
            writeFile(dest, "not a database");
            return dest;
        },
        params());

    auto res = o.ensureReady("wiki");
    EXPECT_EQ(res.state, Degraded);
    EXPECT_FALSE(pathExists(artifact("wiki")));
    EXPECT_FALSE(store->getMetadata("wiki"));
}

TEST_F(CacheOrchestratorTest, staleCacheIsLastButOneResort)
{
    seedCache("wiki");
    memoryStore->shiftCreatedAt("wiki", -7200);
    rebuildFails = true;

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_TRUE(res.ready());
    EXPECT_EQ(res.source, ArtifactSource::StaleCache);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Rebuild, Restore, Ready));
    EXPECT_EQ(rebuilds, 1);
}

TEST_F(CacheOrchestratorTest, staleCacheLosesToRebuild)
{
    seedCache("wiki");
    memoryStore->shiftCreatedAt("wiki", -7200);

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_EQ(res.source, ArtifactSource::Rebuild);
    // The rebuild refreshed the chunk set.
    auto md = store->getMetadata("wiki");
    EXPECT_GT(md->updatedAt, time(0) - 3600);
}

TEST_F(CacheOrchestratorTest, staleLocalIsLastResort)
{
    seedLocal("wiki", 7200);
    rebuildFails = true;

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_TRUE(res.ready());
    EXPECT_EQ(res.source, ArtifactSource::StaleLocal);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Rebuild, Ready));
}

TEST_F(CacheOrchestratorTest, invalidStaleLocalIsNotUsed)
{
    createDirs(tmpDir + "/artifacts");
    writeFile(artifact("wiki"), "garbage");
    setWriteTime(artifact("wiki"), time(0) - 7200);
    rebuildFails = true;

    auto res = orchestrator().ensureReady("wiki");
    EXPECT_EQ(res.state, Degraded);
}

TEST_F(CacheOrchestratorTest, failedRebuildKeepsStaleLocal)
{
    seedLocal("wiki", 7200);
    auto before = readFile(artifact("wiki"));

    CacheOrchestrator o(
        store,
        validator,
        [&](std::string_view, const Path & dest) -> Path {
            writeFile(dest, "half-written");
            throw RebuildFailure("interrupted");
        },
        params());

    auto res = o.ensureReady("wiki");
    EXPECT_EQ(res.source, ArtifactSource::StaleLocal);
    EXPECT_EQ(readFile(artifact("wiki")), before);
}

TEST_F(CacheOrchestratorTest, validateLocalRejectsCorruptFreshCopy)
{
    createDirs(tmpDir + "/artifacts");
    writeFile(artifact("wiki"), "garbage");
    seedCache("wiki");

    auto p = params();
    p.validateLocal = true;
    auto res = orchestrator(std::nullopt, p).ensureReady("wiki");

    EXPECT_EQ(res.source, ArtifactSource::Cache);
    EXPECT_TRUE(validator.validate(artifact("wiki")));
}

TEST_F(CacheOrchestratorTest, cacheWriteFailureIsNotFatal)
{
    auto faulty = make_ref<FaultyChunkStore>(store);
    faulty->failInserts = -1;

    auto res = orchestrator(faulty).ensureReady("wiki");

    EXPECT_TRUE(res.ready());
    EXPECT_EQ(res.source, ArtifactSource::Rebuild);
    EXPECT_THAT(res.trace, ElementsAre(CheckLocal, CheckCache, Rebuild, CacheWrite, Ready));
    EXPECT_FALSE(store->getMetadata("wiki"));
}

TEST_F(CacheOrchestratorTest, foreignLeaseSkipsCacheWrite)
{
    ASSERT_TRUE(store->acquireLease("wiki", "other:2", 60s));

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_EQ(res.source, ArtifactSource::Rebuild);
    EXPECT_FALSE(store->getMetadata("wiki"));
}

TEST_F(CacheOrchestratorTest, unreachableStoreIsAMiss)
{
    auto faulty = make_ref<FaultyChunkStore>(store);
    faulty->failMetadata = -1;
    seedCache("wiki");

    auto res = orchestrator(faulty).ensureReady("wiki");

    EXPECT_TRUE(res.ready());
    EXPECT_EQ(res.source, ArtifactSource::Rebuild);
}

TEST_F(CacheOrchestratorTest, transientFetchFailureIsRetried)
{
    auto faulty = make_ref<FaultyChunkStore>(store);
    faulty->failGets = 1;
    seedCache("wiki");

    auto res = orchestrator(faulty).ensureReady("wiki");
    EXPECT_EQ(res.source, ArtifactSource::Cache);
}

TEST_F(CacheOrchestratorTest, heldLockDegrades)
{
    createDirs(tmpDir + "/artifacts");
    PathLock held(artifact("wiki") + ".lock", 1, "wiki");

    auto res = orchestrator().ensureReady("wiki");

    EXPECT_EQ(res.state, Degraded);
    EXPECT_THAT(res.trace, ElementsAre(Degraded));
    EXPECT_EQ(rebuilds, 0);
}

TEST_F(CacheOrchestratorTest, lockIsReleased)
{
    orchestrator().ensureReady("wiki");
    ASSERT_NO_THROW(PathLock(artifact("wiki") + ".lock", 1, "wiki"));
}

TEST_F(CacheOrchestratorTest, rejectsBadNames)
{
    auto o = orchestrator();
    for (auto name : {"", ".", "..", "a/b", "../etc"})
        EXPECT_THROW(o.ensureReady(name), UsageError) << name;
    EXPECT_EQ(o.artifactPath("wiki"), artifact("wiki"));
}

} // namespace chunkcache
