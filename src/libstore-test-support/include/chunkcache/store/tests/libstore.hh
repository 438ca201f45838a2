#pragma once
///@file

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "chunkcache/store/chunk-store.hh"
#include "chunkcache/store/globals.hh"
#include "chunkcache/store/memory-chunk-store.hh"
#include "chunkcache/util/file-system.hh"

namespace chunkcache {

/**
 * Fixture with an in-memory chunk store and a scratch directory that
 * is removed after each test.
 */
class LibStoreTest : public virtual ::testing::Test
{
public:
    static void SetUpTestSuite()
    {
        initLibStore(false);
    }

protected:
    LibStoreTest(ref<MemoryChunkStore> store)
        : memoryStore(store)
        , store(store)
    {
    }

    LibStoreTest()
        : LibStoreTest(make_ref<MemoryChunkStore>())
    {
    }

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir.reset(tmpDir, true);
    }

    ref<MemoryChunkStore> memoryStore;
    ref<ChunkStore> store;
    Path tmpDir;
    AutoDelete delTmpDir;
};

} // namespace chunkcache
