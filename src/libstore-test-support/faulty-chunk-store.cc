#include "chunkcache/store/tests/faulty-chunk-store.hh"
#include "chunkcache/store/cache-errors.hh"

namespace chunkcache {

static void maybeFail(std::atomic<int> & counter, std::string_view what)
{
    int n = counter.load();
    while (n != 0) {
        if (n < 0 || counter.compare_exchange_weak(n, n - 1))
            throw TransientStoreError("injected failure in %s", what);
    }
}

void FaultyChunkStore::insertChunk(
    std::string_view name,
    uint64_t index,
    std::string_view compressedBytes,
    int64_t totalChunksHint,
    uint64_t rawSize,
    std::string_view compression)
{
    if (failInsertIndex && *failInsertIndex == index)
        throw TransientStoreError("injected failure inserting chunk %d", index);
    maybeFail(failInserts, "insertChunk");
    next->insertChunk(name, index, compressedBytes, totalChunksHint, rawSize, compression);
    inserts++;
}

void FaultyChunkStore::finalizeTotalChunks(std::string_view name, uint64_t trueCount)
{
    maybeFail(failFinalize, "finalizeTotalChunks");
    next->finalizeTotalChunks(name, trueCount);
}

std::optional<ArtifactMetadata> FaultyChunkStore::getMetadata(std::string_view name)
{
    maybeFail(failMetadata, "getMetadata");
    return next->getMetadata(name);
}

std::vector<Chunk> FaultyChunkStore::getChunksOrdered(std::string_view name)
{
    maybeFail(failGets, "getChunksOrdered");
    return next->getChunksOrdered(name);
}

std::vector<ChunkHeader> FaultyChunkStore::getChunkHeaders(std::string_view name)
{
    return next->getChunkHeaders(name);
}

std::optional<Chunk> FaultyChunkStore::getChunk(std::string_view name, uint64_t index)
{
    maybeFail(failGets, "getChunk");
    return next->getChunk(name, index);
}

void FaultyChunkStore::deleteAll(std::string_view name)
{
    maybeFail(failDeletes, "deleteAll");
    next->deleteAll(name);
}

std::vector<ArtifactMetadata> FaultyChunkStore::listArtifacts()
{
    return next->listArtifacts();
}

bool FaultyChunkStore::acquireLease(std::string_view name, std::string_view holder, std::chrono::seconds ttl)
{
    return next->acquireLease(name, holder, ttl);
}

void FaultyChunkStore::releaseLease(std::string_view name, std::string_view holder)
{
    next->releaseLease(name, holder);
}

} // namespace chunkcache
