#pragma once
///@file

#include "chunkcache/store/chunk-store.hh"
#include "chunkcache/util/sync.hh"

#include <atomic>

namespace chunkcache {

/**
 * Wraps a chunk store and fails selected operations with
 * `TransientStoreError`.
 */
class FaultyChunkStore : public ChunkStore
{
    ref<ChunkStore> next;

public:

    /**
     * Number of upcoming calls of each kind that fail before the
     * wrapped store is reached. -1 fails forever.
     */
    std::atomic<int> failInserts{0}, failMetadata{0}, failGets{0}, failDeletes{0}, failFinalize{0};

    /**
     * If set, inserting this chunk index always fails.
     */
    std::optional<uint64_t> failInsertIndex;

    /**
     * Successful inserts so far.
     */
    std::atomic<uint64_t> inserts{0};

    FaultyChunkStore(ref<ChunkStore> next)
        : next(next)
    {
    }

    std::string getUri() override
    {
        return "faulty+" + next->getUri();
    }

    void insertChunk(
        std::string_view name,
        uint64_t index,
        std::string_view compressedBytes,
        int64_t totalChunksHint,
        uint64_t rawSize,
        std::string_view compression) override;

    void finalizeTotalChunks(std::string_view name, uint64_t trueCount) override;

    std::optional<ArtifactMetadata> getMetadata(std::string_view name) override;

    std::vector<Chunk> getChunksOrdered(std::string_view name) override;

    std::vector<ChunkHeader> getChunkHeaders(std::string_view name) override;

    std::optional<Chunk> getChunk(std::string_view name, uint64_t index) override;

    void deleteAll(std::string_view name) override;

    std::vector<ArtifactMetadata> listArtifacts() override;

    bool acquireLease(std::string_view name, std::string_view holder, std::chrono::seconds ttl) override;

    void releaseLease(std::string_view name, std::string_view holder) override;
};

} // namespace chunkcache
