#pragma once
///@file

#include "chunkcache/store/chunk-store.hh"
#include "chunkcache/util/sync.hh"

#include <map>

namespace chunkcache {

/**
 * A chunk store that keeps everything in process memory
 * (`memory://`). Thread-safe.
 */
class MemoryChunkStore : public ChunkStore
{
    struct Lease
    {
        std::string holder;
        time_t expiresAt;
    };

    struct State
    {
        std::map<std::string, std::map<uint64_t, Chunk>, std::less<>> artifacts;
        std::map<std::string, Lease, std::less<>> leases;
    };

    Sync<State> _state;

public:

    std::string getUri() override
    {
        return "memory://";
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

    /**
     * Shift the `createdAt` of every row of `name` by `delta` seconds.
     */
    void shiftCreatedAt(std::string_view name, time_t delta);
};

} // namespace chunkcache
