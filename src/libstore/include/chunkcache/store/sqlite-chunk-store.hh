#pragma once
///@file

#include "chunkcache/store/chunk-store.hh"
#include "chunkcache/store/sqlite.hh"
#include "chunkcache/util/sync.hh"

namespace chunkcache {

/**
 * The production chunk store: one SQLite database
 * (`sqlite://<path>`) holding the `Chunks` and `Leases` tables.
 * Several processes may share the database.
 */
class SQLiteChunkStore : public ChunkStore
{
    struct State
    {
        SQLite db;
        SQLiteStmt insertChunk, finalizeTotal, queryHeaders, queryChunk, queryChunks, deleteChunks, queryArtifacts,
            upsertLease, deleteLease;
    };

    Path dbPath;

    Sync<State> _state;

    template<typename T, typename F>
    T withState(std::string_view what, F && fun);

public:

    SQLiteChunkStore(const Path & dbPath);

    std::string getUri() override
    {
        return "sqlite://" + dbPath;
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
