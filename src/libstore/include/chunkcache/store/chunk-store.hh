#pragma once
///@file

#include "chunkcache/util/ref.hh"
#include "chunkcache/util/types.hh"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <vector>

namespace chunkcache {

/**
 * `totalChunks` value written while an upload is still in progress.
 */
constexpr int64_t totalChunksUnknown = -1;

/**
 * A chunk row without its payload.
 */
struct ChunkHeader
{
    std::string name;
    uint64_t index;
    int64_t totalChunks;
    uint64_t compressedSize;
    uint64_t rawSize;
    std::string compression;
    time_t createdAt;
};

struct Chunk : ChunkHeader
{
    std::string data;
};

/**
 * Aggregate information about the chunk set of one artifact.
 */
struct ArtifactMetadata
{
    std::string name;
    uint64_t chunksPresent = 0;

    /**
     * The total recorded on the rows, or `totalChunksUnknown` if the
     * upload never finished or the rows disagree.
     */
    int64_t totalChunks = totalChunksUnknown;

    /**
     * Sum of the compressed chunk sizes.
     */
    uint64_t totalSize = 0;

    /**
     * Sum of the decompressed chunk sizes, i.e. the artifact's length.
     */
    uint64_t artifactSize = 0;

    /**
     * The newest `createdAt` among the rows.
     */
    time_t updatedAt = 0;

    bool isComplete() const
    {
        return totalChunks >= 0 && chunksPresent == (uint64_t) totalChunks;
    }
};

/**
 * Persistence of chunk rows keyed by `(name, index)`.
 *
 * Implementations raise `TransientStoreError` for storage-layer
 * failures and never retry by themselves.
 */
class ChunkStore
{
public:

    virtual ~ChunkStore() {}

    virtual std::string getUri() = 0;

    /**
     * Insert or overwrite one chunk row.
     */
    virtual void insertChunk(
        std::string_view name,
        uint64_t index,
        std::string_view compressedBytes,
        int64_t totalChunksHint,
        uint64_t rawSize,
        std::string_view compression) = 0;

    /**
     * Set `totalChunks` on every row of `name`.
     */
    virtual void finalizeTotalChunks(std::string_view name, uint64_t trueCount) = 0;

    virtual std::optional<ArtifactMetadata> getMetadata(std::string_view name) = 0;

    /**
     * All rows of `name` sorted by index, complete or not.
     */
    virtual std::vector<Chunk> getChunksOrdered(std::string_view name) = 0;

    virtual std::vector<ChunkHeader> getChunkHeaders(std::string_view name) = 0;

    virtual std::optional<Chunk> getChunk(std::string_view name, uint64_t index) = 0;

    virtual void deleteAll(std::string_view name) = 0;

    virtual std::vector<ArtifactMetadata> listArtifacts() = 0;

    /**
     * Take the upload lease on `name` for `holder` unless another
     * holder owns a lease that has not expired yet. Re-acquiring one's
     * own lease extends it.
     *
     * @return whether `holder` now owns the lease.
     */
    virtual bool acquireLease(std::string_view name, std::string_view holder, std::chrono::seconds ttl) = 0;

    virtual void releaseLease(std::string_view name, std::string_view holder) = 0;
};

/**
 * Compute the metadata of a chunk set from its headers. Rows that
 * disagree about `totalChunks` yield `totalChunksUnknown`.
 */
std::optional<ArtifactMetadata> metadataFromHeaders(std::string_view name, const std::vector<ChunkHeader> & headers);

/**
 * Open the chunk store named by a URI such as `sqlite:///var/lib/x.sqlite`
 * or `memory://`.
 *
 * @throws UsageError for an unsupported scheme.
 */
ref<ChunkStore> openChunkStore(const std::string & uri);

} // namespace chunkcache
