#pragma once
///@file

#include "chunkcache/store/chunk-store.hh"
#include "chunkcache/store/globals.hh"

namespace chunkcache {

struct BackpressureSink;
class IntegrityValidator;

/**
 * A pull-based sequence of chunks in ascending index order.
 */
class ChunkSource
{
public:

    virtual ~ChunkSource() {}

    /**
     * @return the next chunk, or nothing once the sequence is
     * exhausted.
     */
    virtual std::optional<Chunk> next() = 0;
};

/**
 * Fetches the chunks named by a list of headers from a store, one
 * chunk per call, so only one payload is resident at a time.
 */
class StoreChunkSource : public ChunkSource
{
    ref<ChunkStore> store;
    std::string name;
    std::vector<ChunkHeader> headers;
    size_t pos = 0;
    unsigned int retries;

public:

    StoreChunkSource(ref<ChunkStore> store, std::string_view name, std::vector<ChunkHeader> headers, unsigned int retries);

    std::optional<Chunk> next() override;
};

enum class RestoreStatus {
    Restored,
    /**
     * The store holds no chunks for the artifact.
     */
    NotCached,
    /**
     * The chunk set is partial or its upload never finished.
     */
    Incomplete,
};

std::string_view showRestoreStatus(RestoreStatus status);

struct RestoreResult
{
    RestoreStatus status;
    uint64_t chunks = 0;
    uint64_t bytes = 0;

    /**
     * The most decompressed data that was queued for the output at
     * once.
     */
    size_t peakQueued = 0;
};

struct ChunkRestorerParams
{
    unsigned int reclaimInterval = settings.reclaimInterval;
    unsigned int storeRetries = settings.storeRetries;

    /**
     * Bound on the decompressed bytes queued for the output file.
     */
    uint64_t bufferSize = settings.effectiveRestoreBufferSize();
};

/**
 * Reassembles an artifact from its chunk set under a bounded memory
 * budget. Only a complete chunk set is ever restored, and the result
 * replaces the destination only after it passed validation.
 */
class ChunkRestorer
{
    ref<ChunkStore> store;
    IntegrityValidator & validator;
    ChunkRestorerParams params;

    /**
     * Fetch the headers of `name` and classify the chunk set.
     */
    RestoreStatus inspect(std::string_view name, std::vector<ChunkHeader> & headers);

public:

    ChunkRestorer(ref<ChunkStore> store, IntegrityValidator & validator, ChunkRestorerParams params = {});

    /**
     * Restore `name` into `dest`.
     *
     * @throws SizeMismatchError if a chunk or the whole artifact does
     * not have its recorded size.
     * @throws CorruptArtifactError if the result fails validation.
     * @throws CompressionError if a chunk payload cannot be decoded.
     */
    RestoreResult restore(std::string_view name, const Path & dest);

    /**
     * Fetch and decompress every chunk of `name`, checking sizes,
     * without writing anything.
     */
    RestoreResult verify(std::string_view name);

    /**
     * Decompress the chunks of `source` into `sink` in order, waiting
     * for the sink to be ready before pulling each chunk.
     *
     * @return the number of decompressed bytes.
     */
    uint64_t streamChunks(
        std::string_view name, ChunkSource & source, BackpressureSink & sink, uint64_t expectedSize);
};

} // namespace chunkcache
