#pragma once
///@file

#include "chunkcache/store/chunk-store.hh"
#include "chunkcache/store/globals.hh"

#include <chrono>

namespace chunkcache {

struct Source;
class IntegrityValidator;

/**
 * Tunables of the upload path. The defaults come from `settings`.
 */
struct ChunkWriterParams
{
    uint64_t chunkSize = settings.chunkSize;
    std::string compression = settings.chunkCompression;
    int compressionLevel = settings.chunkCompressionLevel;
    unsigned int reclaimInterval = settings.reclaimInterval;
    unsigned int storeRetries = settings.storeRetries;
    std::chrono::seconds leaseTtl{settings.leaseTtl.get()};

    /**
     * Identifies this process in the lease table.
     */
    std::string leaseHolder = defaultLeaseHolder();

    static std::string defaultLeaseHolder();
};

/**
 * Cuts an artifact into fixed-size windows, compresses each one on its
 * own and stores it as a chunk row.
 */
class ChunkWriter
{
    ref<ChunkStore> store;
    IntegrityValidator & validator;
    ChunkWriterParams params;

public:

    struct Result
    {
        uint64_t chunks = 0;
        uint64_t rawBytes = 0;
        uint64_t compressedBytes = 0;
    };

    ChunkWriter(ref<ChunkStore> store, IntegrityValidator & validator, ChunkWriterParams params = {});

    /**
     * Validate the artifact at `path` and replace the chunk set of
     * `name` with its contents, under the upload lease.
     *
     * @throws CorruptArtifactError if the artifact fails validation.
     * @throws LeaseUnavailable if another process is uploading `name`.
     */
    Result write(std::string_view name, const Path & path);

    /**
     * Replace the chunk set of `name` with `size` bytes read from
     * `source`, without validation or lease.
     *
     * @throws ShortReadError if `source` ends early.
     */
    Result writeFrom(std::string_view name, Source & source, uint64_t size);
};

} // namespace chunkcache
