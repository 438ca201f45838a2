#include "chunkcache/store/chunk-writer.hh"
#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/integrity-validator.hh"
#include "chunkcache/util/compression.hh"
#include "chunkcache/util/current-process.hh"
#include "chunkcache/util/file-descriptor.hh"
#include "chunkcache/util/finally.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/retry.hh"
#include "chunkcache/util/serialise.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/util.hh"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chunkcache {

std::string ChunkWriterParams::defaultLeaseHolder()
{
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == -1)
        hostname[0] = 0;
    hostname[sizeof(hostname) - 1] = 0;
    return fmt("%s:%d", hostname, getpid());
}

ChunkWriter::ChunkWriter(ref<ChunkStore> store, IntegrityValidator & validator, ChunkWriterParams params)
    : store(store)
    , validator(validator)
    , params(std::move(params))
{
    if (this->params.chunkSize == 0)
        throw UsageError("chunk size must be positive");
    checkCompressionMethod(this->params.compression);
}

ChunkWriter::Result ChunkWriter::write(std::string_view name, const Path & path)
{
    validator.check(path);

    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening artifact '%s'", path);

    struct stat st;
    if (fstat(fd.get(), &st) == -1)
        throw SysError("statting artifact '%s'", path);

    if (!store->acquireLease(name, params.leaseHolder, params.leaseTtl))
        throw LeaseUnavailable("chunk set of '%s' is being written by another process", name);

    Finally releaseLease([&]() {
        try {
            store->releaseLease(name, params.leaseHolder);
        } catch (Error & e) {
            logWarning(e.info());
        }
    });

    FdSource source(fd.get());
    try {
        return writeFrom(name, source, st.st_size);
    } catch (Error & e) {
        e.addTrace("while uploading artifact '%s' from '%s'", name, path);
        throw;
    }
}

ChunkWriter::Result ChunkWriter::writeFrom(std::string_view name, Source & source, uint64_t size)
{
    Activity act(*logger, lvlInfo, actUpload, fmt("uploading '%s' (%s)", name, renderSize(size)));

    retry<void>(params.storeRetries, [&]() { store->deleteAll(name); });

    Result res;
    uint64_t remaining = size;
    std::string window;

    /* An empty artifact is stored as one empty chunk, so that it is
       distinguishable from a missing one. */
    while (res.chunks == 0 || remaining > 0) {
        checkInterrupt();

        auto want = std::min(params.chunkSize, remaining);
        window.resize(want);
        try {
            source(window.data(), want);
        } catch (EndOfFile &) {
            throw ShortReadError(
                "artifact '%s' ended after %d of %d bytes", name, size - remaining, size);
        }

        auto compressed = compress(params.compression, window, params.compressionLevel);

        auto index = res.chunks;
        retry<void>(params.storeRetries, [&]() {
            store->insertChunk(name, index, compressed, totalChunksUnknown, want, params.compression);
        });

        debug("stored chunk %d of '%s' (%d -> %d bytes)", index, name, want, compressed.size());

        res.chunks++;
        res.rawBytes += want;
        res.compressedBytes += compressed.size();
        remaining -= want;
        act.progress(res.rawBytes, size);

        if (params.reclaimInterval && res.chunks % params.reclaimInterval == 0) {
            std::string().swap(window);
            reclaimHeap();
        }
    }

    retry<void>(params.storeRetries, [&]() { store->finalizeTotalChunks(name, res.chunks); });

    printInfo(
        "uploaded '%s': %d chunks, %s compressed to %s",
        name,
        res.chunks,
        renderSize(res.rawBytes),
        renderSize(res.compressedBytes));

    return res;
}

} // namespace chunkcache
