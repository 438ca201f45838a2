#include "chunkcache/store/chunk-restorer.hh"
#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/integrity-validator.hh"
#include "chunkcache/util/backpressure-sink.hh"
#include "chunkcache/util/compression.hh"
#include "chunkcache/util/current-process.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/retry.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/util.hh"

#include <algorithm>

#include <fcntl.h>

namespace chunkcache {

StoreChunkSource::StoreChunkSource(
    ref<ChunkStore> store, std::string_view name, std::vector<ChunkHeader> headers, unsigned int retries)
    : store(store)
    , name(name)
    , headers(std::move(headers))
    , retries(retries)
{
}

std::optional<Chunk> StoreChunkSource::next()
{
    if (pos == headers.size())
        return std::nullopt;

    auto index = headers[pos].index;
    auto chunk = retry<std::optional<Chunk>>(retries, [&]() { return store->getChunk(name, index); });
    if (!chunk)
        throw IncompleteCacheError("chunk %d of '%s' disappeared during the restore", index, name);

    pos++;
    return chunk;
}

std::string_view showRestoreStatus(RestoreStatus status)
{
    switch (status) {
    case RestoreStatus::Restored:
        return "restored";
    case RestoreStatus::NotCached:
        return "not cached";
    case RestoreStatus::Incomplete:
        return "incomplete";
    default:
        unreachable();
    }
}

namespace {

/**
 * Counts the bytes given to it; always ready.
 */
struct CountingSink : BackpressureSink
{
    uint64_t length = 0;

    void operator()(std::string_view data) override
    {
        length += data.size();
    }

    void waitReady() override {}

    void finish() override {}
};

}

ChunkRestorer::ChunkRestorer(ref<ChunkStore> store, IntegrityValidator & validator, ChunkRestorerParams params)
    : store(store)
    , validator(validator)
    , params(params)
{
    if (this->params.bufferSize == 0)
        throw UsageError("restore buffer size must be positive");
}

RestoreStatus ChunkRestorer::inspect(std::string_view name, std::vector<ChunkHeader> & headers)
{
    headers = retry<std::vector<ChunkHeader>>(params.storeRetries, [&]() { return store->getChunkHeaders(name); });

    if (headers.empty()) {
        debug("artifact '%s' is not cached", name);
        return RestoreStatus::NotCached;
    }

    std::sort(headers.begin(), headers.end(), [](const ChunkHeader & a, const ChunkHeader & b) {
        return a.index < b.index;
    });

    auto total = headers.front().totalChunks;
    if (total < 0 || headers.size() != (uint64_t) total) {
        printInfo(
            "cached copy of '%s' is incomplete (%d chunks present, %d expected)", name, headers.size(), total);
        return RestoreStatus::Incomplete;
    }

    for (size_t i = 0; i < headers.size(); ++i)
        if (headers[i].index != i || headers[i].totalChunks != total) {
            printInfo("cached copy of '%s' is incomplete (chunk %d is missing or inconsistent)", name, i);
            return RestoreStatus::Incomplete;
        }

    return RestoreStatus::Restored;
}

uint64_t ChunkRestorer::streamChunks(
    std::string_view name, ChunkSource & source, BackpressureSink & sink, uint64_t expectedSize)
{
    Activity act(*logger, lvlInfo, actRestore, fmt("restoring '%s' (%s)", name, renderSize(expectedSize)));

    uint64_t total = 0;
    uint64_t expectedIndex = 0;

    while (true) {
        checkInterrupt();

        sink.waitReady();

        auto chunk = source.next();
        if (!chunk)
            break;

        if (chunk->index != expectedIndex)
            throw IncompleteCacheError("expected chunk %d of '%s', got chunk %d", expectedIndex, name, chunk->index);

        auto rawSize = chunk->rawSize;
        auto data = decompress(chunk->compression, chunk->data);
        chunk.reset();

        if (data.size() != rawSize)
            throw SizeMismatchError(
                "chunk %d of '%s' decompressed to %d bytes, expected %d", expectedIndex, name, data.size(), rawSize);

        total += data.size();
        sink(data);

        expectedIndex++;
        act.progress(total, expectedSize);

        if (params.reclaimInterval && expectedIndex % params.reclaimInterval == 0)
            reclaimHeap();
    }

    return total;
}

RestoreResult ChunkRestorer::restore(std::string_view name, const Path & dest)
{
    std::vector<ChunkHeader> headers;
    RestoreResult res{.status = inspect(name, headers)};
    if (res.status != RestoreStatus::Restored)
        return res;

    uint64_t expectedSize = 0;
    for (auto & h : headers)
        expectedSize += h.rawSize;
    res.chunks = headers.size();

    createDirs(dirOf(dest));
    auto tmpPath = makeTempPath(dest, ".restore");
    AutoDelete delTmp(tmpPath, false);

    try {
        {
            AutoCloseFD fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
            if (!fd)
                throw SysError("creating '%s'", tmpPath);

            StoreChunkSource source(store, name, std::move(headers), params.storeRetries);
            AsyncFdSink sink(fd.get(), params.bufferSize);

            res.bytes = streamChunks(name, source, sink, expectedSize);
            sink.finish();
            res.peakQueued = sink.highWaterMark();

            fd.fsync();
            fd.close();
        }

        if (res.bytes != expectedSize)
            throw SizeMismatchError(
                "restored %d bytes of '%s', but the chunk set records %d", res.bytes, name, expectedSize);

        validator.check(tmpPath);

        moveFile(tmpPath, dest);
        delTmp.cancel();
        syncParent(dest);
    } catch (Error & e) {
        e.addTrace("while restoring artifact '%s' to '%s'", name, dest);
        throw;
    }

    printInfo("restored '%s' to '%s' (%d chunks, %s)", name, dest, res.chunks, renderSize(res.bytes));

    return res;
}

RestoreResult ChunkRestorer::verify(std::string_view name)
{
    std::vector<ChunkHeader> headers;
    RestoreResult res{.status = inspect(name, headers)};
    if (res.status != RestoreStatus::Restored)
        return res;

    uint64_t expectedSize = 0;
    for (auto & h : headers)
        expectedSize += h.rawSize;
    res.chunks = headers.size();

    StoreChunkSource source(store, name, std::move(headers), params.storeRetries);
    CountingSink sink;
    res.bytes = streamChunks(name, source, sink, expectedSize);

    if (res.bytes != expectedSize)
        throw SizeMismatchError(
            "chunks of '%s' hold %d bytes, but the chunk set records %d", name, res.bytes, expectedSize);

    return res;
}

} // namespace chunkcache
