#include "chunkcache/store/chunk-store.hh"
#include "chunkcache/store/memory-chunk-store.hh"
#include "chunkcache/store/sqlite-chunk-store.hh"
#include "chunkcache/util/error.hh"
#include "chunkcache/util/logging.hh"

#include <algorithm>

namespace chunkcache {

std::optional<ArtifactMetadata> metadataFromHeaders(std::string_view name, const std::vector<ChunkHeader> & headers)
{
    if (headers.empty())
        return std::nullopt;

    ArtifactMetadata md;
    md.name = std::string(name);
    md.totalChunks = headers.front().totalChunks;

    for (auto & h : headers) {
        md.chunksPresent++;
        md.totalSize += h.compressedSize;
        md.artifactSize += h.rawSize;
        md.updatedAt = std::max(md.updatedAt, h.createdAt);
        if (h.totalChunks != md.totalChunks)
            md.totalChunks = totalChunksUnknown;
    }

    return md;
}

ref<ChunkStore> openChunkStore(const std::string & uri)
{
    auto sep = uri.find("://");
    if (sep == std::string::npos)
        throw UsageError("chunk store URI '%s' lacks a scheme (such as 'sqlite://')", uri);

    auto scheme = std::string_view(uri).substr(0, sep);
    auto rest = std::string_view(uri).substr(sep + 3);

    debug("opening chunk store '%s'", uri);

    if (scheme == "sqlite") {
        if (rest.empty())
            throw UsageError("chunk store URI '%s' lacks a database path", uri);
        return make_ref<SQLiteChunkStore>(Path(rest));
    } else if (scheme == "memory")
        return make_ref<MemoryChunkStore>();
    else
        throw UsageError("don't know how to open chunk store '%s'", uri);
}

} // namespace chunkcache
