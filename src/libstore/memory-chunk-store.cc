#include "chunkcache/store/memory-chunk-store.hh"

namespace chunkcache {

void MemoryChunkStore::insertChunk(
    std::string_view name,
    uint64_t index,
    std::string_view compressedBytes,
    int64_t totalChunksHint,
    uint64_t rawSize,
    std::string_view compression)
{
    Chunk chunk;
    chunk.name = std::string(name);
    chunk.index = index;
    chunk.totalChunks = totalChunksHint;
    chunk.compressedSize = compressedBytes.size();
    chunk.rawSize = rawSize;
    chunk.compression = std::string(compression);
    chunk.createdAt = time(0);
    chunk.data = std::string(compressedBytes);

    auto state(_state.lock());
    auto i = state->artifacts.find(name);
    if (i == state->artifacts.end())
        i = state->artifacts.emplace(std::string(name), std::map<uint64_t, Chunk>()).first;
    i->second.insert_or_assign(index, std::move(chunk));
}

void MemoryChunkStore::finalizeTotalChunks(std::string_view name, uint64_t trueCount)
{
    auto state(_state.lock());
    auto i = state->artifacts.find(name);
    if (i == state->artifacts.end())
        return;
    for (auto & [_, chunk] : i->second)
        chunk.totalChunks = trueCount;
}

std::optional<ArtifactMetadata> MemoryChunkStore::getMetadata(std::string_view name)
{
    return metadataFromHeaders(name, getChunkHeaders(name));
}

std::vector<Chunk> MemoryChunkStore::getChunksOrdered(std::string_view name)
{
    std::vector<Chunk> res;
    auto state(_state.lock());
    auto i = state->artifacts.find(name);
    if (i != state->artifacts.end())
        for (auto & [_, chunk] : i->second)
            res.push_back(chunk);
    return res;
}

std::vector<ChunkHeader> MemoryChunkStore::getChunkHeaders(std::string_view name)
{
    std::vector<ChunkHeader> res;
    auto state(_state.lock());
    auto i = state->artifacts.find(name);
    if (i != state->artifacts.end())
        for (auto & [_, chunk] : i->second)
            res.push_back(static_cast<const ChunkHeader &>(chunk));
    return res;
}

std::optional<Chunk> MemoryChunkStore::getChunk(std::string_view name, uint64_t index)
{
    auto state(_state.lock());
    auto i = state->artifacts.find(name);
    if (i == state->artifacts.end())
        return std::nullopt;
    auto j = i->second.find(index);
    if (j == i->second.end())
        return std::nullopt;
    return j->second;
}

void MemoryChunkStore::deleteAll(std::string_view name)
{
    auto state(_state.lock());
    auto i = state->artifacts.find(name);
    if (i != state->artifacts.end())
        state->artifacts.erase(i);
}

std::vector<ArtifactMetadata> MemoryChunkStore::listArtifacts()
{
    StringSet names;
    {
        auto state(_state.lock());
        for (auto & [name, _] : state->artifacts)
            names.insert(name);
    }

    std::vector<ArtifactMetadata> res;
    for (auto & name : names)
        if (auto md = getMetadata(name))
            res.push_back(std::move(*md));
    return res;
}

bool MemoryChunkStore::acquireLease(std::string_view name, std::string_view holder, std::chrono::seconds ttl)
{
    auto now = time(0);
    auto state(_state.lock());
    auto i = state->leases.find(name);
    if (i != state->leases.end() && i->second.holder != holder && i->second.expiresAt > now)
        return false;
    state->leases.insert_or_assign(std::string(name), Lease{std::string(holder), now + (time_t) ttl.count()});
    return true;
}

void MemoryChunkStore::releaseLease(std::string_view name, std::string_view holder)
{
    auto state(_state.lock());
    auto i = state->leases.find(name);
    if (i != state->leases.end() && i->second.holder == holder)
        state->leases.erase(i);
}

void MemoryChunkStore::shiftCreatedAt(std::string_view name, time_t delta)
{
    auto state(_state.lock());
    auto i = state->artifacts.find(name);
    if (i == state->artifacts.end())
        return;
    for (auto & [_, chunk] : i->second)
        chunk.createdAt += delta;
}

} // namespace chunkcache
