#include "chunkcache/store/sqlite-chunk-store.hh"
#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/logging.hh"

#include <sqlite3.h>

namespace chunkcache {

static const char * schema = R"sql(

create table if not exists Chunks (
    name        text not null,
    chunkIndex  integer not null,
    data        blob not null,
    totalChunks integer not null,
    rawSize     integer not null,
    compression text not null,
    createdAt   integer not null,
    primary key (name, chunkIndex)
);

create table if not exists Leases (
    name      text primary key not null,
    holder    text not null,
    expiresAt integer not null
);

)sql";

static const char * headerColumns = "chunkIndex, totalChunks, length(data), rawSize, compression, createdAt";

/**
 * Whether a SQLite failure is a property of the moment (locks, I/O,
 * space) rather than of the statement or the database file.
 */
static bool isStorageFailure(const SQLiteError & e)
{
    switch (e.errNo) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_PROTOCOL:
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
    case SQLITE_NOMEM:
        return true;
    default:
        return false;
    }
}

static ChunkHeader readHeader(std::string_view name, SQLiteStmt::Use & use)
{
    return ChunkHeader{
        .name = std::string(name),
        .index = (uint64_t) use.getInt(0),
        .totalChunks = use.getInt(1),
        .compressedSize = (uint64_t) use.getInt(2),
        .rawSize = (uint64_t) use.getInt(3),
        .compression = use.getStr(4),
        .createdAt = (time_t) use.getInt(5),
    };
}

static Chunk readChunk(std::string_view name, SQLiteStmt::Use & use)
{
    Chunk chunk;
    static_cast<ChunkHeader &>(chunk) = readHeader(name, use);
    chunk.data = use.getBlob(6);
    return chunk;
}

SQLiteChunkStore::SQLiteChunkStore(const Path & dbPath)
    : dbPath(dbPath)
{
    auto state(_state.lock());

    createDirs(dirOf(dbPath));

    try {
        state->db = SQLite(dbPath);

        state->db.useWAL();

        state->db.exec(schema);
    } catch (SQLiteError & e) {
        if (!isStorageFailure(e))
            throw;
        throw TransientStoreError("opening chunk store '%s': %s", dbPath, e.msg());
    }

    state->insertChunk.create(
        state->db,
        "insert or replace into Chunks(name, chunkIndex, data, totalChunks, rawSize, compression, createdAt) "
        "values (?, ?, ?, ?, ?, ?, ?)");

    state->finalizeTotal.create(state->db, "update Chunks set totalChunks = ? where name = ?");

    state->queryHeaders.create(
        state->db, fmt("select %s from Chunks where name = ? order by chunkIndex", headerColumns));

    state->queryChunk.create(
        state->db, fmt("select %s, data from Chunks where name = ? and chunkIndex = ?", headerColumns));

    state->queryChunks.create(
        state->db, fmt("select %s, data from Chunks where name = ? order by chunkIndex", headerColumns));

    state->deleteChunks.create(state->db, "delete from Chunks where name = ?");

    state->queryArtifacts.create(state->db, "select distinct name from Chunks order by name");

    state->upsertLease.create(
        state->db,
        R"(
            insert into Leases(name, holder, expiresAt) values (?1, ?2, ?3)
                on conflict (name) do update set holder = ?2, expiresAt = ?3
                where Leases.holder = ?2 or Leases.expiresAt <= ?4
        )");

    state->deleteLease.create(state->db, "delete from Leases where name = ? and holder = ?");
}

template<typename T, typename F>
T SQLiteChunkStore::withState(std::string_view what, F && fun)
{
    try {
        auto state(_state.lock());
        return fun(*state);
    } catch (SQLiteError & e) {
        if (!isStorageFailure(e))
            throw;
        throw TransientStoreError("%s in chunk store '%s': %s", what, dbPath, e.msg());
    }
}

void SQLiteChunkStore::insertChunk(
    std::string_view name,
    uint64_t index,
    std::string_view compressedBytes,
    int64_t totalChunksHint,
    uint64_t rawSize,
    std::string_view compression)
{
    withState<void>(fmt("inserting chunk %d of '%s'", index, name), [&](State & state) {
        state.insertChunk.use()(name)((int64_t) index)(
            (const unsigned char *) compressedBytes.data(), compressedBytes.size())(totalChunksHint)(
            (int64_t) rawSize)(compression)((int64_t) time(0))
            .exec();
    });
}

void SQLiteChunkStore::finalizeTotalChunks(std::string_view name, uint64_t trueCount)
{
    withState<void>(fmt("finalizing '%s'", name), [&](State & state) {
        SQLiteTxn txn(state.db);
        state.finalizeTotal.use()((int64_t) trueCount)(name).exec();
        txn.commit();
    });
}

std::vector<ChunkHeader> SQLiteChunkStore::getChunkHeaders(std::string_view name)
{
    return withState<std::vector<ChunkHeader>>(fmt("querying chunks of '%s'", name), [&](State & state) {
        std::vector<ChunkHeader> res;
        auto query(state.queryHeaders.use()(name));
        while (query.next())
            res.push_back(readHeader(name, query));
        return res;
    });
}

std::optional<ArtifactMetadata> SQLiteChunkStore::getMetadata(std::string_view name)
{
    return metadataFromHeaders(name, getChunkHeaders(name));
}

std::vector<Chunk> SQLiteChunkStore::getChunksOrdered(std::string_view name)
{
    return withState<std::vector<Chunk>>(fmt("fetching chunks of '%s'", name), [&](State & state) {
        std::vector<Chunk> res;
        auto query(state.queryChunks.use()(name));
        while (query.next())
            res.push_back(readChunk(name, query));
        return res;
    });
}

std::optional<Chunk> SQLiteChunkStore::getChunk(std::string_view name, uint64_t index)
{
    return withState<std::optional<Chunk>>(
        fmt("fetching chunk %d of '%s'", index, name), [&](State & state) -> std::optional<Chunk> {
            auto query(state.queryChunk.use()(name)((int64_t) index));
            if (!query.next())
                return std::nullopt;
            return readChunk(name, query);
        });
}

void SQLiteChunkStore::deleteAll(std::string_view name)
{
    withState<void>(fmt("deleting chunks of '%s'", name), [&](State & state) {
        SQLiteTxn txn(state.db);
        state.deleteChunks.use()(name).exec();
        debug("deleted %d chunk rows of '%s'", state.db.changes(), name);
        txn.commit();
    });
}

std::vector<ArtifactMetadata> SQLiteChunkStore::listArtifacts()
{
    auto names = withState<Strings>("listing artifacts", [&](State & state) {
        Strings names;
        auto query(state.queryArtifacts.use());
        while (query.next())
            names.push_back(query.getStr(0));
        return names;
    });

    std::vector<ArtifactMetadata> res;
    for (auto & name : names)
        if (auto md = getMetadata(name))
            res.push_back(std::move(*md));
    return res;
}

bool SQLiteChunkStore::acquireLease(std::string_view name, std::string_view holder, std::chrono::seconds ttl)
{
    return withState<bool>(fmt("acquiring lease on '%s'", name), [&](State & state) {
        auto now = time(0);
        SQLiteTxn txn(state.db);
        state.upsertLease.use()(name)(holder)((int64_t) (now + ttl.count()))((int64_t) now).exec();
        bool acquired = state.db.changes() > 0;
        txn.commit();
        return acquired;
    });
}

void SQLiteChunkStore::releaseLease(std::string_view name, std::string_view holder)
{
    withState<void>(fmt("releasing lease on '%s'", name), [&](State & state) {
        state.deleteLease.use()(name)(holder).exec();
    });
}

} // namespace chunkcache
