#include "chunkcache/store/sqlite.hh"
#include "chunkcache/store/globals.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/util.hh"

#include <sqlite3.h>

namespace chunkcache {

[[noreturn]] void SQLiteError::throw_(sqlite3 * db, HintFmt && hf)
{
    int err = sqlite3_errcode(db);
    int extended = sqlite3_extended_errcode(db);
    auto file = sqlite3_db_filename(db, nullptr);
    std::string path = file && *file ? file : "(in-memory)";

    if (err == SQLITE_BUSY || err == SQLITE_PROTOCOL)
        throw SQLiteBusy(path, err, extended, HintFmt("SQLite database '%s' is busy", path));

    throw SQLiteError(
        path,
        err,
        extended,
        HintFmt("%s: %s (in '%s')", Uncolored(hf.str()), sqlite3_errmsg(db), path));
}

SQLite::SQLite(const Path & path, SQLiteOpenMode mode)
{
    int flags = mode == SQLiteOpenMode::ReadOnly ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (int ret = sqlite3_open_v2(path.c_str(), &db, flags, nullptr); ret != SQLITE_OK) {
        /* sqlite3_open_v2() hands out a handle even on failure. */
        sqlite3_close(db);
        db = nullptr;
        throw SQLiteError(
            path, ret, ret, HintFmt("cannot open SQLite database '%s': %s", path, sqlite3_errstr(ret)));
    }

    if (sqlite3_busy_timeout(db, settings.storeTimeout * 1000) != SQLITE_OK)
        SQLiteError::throw_(db, "setting the busy timeout");
}

SQLite::~SQLite()
{
    try {
        if (db && sqlite3_close(db) != SQLITE_OK)
            SQLiteError::throw_(db, "closing database");
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void SQLite::useWAL()
{
    exec("pragma main.journal_mode = wal; pragma synchronous = normal;");
}

void SQLite::exec(const std::string & stmt)
{
    checkInterrupt();
    if (sqlite3_exec(db, stmt.c_str(), nullptr, nullptr, nullptr) != SQLITE_OK)
        SQLiteError::throw_(db, "executing SQLite statement '%s'", stmt);
}

uint64_t SQLite::changes()
{
    return sqlite3_changes(db);
}

void SQLiteStmt::create(sqlite3 * db, const std::string & sql)
{
    checkInterrupt();
    if (stmt)
        throw Error("SQLite statement '%s' is already prepared", this->sql);
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        SQLiteError::throw_(db, "preparing statement '%s'", sql);
    this->db = db;
    this->sql = sql;
}

SQLiteStmt::~SQLiteStmt()
{
    try {
        if (stmt && sqlite3_finalize(stmt) != SQLITE_OK)
            SQLiteError::throw_(db, "finalizing statement '%s'", sql);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

SQLiteStmt::Use::Use(SQLiteStmt & stmt)
    : stmt(stmt)
{
    if (!stmt.stmt)
        throw Error("using an unprepared SQLite statement");
    /* The result is that of the previous step, which has been
       reported already. */
    sqlite3_reset(stmt.stmt);
    sqlite3_clear_bindings(stmt.stmt);
}

SQLiteStmt::Use::~Use()
{
    sqlite3_reset(stmt.stmt);
}

SQLiteStmt::Use & SQLiteStmt::Use::operator()(std::string_view value)
{
    if (sqlite3_bind_text64(stmt.stmt, curArg++, value.data(), value.size(), SQLITE_TRANSIENT, SQLITE_UTF8)
        != SQLITE_OK)
        SQLiteError::throw_(stmt.db, "binding argument %d of '%s'", curArg - 1, stmt.sql);
    return *this;
}

SQLiteStmt::Use & SQLiteStmt::Use::operator()(int64_t value)
{
    if (sqlite3_bind_int64(stmt.stmt, curArg++, value) != SQLITE_OK)
        SQLiteError::throw_(stmt.db, "binding argument %d of '%s'", curArg - 1, stmt.sql);
    return *this;
}

SQLiteStmt::Use & SQLiteStmt::Use::operator()(const unsigned char * data, size_t len)
{
    int r = len == 0 ? sqlite3_bind_zeroblob(stmt.stmt, curArg++, 0)
                     : sqlite3_bind_blob64(stmt.stmt, curArg++, data, len, SQLITE_TRANSIENT);
    if (r != SQLITE_OK)
        SQLiteError::throw_(stmt.db, "binding argument %d of '%s'", curArg - 1, stmt.sql);
    return *this;
}

int SQLiteStmt::Use::step()
{
    checkInterrupt();
    return sqlite3_step(stmt.stmt);
}

void SQLiteStmt::Use::exec()
{
    int r = step();
    if (r == SQLITE_ROW)
        throw Error("SQLite statement '%s' unexpectedly returned rows", stmt.sql);
    if (r != SQLITE_DONE)
        SQLiteError::throw_(stmt.db, "executing SQLite statement '%s'", stmt.sql);
}

bool SQLiteStmt::Use::next()
{
    int r = step();
    if (r == SQLITE_ROW)
        return true;
    if (r != SQLITE_DONE)
        SQLiteError::throw_(stmt.db, "executing SQLite query '%s'", stmt.sql);
    return false;
}

std::string SQLiteStmt::Use::getStr(int col)
{
    auto s = (const char *) sqlite3_column_text(stmt.stmt, col);
    if (!s)
        throw Error("column %d of '%s' is NULL", col, stmt.sql);
    return std::string(s, sqlite3_column_bytes(stmt.stmt, col));
}

std::string SQLiteStmt::Use::getBlob(int col)
{
    auto data = (const char *) sqlite3_column_blob(stmt.stmt, col);
    return data ? std::string(data, sqlite3_column_bytes(stmt.stmt, col)) : std::string();
}

int64_t SQLiteStmt::Use::getInt(int col)
{
    return sqlite3_column_int64(stmt.stmt, col);
}

SQLiteTxn::SQLiteTxn(sqlite3 * db)
    : db(db)
{
    /* Take the write lock up front, so the busy timeout applies here
       rather than to a later statement inside the transaction. */
    if (sqlite3_exec(db, "begin immediate", nullptr, nullptr, nullptr) != SQLITE_OK)
        SQLiteError::throw_(db, "starting transaction");
    active = true;
}

void SQLiteTxn::commit()
{
    if (sqlite3_exec(db, "commit", nullptr, nullptr, nullptr) != SQLITE_OK)
        SQLiteError::throw_(db, "committing transaction");
    active = false;
}

SQLiteTxn::~SQLiteTxn()
{
    try {
        if (active && sqlite3_exec(db, "rollback", nullptr, nullptr, nullptr) != SQLITE_OK)
            SQLiteError::throw_(db, "aborting transaction");
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

} // namespace chunkcache
