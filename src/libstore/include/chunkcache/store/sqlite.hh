#pragma once
///@file

#include <string>

#include "chunkcache/util/error.hh"
#include "chunkcache/util/types.hh"

struct sqlite3;
struct sqlite3_stmt;

namespace chunkcache {

enum class SQLiteOpenMode {
    /**
     * Read-write, creating the database if it does not exist.
     */
    Normal,
    /**
     * An existing database, without write access. Used to inspect
     * artifacts.
     */
    ReadOnly,
};

/**
 * An open database connection, closed on destruction. Every statement
 * waits up to `store-timeout` seconds for locks held by other
 * connections.
 */
struct SQLite
{
    sqlite3 * db = nullptr;

    SQLite() {}

    SQLite(const Path & path, SQLiteOpenMode mode = SQLiteOpenMode::Normal);

    SQLite(const SQLite &) = delete;
    SQLite & operator=(const SQLite &) = delete;

    SQLite & operator=(SQLite && from) noexcept
    {
        std::swap(db, from.db);
        return *this;
    }

    ~SQLite();

    operator sqlite3 *()
    {
        return db;
    }

    /**
     * Switch to write-ahead logging, so that readers in other
     * processes do not block the writer.
     */
    void useWAL();

    /**
     * Run one or more statements that return no rows.
     */
    void exec(const std::string & stmt);

    /**
     * Rows modified by the most recent statement.
     */
    uint64_t changes();
};

/**
 * A prepared statement, finalized on destruction.
 */
struct SQLiteStmt
{
    sqlite3 * db = nullptr;
    sqlite3_stmt * stmt = nullptr;
    std::string sql;

    SQLiteStmt() {}

    SQLiteStmt(sqlite3 * db, const std::string & sql)
    {
        create(db, sql);
    }

    SQLiteStmt(const SQLiteStmt &) = delete;

    ~SQLiteStmt();

    void create(sqlite3 * db, const std::string & sql);

    /**
     * One execution of the statement: bind the parameters in order
     * with `operator()`, then `exec()` or iterate with `next()`. The
     * statement is reset when the `Use` is destroyed.
     *
     *   auto q(stmt.use()(name)((int64_t) index));
     *   while (q.next())
     *       ... q.getInt(0) ...
     */
    class Use
    {
        friend struct SQLiteStmt;

        SQLiteStmt & stmt;
        int curArg = 1;

        Use(SQLiteStmt & stmt);

        int step();

    public:

        ~Use();

        Use & operator()(std::string_view value);
        Use & operator()(int64_t value);

        /**
         * Bind a blob. An empty blob is stored as a zero-length blob,
         * not as NULL.
         */
        Use & operator()(const unsigned char * data, size_t len);

        void exec();

        /**
         * @return whether another row is available.
         */
        bool next();

        std::string getStr(int col);
        std::string getBlob(int col);
        int64_t getInt(int col);
    };

    Use use()
    {
        return Use(*this);
    }
};

/**
 * An immediate transaction that rolls back unless `commit()` is
 * reached.
 */
struct SQLiteTxn
{
    sqlite3 * db;
    bool active = false;

    SQLiteTxn(sqlite3 * db);

    void commit();

    ~SQLiteTxn();
};

struct SQLiteError : Error
{
    std::string path;
    /**
     * Primary SQLite result code, e.g. `SQLITE_BUSY`.
     */
    int errNo;
    int extendedErrNo;

    SQLiteError(const std::string & path, int errNo, int extendedErrNo, HintFmt && hf)
        : Error(std::move(hf))
        , path(path)
        , errNo(errNo)
        , extendedErrNo(extendedErrNo)
    {
    }

    /**
     * Throw the error currently recorded on `db`, with `fs` and `args`
     * describing what was being done.
     */
    template<typename... Args>
    [[noreturn]] static void throw_(sqlite3 * db, const std::string & fs, const Args &... args)
    {
        throw_(db, HintFmt(fs, args...));
    }

protected:

    [[noreturn]] static void throw_(sqlite3 * db, HintFmt && hf);
};

/**
 * The database stayed locked by another connection for longer than the
 * busy timeout.
 */
struct SQLiteBusy : SQLiteError
{
    using SQLiteError::SQLiteError;

    bool isTransient() const override
    {
        return true;
    }
};

} // namespace chunkcache
