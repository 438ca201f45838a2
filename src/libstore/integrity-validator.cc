#include "chunkcache/store/integrity-validator.hh"
#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/globals.hh"
#include "chunkcache/store/sqlite.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/strings.hh"

#include <sys/stat.h>

namespace chunkcache {

bool IntegrityValidator::validate(const Path & path)
{
    try {
        check(path);
        return true;
    } catch (CorruptArtifactError & e) {
        logWarning(e.info());
        return false;
    }
}

SQLiteArtifactValidator::SQLiteArtifactValidator(std::string table, uint64_t minRecords)
    : table(std::move(table))
    , minRecords(minRecords)
{
}

SQLiteArtifactValidator::SQLiteArtifactValidator()
    : SQLiteArtifactValidator(settings.validationTable, settings.minRecords)
{
}

static std::string quoteIdentifier(std::string_view id)
{
    return "\"" + replaceStrings(std::string(id), "\"", "\"\"") + "\"";
}

void SQLiteArtifactValidator::check(const Path & path)
{
    auto st = maybeStat(path);
    if (!st)
        throw CorruptArtifactError("artifact '%s' does not exist", path);
    if (!S_ISREG(st->st_mode))
        throw CorruptArtifactError("artifact '%s' is not a regular file", path);
    if (st->st_size == 0)
        throw CorruptArtifactError("artifact '%s' is empty", path);

    try {
        SQLite db(path, SQLiteOpenMode::ReadOnly);

        {
            SQLiteStmt quickCheck(db, "pragma quick_check");
            auto use(quickCheck.use());
            Strings problems;
            while (use.next()) {
                auto line = use.getStr(0);
                if (line != "ok")
                    problems.push_back(line);
            }
            if (!problems.empty())
                throw CorruptArtifactError(
                    "artifact '%s' failed the SQLite consistency check: %s",
                    path,
                    concatStringsSep("; ", problems));
        }

        {
            SQLiteStmt tableExists(db, "select count(*) from sqlite_master where type = 'table' and name = ?");
            auto use(tableExists.use()(table));
            if (!use.next() || use.getInt(0) == 0)
                throw CorruptArtifactError("artifact '%s' lacks the table '%s'", path, table);
        }

        SQLiteStmt countRows(db, "select count(*) from " + quoteIdentifier(table));
        auto use(countRows.use());
        uint64_t rows = use.next() ? use.getInt(0) : 0;
        if (rows < minRecords)
            throw CorruptArtifactError(
                "artifact '%s' has %d rows in table '%s', expected at least %d", path, rows, table, minRecords);

        debug("artifact '%s' is valid (%d rows in '%s')", path, rows, table);
    } catch (SQLiteError & e) {
        throw CorruptArtifactError("artifact '%s' is not a usable SQLite database: %s", path, e.msg());
    } catch (CorruptArtifactError &) {
        throw;
    } catch (Error & e) {
        throw CorruptArtifactError("cannot open artifact '%s': %s", path, e.msg());
    }
}

} // namespace chunkcache
