#include "chunkcache/store/tests/artifacts.hh"
#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/sqlite.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/strings.hh"

#include <random>

namespace chunkcache {

void makeSampleArtifact(const Path & path, uint64_t records, const std::string & table, size_t padding)
{
    auto quoted = "\"" + replaceStrings(table, "\"", "\"\"") + "\"";

    SQLite db(path);
    db.exec(fmt("create table %s (id integer primary key, title text not null, body text not null)", quoted));

    SQLiteTxn txn(db);
    SQLiteStmt insert(db, fmt("insert into %s (title, body) values (?, ?)", quoted));
    for (uint64_t i = 0; i < records; ++i)
        insert.use()(fmt("article %d", i))(makeNoise(padding, i + 1)).exec();
    txn.commit();
}

std::string makeNoise(size_t size, uint32_t seed)
{
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist('a', 'z');
    std::string s(size, 0);
    for (auto & c : s)
        c = (char) dist(gen);
    return s;
}

void AcceptAllValidator::check(const Path & path)
{
    if (!pathExists(path))
        throw CorruptArtifactError("artifact '%s' does not exist", path);
}

void RejectAllValidator::check(const Path & path)
{
    calls++;
    throw CorruptArtifactError("artifact '%s' is rejected by this validator", path);
}

} // namespace chunkcache
