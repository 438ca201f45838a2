#pragma once
///@file

#include "chunkcache/util/types.hh"

#include <cstdint>

namespace chunkcache {

/**
 * Decides whether an artifact file may be trusted.
 */
class IntegrityValidator
{
public:

    virtual ~IntegrityValidator() {}

    /**
     * @throws CorruptArtifactError with the reason if the artifact at
     * `path` is unusable.
     */
    virtual void check(const Path & path) = 0;

    /**
     * Like `check()`, but log the reason and return false instead of
     * throwing.
     */
    bool validate(const Path & path);
};

/**
 * Validates an artifact that is an SQLite database: it must open
 * read-only, pass `PRAGMA quick_check`, and contain a table holding a
 * minimum number of rows.
 */
class SQLiteArtifactValidator : public IntegrityValidator
{
    std::string table;
    uint64_t minRecords;

public:

    SQLiteArtifactValidator(std::string table, uint64_t minRecords);

    /**
     * Use the `validation-table` and `min-records` settings.
     */
    SQLiteArtifactValidator();

    void check(const Path & path) override;
};

} // namespace chunkcache
