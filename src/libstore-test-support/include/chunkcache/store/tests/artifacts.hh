#pragma once
///@file

#include "chunkcache/store/integrity-validator.hh"
#include "chunkcache/util/types.hh"

#include <cstdint>

namespace chunkcache {

/**
 * Create an SQLite database at `path` with a table `table` holding
 * `records` rows. Each row carries `padding` bytes of text, which
 * makes the file grow predictably.
 */
void makeSampleArtifact(
    const Path & path, uint64_t records, const std::string & table = "wikipedia_articles", size_t padding = 100);

/**
 * Deterministic pseudo-random bytes that compress poorly.
 */
std::string makeNoise(size_t size, uint32_t seed = 1);

/**
 * Accepts every file that exists.
 */
class AcceptAllValidator : public IntegrityValidator
{
public:
    void check(const Path & path) override;
};

/**
 * Rejects everything and counts the calls.
 */
class RejectAllValidator : public IntegrityValidator
{
public:
    unsigned int calls = 0;

    void check(const Path & path) override;
};

} // namespace chunkcache
