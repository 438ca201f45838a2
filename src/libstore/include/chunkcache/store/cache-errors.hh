#pragma once
/**
 * @file
 *
 * Errors raised by the chunk cache. Lower layers throw these;
 * `CacheOrchestrator` is the only place that decides whether one is
 * fatal or leads to a fallback.
 */

#include "chunkcache/util/error.hh"

namespace chunkcache {

MakeError(CacheError, Error);

/**
 * The number of chunk rows differs from the recorded total.
 */
MakeError(IncompleteCacheError, CacheError);

/**
 * A restored chunk or artifact does not have the recorded size.
 */
MakeError(SizeMismatchError, CacheError);

/**
 * The artifact failed integrity validation.
 */
MakeError(CorruptArtifactError, CacheError);

/**
 * The backing store could not complete an operation, but may if asked
 * again.
 */
class TransientStoreError : public CacheError
{
public:
    using CacheError::CacheError;

    bool isTransient() const override
    {
        return true;
    }
};

MakeError(RebuildFailure, CacheError);

/**
 * Another live process holds the upload lease on the chunk set.
 */
MakeError(LeaseUnavailable, CacheError);

/**
 * The artifact file yielded fewer bytes than its size promised.
 */
MakeError(ShortReadError, CacheError);

} // namespace chunkcache
