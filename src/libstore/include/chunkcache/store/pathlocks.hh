#pragma once
///@file

#include "chunkcache/util/file-descriptor.hh"
#include "chunkcache/util/types.hh"

namespace chunkcache {

/**
 * Open the lock file at `path`, creating it if `create` is set. Without
 * `create`, a missing file gives an empty `AutoCloseFD` instead of an
 * error.
 */
AutoCloseFD openLockFile(const Path & path, bool create);

enum LockType { ltRead, ltWrite, ltNone };

/**
 * Take, change or drop an flock(2) lock. Without `wait`, returns false
 * if another descriptor holds a conflicting lock.
 */
bool lockFile(Descriptor desc, LockType lockType, bool wait);

/**
 * Like `lockFile(desc, lockType, true)`, but give up after `timeout`
 * seconds. A timeout of 0 waits forever.
 *
 * @return whether the lock was acquired.
 */
bool lockFileWithTimeout(Descriptor desc, LockType lockType, unsigned int timeout);

/**
 * An exclusive lock on a lock file, held for the lifetime of the
 * object.
 */
class PathLock
{
    AutoCloseFD fd;
    Path path;

public:

    /**
     * @param identity What the lock protects, for messages.
     * @throws LockTimeout if the lock is still held elsewhere after
     * `timeout` seconds.
     */
    PathLock(const Path & path, unsigned int timeout, std::string_view identity);

    PathLock(PathLock &&) = default;

    ~PathLock();

    void unlock();

    const Path & lockPath() const
    {
        return path;
    }
};

MakeError(LockTimeout, Error);

} // namespace chunkcache
