#include "chunkcache/store/pathlocks.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/util.hh"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>

using namespace std::chrono_literals;

namespace chunkcache {

AutoCloseFD openLockFile(const Path & path, bool create)
{
    AutoCloseFD fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC | (create ? O_CREAT : 0), 0600);
    if (!fd && (create || errno != ENOENT))
        throw SysError("opening lock file '%1%'", path);
    return fd;
}

static int flockOperation(LockType lockType)
{
    switch (lockType) {
    case ltRead:
        return LOCK_SH;
    case ltWrite:
        return LOCK_EX;
    case ltNone:
        return LOCK_UN;
    }
    unreachable();
}

bool lockFile(Descriptor desc, LockType lockType, bool wait)
{
    int op = flockOperation(lockType) | (wait ? 0 : LOCK_NB);

    while (flock(desc, op) == -1) {
        checkInterrupt();
        if (!wait && errno == EWOULDBLOCK)
            return false;
        if (errno != EINTR)
            throw SysError("changing the lock on file descriptor %d", desc);
    }

    return true;
}

bool lockFileWithTimeout(Descriptor desc, LockType lockType, unsigned int timeout)
{
    if (timeout == 0)
        return lockFile(desc, lockType, true);

    /* flock() cannot time out, so retry the non-blocking form with a
       backoff of 10ms doubling up to 500ms. */
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::seconds(timeout);
    std::chrono::milliseconds delay = 10ms;

    for (;;) {
        checkInterrupt();
        if (lockFile(desc, lockType, false))
            return true;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left <= 0ms)
            return false;

        std::this_thread::sleep_for(std::min(delay, left));
        delay = std::min<std::chrono::milliseconds>(delay * 2, 500ms);
    }
}

PathLock::PathLock(const Path & path, unsigned int timeout, std::string_view identity)
    : path(path)
{
    debug("acquiring lock '%s' for '%s'", path, identity);

    fd = openLockFile(path, true);

    if (!lockFile(fd.get(), ltWrite, false)) {
        if (timeout > 0)
            printInfo("waiting for lock on '%s' (timeout: %us)...", identity, timeout);
        else
            printInfo("waiting for lock on '%s'...", identity);

        if (!lockFileWithTimeout(fd.get(), ltWrite, timeout))
            throw LockTimeout("timed out waiting for lock on '%s' after %u seconds", identity, timeout);
    }

    debug("lock acquired on '%s'", path);
}

PathLock::~PathLock()
{
    try {
        unlock();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void PathLock::unlock()
{
    if (!fd)
        return;
    lockFile(fd.get(), ltNone, false);
    fd.close();
    debug("lock released on '%s'", path);
}

} // namespace chunkcache
