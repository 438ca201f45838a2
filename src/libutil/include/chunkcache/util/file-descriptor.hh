#pragma once
///@file

#include "chunkcache/util/types.hh"
#include "chunkcache/util/error.hh"

#include <utility>

#include <unistd.h>

namespace chunkcache {

struct Sink;

using Descriptor = int;

const Descriptor INVALID_DESCRIPTOR = -1;

inline Descriptor getStandardOutput()
{
    return STDOUT_FILENO;
}

inline Descriptor getStandardError()
{
    return STDERR_FILENO;
}

/**
 * Everything from the current offset of `fd` to end of file.
 */
std::string readFile(Descriptor fd);

/**
 * Write all of `s`, retrying short writes. With `allowInterrupts`
 * a pending interrupt aborts the write between chunks.
 */
void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts = true);

/**
 * `writeFull` of `s` plus a newline.
 */
void writeLine(Descriptor fd, std::string s);

/**
 * Copy `fd` into `sink` until end of file.
 */
void drainFD(Descriptor fd, Sink & sink);

/**
 * Owns a descriptor and closes it on destruction.
 */
class AutoCloseFD
{
    Descriptor fd = INVALID_DESCRIPTOR;

public:
    AutoCloseFD() = default;

    AutoCloseFD(Descriptor fd)
        : fd(fd)
    {
    }

    AutoCloseFD(AutoCloseFD && other) noexcept
        : fd(std::exchange(other.fd, INVALID_DESCRIPTOR))
    {
    }

    AutoCloseFD & operator=(AutoCloseFD && other);

    AutoCloseFD(const AutoCloseFD &) = delete;
    AutoCloseFD & operator=(const AutoCloseFD &) = delete;

    ~AutoCloseFD();

    Descriptor get() const
    {
        return fd;
    }

    explicit operator bool() const
    {
        return fd != INVALID_DESCRIPTOR;
    }

    void close();

    /**
     * Flush the file to disk. Blocks.
     */
    void fsync() const;
};

/**
 * A close-on-exec pipe.
 */
struct Pipe
{
    AutoCloseFD readSide, writeSide;

    void create();
    void close();
};

namespace unix {

/**
 * Close every descriptor above stderr. Called in a forked child before
 * exec so it does not inherit store connections or lock files.
 */
void closeExtraFDs();

} // namespace unix

MakeError(EndOfFile, Error);

} // namespace chunkcache
