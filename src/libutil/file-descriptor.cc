#include "chunkcache/util/file-descriptor.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/serialise.hh"
#include "chunkcache/util/util.hh"

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>

#include <array>

namespace chunkcache {

std::string readFile(Descriptor fd)
{
    struct stat st;
    if (fstat(fd, &st) == -1)
        throw SysError("getting the size of file descriptor %d", fd);

    StringSink sink(st.st_size);
    drainFD(fd, sink);
    return std::move(sink.s);
}

void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts)
{
    while (!s.empty()) {
        if (allowInterrupts)
            checkInterrupt();
        auto n = ::write(fd, s.data(), s.size());
        if (n >= 0) {
            s.remove_prefix(n);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN) {
            /* The descriptor was handed to us in non-blocking mode
               (e.g. a log fd shared with a supervisor). */
            struct pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
            if (poll(&pfd, 1, -1) == -1 && errno != EINTR)
                throw SysError("waiting for file descriptor %d to become writable", fd);
            continue;
        }
        throw SysError("writing to file descriptor %d", fd);
    }
}

void writeLine(Descriptor fd, std::string s)
{
    s.push_back('\n');
    writeFull(fd, s);
}

void drainFD(Descriptor fd, Sink & sink)
{
    std::array<char, 64 * 1024> buf;
    for (;;) {
        checkInterrupt();
        auto n = ::read(fd, buf.data(), buf.size());
        if (n == 0)
            return;
        if (n > 0)
            sink({buf.data(), (size_t) n});
        else if (errno != EINTR)
            throw SysError("reading from file descriptor %d", fd);
    }
}

AutoCloseFD & AutoCloseFD::operator=(AutoCloseFD && other)
{
    if (this != &other) {
        close();
        fd = std::exchange(other.fd, INVALID_DESCRIPTOR);
    }
    return *this;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoCloseFD::close()
{
    if (fd == INVALID_DESCRIPTOR)
        return;
    auto old = std::exchange(fd, INVALID_DESCRIPTOR);
    if (::close(old) == -1)
        throw SysError("closing file descriptor %d", old);
}

void AutoCloseFD::fsync() const
{
    if (fd != INVALID_DESCRIPTOR && ::fsync(fd) == -1)
        throw SysError("flushing file descriptor %d to disk", fd);
}

void Pipe::create()
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1)
        throw SysError("creating a pipe");
    readSide = fds[0];
    writeSide = fds[1];
}

void Pipe::close()
{
    readSide.close();
    writeSide.close();
}

void unix::closeExtraFDs()
{
    /* Between fork() and exec(): no allocation. */
    long maxFD = sysconf(_SC_OPEN_MAX);
    for (int fd = STDERR_FILENO + 1; fd < maxFD; ++fd)
        ::close(fd);
}

} // namespace chunkcache
