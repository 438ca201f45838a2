#include "chunkcache/util/serialise.hh"
#include "chunkcache/util/signals.hh"

#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace chunkcache {

void BufferedSink::operator()(std::string_view data)
{
    /* A piece that would not fit goes through directly, after what
       is already pending. */
    if (pending.size() + data.size() >= bufSize) {
        flush();
        writeUnbuffered(data);
        return;
    }
    pending.append(data);
}

void BufferedSink::flush()
{
    if (pending.empty())
        return;
    std::string out;
    out.swap(pending);
    writeUnbuffered(out);
}

void Source::operator()(char * data, size_t len)
{
    for (size_t done = 0; done < len;)
        done += read(data + done, len - done);
}

size_t FdSource::read(char * data, size_t len)
{
    while (true) {
        checkInterrupt();
        auto n = ::read(fd, data, len);
        if (n > 0)
            return n;
        if (n == 0)
            throw EndOfFile("unexpected end-of-file");
        if (errno != EINTR)
            throw SysError("reading from file");
    }
}

size_t StringSource::read(char * data, size_t len)
{
    if (pos == s.size())
        throw EndOfFile("end of string reached");
    auto n = s.copy(data, len, pos);
    pos += n;
    return n;
}

} // namespace chunkcache
