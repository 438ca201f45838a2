#pragma once
///@file

#include <functional>
#include <memory>

#include "chunkcache/util/types.hh"
#include "chunkcache/util/util.hh"
#include "chunkcache/util/file-descriptor.hh"

namespace chunkcache {

/**
 * Somewhere to push bytes: a file, a codec, a bounded queue.
 */
struct Sink
{
    virtual ~Sink() {}

    virtual void operator()(std::string_view data) = 0;

    /**
     * False once the sink has failed and further data would be lost.
     */
    virtual bool good()
    {
        return true;
    }
};

/**
 * A sink that must be told explicitly when no more data is coming, so
 * that it can flush trailers (a compressor) or report deferred errors
 * (an asynchronous writer).
 */
struct FinishSink : virtual Sink
{
    virtual void finish() = 0;
};

/**
 * Collects small writes into `bufSize` pieces before handing them to
 * `writeUnbuffered()`. Not thread-safe.
 */
struct BufferedSink : virtual Sink
{
    const size_t bufSize;

    BufferedSink(size_t bufSize = 32 * 1024)
        : bufSize(bufSize)
    {
    }

    void operator()(std::string_view data) override;

    void flush();

protected:

    virtual void writeUnbuffered(std::string_view data) = 0;

private:
    std::string pending;
};

/**
 * Somewhere to pull bytes from.
 */
struct Source
{
    virtual ~Source() {}

    /**
     * Fill `data` with exactly `len` bytes.
     *
     * @throws EndOfFile if the source runs dry first.
     */
    void operator()(char * data, size_t len);

    /**
     * Read between 1 and `len` bytes into `data`, blocking until at
     * least one is available.
     *
     * @throws EndOfFile if there is no more data.
     */
    virtual size_t read(char * data, size_t len) = 0;
};

/**
 * Reads straight from a file descriptor, retrying on `EINTR` and
 * honouring interrupts.
 */
struct FdSource : Source
{
    const Descriptor fd;

    FdSource(Descriptor fd)
        : fd(fd)
    {
    }

    FdSource(const FdSource &) = delete;
    FdSource & operator=(const FdSource &) = delete;

    size_t read(char * data, size_t len) override;
};

struct StringSink : Sink
{
    std::string s;

    StringSink() {}

    explicit StringSink(size_t reservedSize)
    {
        s.reserve(reservedSize);
    }

    void operator()(std::string_view data) override
    {
        s.append(data);
    }
};

/**
 * Reads from a string it does not own.
 */
struct StringSource : Source
{
    std::string_view s;
    size_t pos = 0;

    /* Would dangle as soon as the temporary dies. */
    StringSource(std::string &&) = delete;

    StringSource(std::string_view s)
        : s(s)
    {
    }

    StringSource(const std::string & str)
        : s(str)
    {
    }

    size_t read(char * data, size_t len) override;
};

/**
 * Adapts a callback to the `Sink` interface.
 */
struct LambdaSink : Sink
{
    typedef std::function<void(std::string_view data)> data_t;

    data_t dataFun;

    LambdaSink(const data_t & dataFun)
        : dataFun(dataFun)
    {
    }

    void operator()(std::string_view data) override
    {
        dataFun(data);
    }
};

} // namespace chunkcache
