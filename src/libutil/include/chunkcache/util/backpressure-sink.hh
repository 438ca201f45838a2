#pragma once
///@file

#include "chunkcache/util/serialise.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/sync.hh"

#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <thread>

namespace chunkcache {

/**
 * A sink with a bounded amount of buffered data. Producers call
 * `waitReady()` before producing the next piece of data, so that data
 * is generated no faster than the sink can get rid of it.
 */
struct BackpressureSink : FinishSink
{
    /**
     * Block until the sink has room for more data. Rethrows an error
     * that occurred while writing earlier data.
     */
    virtual void waitReady() = 0;
};

/**
 * A `BackpressureSink` that writes to a file descriptor from a
 * background thread. At most `maxQueued` bytes are held in memory;
 * a write that would exceed that bound blocks until the writer thread
 * has drained enough of the queue. A single write larger than the
 * bound is accepted once the queue is empty.
 *
 * Errors from the writer thread are reported by the next call to
 * `operator()`, `waitReady()` or `finish()`. `finish()` must be
 * called to know that all data reached the file descriptor.
 */
class AsyncFdSink : public BackpressureSink
{
    Descriptor fd;
    const size_t maxQueued;

    struct State
    {
        std::deque<std::string> queue;
        /**
         * Bytes accepted but not yet written, including the piece the
         * writer thread is currently working on.
         */
        size_t queued = 0;
        size_t highWater = 0;
        uint64_t written = 0;
        bool quit = false;
        std::exception_ptr error;
    };

    Sync<State> state_;

    std::condition_variable wakeupCV, readyCV;

    std::thread workerThread;

    void worker();

    std::unique_ptr<InterruptCallback> wakeOnInterrupt();

public:

    AsyncFdSink(Descriptor fd, size_t maxQueued);

    ~AsyncFdSink();

    void operator()(std::string_view data) override;

    void waitReady() override;

    void finish() override;

    bool good() override;

    /**
     * The largest number of bytes that were buffered at any one time.
     */
    size_t highWaterMark();

    uint64_t bytesWritten();
};

} // namespace chunkcache
