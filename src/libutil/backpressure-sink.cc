#include "chunkcache/util/backpressure-sink.hh"
#include "chunkcache/util/file-descriptor.hh"

namespace chunkcache {

AsyncFdSink::AsyncFdSink(Descriptor fd, size_t maxQueued)
    : fd(fd)
    , maxQueued(maxQueued)
{
    if (maxQueued == 0)
        throw Error("the write queue of an asynchronous sink must not be empty");
    workerThread = std::thread([this]() { worker(); });
}

AsyncFdSink::~AsyncFdSink()
{
    if (!workerThread.joinable())
        return;
    {
        /* Not finished, so nobody is going to look at the file:
           drop whatever is still queued. */
        auto state(state_.lock());
        state->queue.clear();
        state->quit = true;
    }
    wakeupCV.notify_all();
    workerThread.join();
}

void AsyncFdSink::worker()
{
    while (true) {
        std::string item;

        {
            auto state(state_.lock());
            while (!state->quit && state->queue.empty())
                state.wait(wakeupCV);
            if (state->queue.empty() && state->quit)
                return;
            item = std::move(state->queue.front());
            state->queue.pop_front();
        }

        try {
            writeFull(fd, item, false);
        } catch (...) {
            {
                auto state(state_.lock());
                state->error = std::current_exception();
                state->queue.clear();
                state->queued = 0;
            }
            readyCV.notify_all();
            return;
        }

        {
            auto state(state_.lock());
            state->queued -= item.size();
            state->written += item.size();
        }
        readyCV.notify_all();
    }
}

std::unique_ptr<InterruptCallback> AsyncFdSink::wakeOnInterrupt()
{
    /* Taking the lock orders the notification after a waiter's
       checkInterrupt(), so the wakeup cannot be lost. */
    return createInterruptCallback([this]() {
        auto state(state_.lock());
        readyCV.notify_all();
    });
}

void AsyncFdSink::operator()(std::string_view data)
{
    if (data.empty())
        return;

    auto interruptCallback = wakeOnInterrupt();

    {
        auto state(state_.lock());
        while (true) {
            checkInterrupt();
            if (state->error)
                std::rethrow_exception(state->error);
            if (state->quit)
                throw Error("write to a finished sink");
            if (state->queued == 0 || state->queued + data.size() <= maxQueued)
                break;
            state.wait(readyCV);
        }
        state->queue.emplace_back(data);
        state->queued += data.size();
        state->highWater = std::max(state->highWater, state->queued);
    }
    wakeupCV.notify_all();
}

void AsyncFdSink::waitReady()
{
    auto interruptCallback = wakeOnInterrupt();

    auto state(state_.lock());
    while (!state->error && state->queued >= maxQueued) {
        checkInterrupt();
        state.wait(readyCV);
    }
    if (state->error)
        std::rethrow_exception(state->error);
}

void AsyncFdSink::finish()
{
    state_.lock()->quit = true;
    wakeupCV.notify_all();
    if (workerThread.joinable())
        workerThread.join();
    auto state(state_.lock());
    if (state->error)
        std::rethrow_exception(state->error);
}

bool AsyncFdSink::good()
{
    return !state_.lock()->error;
}

size_t AsyncFdSink::highWaterMark()
{
    return state_.lock()->highWater;
}

uint64_t AsyncFdSink::bytesWritten()
{
    return state_.lock()->written;
}

} // namespace chunkcache
