#pragma once
///@file

#include "chunkcache/util/types.hh"
#include "chunkcache/util/error.hh"

#include <atomic>
#include <functional>
#include <memory>

namespace chunkcache {

/**
 * Thrown by `checkInterrupt()` after SIGINT, SIGTERM or SIGHUP. Not an
 * `Error`, so `catch (Error &)` blocks let it through.
 */
MakeError(Interrupted, BaseError);

namespace unix {

extern std::atomic<bool> _isInterrupted;

void _interrupted();

/**
 * Block SIGINT, SIGTERM, SIGHUP and SIGPIPE in this thread and every
 * thread it creates, and handle them on a dedicated thread that sets
 * the interrupt flag. The previous mask is kept for
 * `restoreSignals()`.
 */
void startSignalHandlerThread();

/**
 * Reinstate the signal mask from before `startSignalHandlerThread()`,
 * in a child process about to exec.
 */
void restoreSignals();

/**
 * Set the interrupt flag and run the interrupt callbacks, as the
 * signal thread does.
 */
void triggerInterrupt();

} // namespace unix

inline bool isInterrupted()
{
    return unix::_isInterrupted;
}

/**
 * Throw `Interrupted` if a termination signal has arrived. Called in
 * every loop that may run for long: copying chunks, waiting on locks,
 * waiting for a child.
 */
inline void checkInterrupt()
{
    if (isInterrupted())
        unix::_interrupted();
}

struct InterruptCallback
{
    virtual ~InterruptCallback() {};
};

/**
 * Run `callback` on the signal thread when an interrupt arrives, for
 * waking up code that blocks without polling `checkInterrupt()`. The
 * registration ends when the returned object is destroyed.
 */
std::unique_ptr<InterruptCallback> createInterruptCallback(std::function<void()> callback);

} // namespace chunkcache
