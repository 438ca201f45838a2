#include "chunkcache/util/signals.hh"
#include "chunkcache/util/util.hh"
#include "chunkcache/util/sync.hh"

#include <map>
#include <thread>

#include <signal.h>

namespace chunkcache {

std::atomic<bool> unix::_isInterrupted = false;

/* At most one Interrupted per thread, and never while unwinding, where
   a second exception would terminate the process. */
static thread_local bool interruptThrown = false;

void unix::_interrupted()
{
    if (interruptThrown || std::uncaught_exceptions())
        return;
    interruptThrown = true;
    throw Interrupted("interrupted by the user");
}

namespace {

typedef uint64_t CallbackId;

struct Callbacks
{
    CallbackId nextId = 0;
    std::map<CallbackId, std::function<void()>> byId;
};

Sync<Callbacks> callbacks;

struct RegisteredCallback : InterruptCallback
{
    const CallbackId id;

    RegisteredCallback(CallbackId id)
        : id(id)
    {
    }

    ~RegisteredCallback() override
    {
        callbacks.lock()->byId.erase(id);
    }
};

sigset_t savedSignalMask;
bool haveSavedSignalMask = false;

} // namespace

void unix::triggerInterrupt()
{
    _isInterrupted = true;

    /* Walk by id without holding the lock during a call, so that a
       callback may itself register or unregister callbacks. */
    for (CallbackId next = 0;;) {
        std::function<void()> fun;
        {
            auto cbs(callbacks.lock());
            auto i = cbs->byId.lower_bound(next);
            if (i == cbs->byId.end())
                break;
            fun = i->second;
            next = i->first + 1;
        }
        try {
            fun();
        } catch (...) {
            ignoreExceptionInDestructor();
        }
    }
}

void unix::startSignalHandlerThread()
{
    if (sigprocmask(SIG_BLOCK, nullptr, &savedSignalMask))
        throw SysError("querying signal mask");
    haveSavedSignalMask = true;

    sigset_t set;
    sigemptyset(&set);
    for (auto sig : {SIGINT, SIGTERM, SIGHUP, SIGPIPE})
        sigaddset(&set, sig);
    if (int err = pthread_sigmask(SIG_BLOCK, &set, nullptr))
        throw SysError(err, "blocking signals");

    std::thread([set]() {
        while (true) {
            int sig = 0;
            if (sigwait(&set, &sig) == 0 && sig != SIGPIPE)
                triggerInterrupt();
        }
    }).detach();
}

void unix::restoreSignals()
{
    if (haveSavedSignalMask && sigprocmask(SIG_SETMASK, &savedSignalMask, nullptr))
        throw SysError("restoring signals");
}

std::unique_ptr<InterruptCallback> createInterruptCallback(std::function<void()> callback)
{
    auto cbs(callbacks.lock());
    auto id = cbs->nextId++;
    cbs->byId.emplace(id, std::move(callback));
    return std::make_unique<RegisteredCallback>(id);
}

} // namespace chunkcache
