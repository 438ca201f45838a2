#include "chunkcache/util/processes.hh"
#include "chunkcache/util/current-process.hh"
#include "chunkcache/util/environment-variables.hh"
#include "chunkcache/util/file-descriptor.hh"
#include "chunkcache/util/finally.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/serialise.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/sync.hh"
#include "chunkcache/util/util.hh"

#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <functional>
#include <thread>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#  include <sys/prctl.h>
#endif

namespace chunkcache {

namespace {

/**
 * A forked child. If it has not been reaped by the time this goes out
 * of scope, it (or its whole process group) is killed and reaped.
 */
class Child
{
    pid_t pid;
    bool ownGroup;

public:
    Child(pid_t pid, bool ownGroup)
        : pid(pid)
        , ownGroup(ownGroup)
    {
    }

    Child(const Child &) = delete;

    ~Child()
    {
        if (pid == -1)
            return;
        debug("killing child process %d", pid);
        if (::kill(ownGroup ? -pid : pid, SIGKILL) == -1)
            logError(SysError("killing process %d", pid).info());
        try {
            wait();
        } catch (...) {
            ignoreExceptionInDestructor();
        }
    }

    pid_t get() const
    {
        return pid;
    }

    /**
     * Block until the child has exited, but leave it unreaped so its
     * pid (and process group id) cannot be reused yet.
     */
    void waitExited()
    {
        if (pid == -1)
            unreachable();
        siginfo_t info;
        while (waitid(P_PID, pid, &info, WEXITED | WNOWAIT) == -1) {
            if (errno != EINTR)
                throw SysError("waiting for process %d", pid);
            checkInterrupt();
        }
    }

    int wait()
    {
        if (pid == -1)
            unreachable();
        int status;
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR)
                throw SysError("waiting for process %d", pid);
            checkInterrupt();
        }
        pid = -1;
        return status;
    }
};

/* Fork, run `body` in the child and never return there. An exception
   from `body` is printed to stderr and the child exits with status 1. */
pid_t forkChild(std::function<void()> body)
{
    pid_t pid = fork();
    if (pid == -1)
        throw SysError("forking a child process");
    if (pid > 0)
        return pid;

    try {
#ifdef __linux__
        if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1)
            throw SysError("setting the parent death signal");
#endif
        body();
    } catch (std::exception & e) {
        writeToStderr(std::string("chunkcache: ") + e.what() + "\n");
    }
    _exit(1);
}

} // namespace

void runProgram2(const RunOptions & options)
{
    checkInterrupt();

    Pipe out;
    if (options.standardOut)
        out.create();

    /* Everything the child needs is allocated before fork(). */
    Strings argList(options.args);
    argList.push_front(options.program);
    auto argv = stringsToCharPtrs(argList);

    Child child(
        forkChild([&] {
            if (options.timeout && setsid() == -1)
                throw SysError("starting a new session");
            for (auto & [name, value] : options.environment)
                if (setEnv(name.c_str(), value.c_str()) == -1)
                    throw SysError("setting environment variable '%s'", name);
            if (options.standardOut && dup2(out.writeSide.get(), STDOUT_FILENO) == -1)
                throw SysError("redirecting stdout");
            if (options.mergeStderrToStdout && dup2(STDOUT_FILENO, STDERR_FILENO) == -1)
                throw SysError("redirecting stderr to stdout");
            if (options.chdir && ::chdir(options.chdir->c_str()) == -1)
                throw SysError("changing directory to '%s'", *options.chdir);

            unix::closeExtraFDs();
            restoreProcessContext();

            if (options.lookupPath)
                execvp(options.program.c_str(), argv.data());
            else
                execv(options.program.c_str(), argv.data());
            throw SysError("executing '%1%'", options.program);
        }),
        options.timeout.has_value());

    out.writeSide.close();

    /* With a timeout, a watchdog thread kills the child's process group
       at the deadline while this thread drains and reaps as usual. */
    struct Deadline
    {
        bool finished = false;
        bool expired = false;
    };
    Sync<Deadline> deadline_;
    std::condition_variable wakeup;
    std::thread watchdog;

    auto stopWatchdog = [&] {
        if (!watchdog.joinable())
            return;
        deadline_.lock()->finished = true;
        wakeup.notify_all();
        watchdog.join();
    };
    Finally cleanup(stopWatchdog);

    if (options.timeout) {
        auto group = child.get();
        auto until = std::chrono::steady_clock::now() + *options.timeout;
        watchdog = std::thread([&deadline_, &wakeup, group, until] {
            auto state(deadline_.lock());
            while (!state->finished)
                if (state.wait_until(wakeup, until) == std::cv_status::timeout && !state->finished) {
                    state->expired = true;
                    ::kill(-group, SIGKILL);
                    return;
                }
        });
    }

    if (options.standardOut)
        drainFD(out.readSide.get(), *options.standardOut);

    /* The watchdog must be gone before the child is reaped, or it could
       signal a recycled process group id. */
    child.waitExited();
    stopWatchdog();
    int status = child.wait();

    if (deadline_.lock()->expired) {
        ExecError e(status, "program '%1%' timed out after %2% seconds", options.program, options.timeout->count());
        e.timedOut = true;
        throw e;
    }

    if (!statusOk(status))
        throw ExecError(status, "program '%1%' %2%", options.program, statusToString(status));
}

std::string runProgram(Path program, bool lookupPath, const Strings & args)
{
    StringSink sink;
    runProgram2({.program = program, .lookupPath = lookupPath, .args = args, .standardOut = &sink});
    return std::move(sink.s);
}

std::string statusToString(int status)
{
    if (statusOk(status))
        return "succeeded";
    if (WIFEXITED(status))
        return fmt("failed with exit code %1%", WEXITSTATUS(status));
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        return fmt("failed due to signal %1% (%2%)", sig, strsignal(sig));
    }
    return "died abnormally";
}

bool statusOk(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace chunkcache
