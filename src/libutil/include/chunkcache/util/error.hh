#pragma once
/**
 * @file
 *
 * Errors in chunkcache are exceptions derived from `BaseError`. Each
 * carries an `ErrorInfo`: a message plus the context (`Trace`s) that
 * callers add while the exception propagates. Rendering to text is
 * left to the logger, so the same error can be shown as a terminal
 * message or as a JSON object.
 */

#include "chunkcache/util/fmt.hh"

#include <cstring>
#include <list>
#include <optional>
#include <source_location>
#include <string_view>

namespace chunkcache {

typedef enum {
    lvlError = 0,
    lvlWarn,
    lvlNotice,
    lvlInfo,
    lvlTalkative,
    lvlChatty,
    lvlDebug,
    lvlVomit
} Verbosity;

/**
 * Context added to an error on its way up, e.g. "while restoring
 * artifact 'wiki'".
 */
struct Trace
{
    HintFmt hint;
};

struct ErrorInfo
{
    Verbosity level = lvlError;
    HintFmt msg;

    /**
     * Outermost context first.
     */
    std::list<Trace> traces;

    /**
     * Process exit status when this error ends the program.
     */
    unsigned int status = 1;
};

/**
 * Render `einfo` for a terminal. Unless `showTrace` is set, only the
 * outermost few traces are shown.
 */
std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace);

/**
 * Root of the chunkcache exceptions. Catch `Error` rather than this,
 * so that `Interrupted` gets through.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    /**
     * `err` rendered, computed on first use.
     */
    mutable std::optional<std::string> what_;

    const std::string & calcWhat() const;

public:

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.msg = HintFmt(fs, args...)}
    {
    }

    BaseError(HintFmt hint)
        : err{.msg = hint}
    {
    }

    BaseError(const ErrorInfo & e)
        : err(e)
    {
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    const std::string & msg() const
    {
        return calcWhat();
    }

    const ErrorInfo & info() const
    {
        return err;
    }

    template<typename... Args>
    void addTrace(std::string_view fs, const Args &... args)
    {
        addTrace(HintFmt(std::string(fs), args...));
    }

    void addTrace(HintFmt hint);

    /**
     * Whether repeating the failed operation may succeed. Bounded
     * retry loops only absorb errors for which this returns true.
     */
    virtual bool isTransient() const
    {
        return false;
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * What to catch for any failed system call.
 */
MakeError(SystemError, Error);

/**
 * A failed POSIX call. The message gets `strerror(errNo)` appended.
 */
class SysError : public SystemError
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : SystemError(HintFmt("%1%: %2%", Uncolored(HintFmt(args...).str()), strerror(errNo)))
        , errNo(errNo)
    {
    }

    /**
     * Uses the current `errno`, so nothing may touch it between the
     * failing call and this constructor.
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

/**
 * Report an internal inconsistency on stderr and abort().
 */
[[noreturn]]
void panic(std::string_view msg);

/**
 * `panic()` with the source location, for code paths that cannot be
 * reached.
 */
[[gnu::noinline, gnu::cold, noreturn]] void unreachable(std::source_location loc = std::source_location::current());

} // namespace chunkcache
