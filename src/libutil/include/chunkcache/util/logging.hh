#pragma once
///@file

#include "chunkcache/util/error.hh"
#include "chunkcache/util/configuration.hh"
#include "chunkcache/util/file-descriptor.hh"

#include <memory>
#include <variant>
#include <vector>

namespace chunkcache {

typedef enum {
    actUnknown = 0,
    actEnsure = 100,
    actUpload = 101,
    actRestore = 102,
    actRebuild = 103,
} ActivityType;

typedef enum {
    resProgress = 105,
    resRebuildLogLine = 107,
} ResultType;

typedef uint64_t ActivityId;

struct LoggerSettings : Config
{
    Setting<bool> showTrace{
        this,
        false,
        "show-trace",
        R"(
          Whether chunkcache should print out the full trace of context
          attached to an error (for example which artifact and which
          chunk was being processed).
        )"};
};

extern LoggerSettings loggerSettings;

class Logger
{
public:

    typedef std::variant<uint64_t, std::string> Field;
    typedef std::vector<Field> Fields;

    virtual ~Logger() {}

    /**
     * Flush anything buffered before the process exits.
     */
    virtual void stop() {};

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);

    virtual void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) {};

    virtual void stopActivity(ActivityId act) {};

    virtual void result(ActivityId act, ResultType type, const Fields & fields) {};

    /**
     * Write a line of program output (as opposed to a log message) to
     * stdout.
     */
    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    inline void cout(const Args &... args)
    {
        writeToStdout(fmt(args...));
    }
};

ActivityId getCurActivity();
void setCurActivity(const ActivityId activityId);

/**
 * A long-running operation (an upload, a restore, a rebuild) that
 * reports progress to the logger while it is alive.
 */
struct Activity
{
    Logger & logger;

    const ActivityId id;

    Activity(
        Logger & logger,
        Verbosity lvl,
        ActivityType type,
        const std::string & s = "",
        const Logger::Fields & fields = {},
        ActivityId parent = getCurActivity());

    Activity(const Activity & act) = delete;

    ~Activity();

    void progress(uint64_t done, uint64_t expected) const
    {
        result(resProgress, done, expected);
    }

    template<typename... Args>
    void result(ResultType type, const Args &... args) const
    {
        Logger::Fields fields;
        (fields.emplace_back(args), ...);
        logger.result(id, type, fields);
    }
};

/**
 * Make `act` the parent of activities started on this thread until the
 * end of the scope.
 */
struct PushActivity
{
    const ActivityId prevAct;

    PushActivity(ActivityId act)
        : prevAct(getCurActivity())
    {
        setCurActivity(act);
    }

    ~PushActivity()
    {
        setCurActivity(prevAct);
    }
};

extern std::unique_ptr<Logger> logger;

std::unique_ptr<Logger> makeSimpleLogger();

/**
 * A logger that writes one JSON object per line to `fd`. Used by
 * `--log-format json` so that supervisors can parse cache events.
 */
std::unique_ptr<Logger> makeJSONLogger(Descriptor fd);

extern Verbosity verbosity;

/**
 * Log an error (with its traces, if `show-trace` is set) when the
 * verbosity admits `level`.
 */
#define logErrorInfo(level, errorInfo...)                  \
    do {                                                   \
        if ((level) <= chunkcache::verbosity)              \
            chunkcache::logger->logEI((level), errorInfo); \
    } while (0)

#define logError(errorInfo...) logErrorInfo(lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(lvlWarn, errorInfo)

/**
 * Print a message if the verbosity admits `level`. A macro so that the
 * arguments are only formatted when the message is shown.
 */
#define printMsg(level, args...)                       \
    do {                                               \
        auto __lvl = level;                            \
        if (__lvl <= chunkcache::verbosity)            \
            chunkcache::logger->log(__lvl, fmt(args)); \
    } while (0)

#define printError(args...) printMsg(lvlError, args)
#define notice(args...) printMsg(lvlNotice, args)
#define printInfo(args...) printMsg(lvlInfo, args)
#define printTalkative(args...) printMsg(lvlTalkative, args)
#define debug(args...) printMsg(lvlDebug, args)
#define vomit(args...) printMsg(lvlVomit, args)

/**
 * Print a message with a 'warning:' prefix if the verbosity admits
 * `lvlWarn`.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    logger->warn(fmt(fs, args...));
}

void writeToStderr(std::string_view s);

} // namespace chunkcache
