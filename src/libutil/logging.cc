#include "chunkcache/util/logging.hh"
#include "chunkcache/util/config-global.hh"
#include "chunkcache/util/environment-variables.hh"
#include "chunkcache/util/sync.hh"
#include "chunkcache/util/terminal.hh"
#include "chunkcache/util/util.hh"

#include <nlohmann/json.hpp>

#include <atomic>
#include <sstream>

#include <unistd.h>

namespace chunkcache {

LoggerSettings loggerSettings;

static GlobalConfig::Register rLoggerSettings(&loggerSettings);

Verbosity verbosity = lvlInfo;

static thread_local ActivityId curActivity = 0;

ActivityId getCurActivity()
{
    return curActivity;
}

void setCurActivity(const ActivityId activityId)
{
    curActivity = activityId;
}

void writeToStderr(std::string_view s)
{
    try {
        writeFull(getStandardError(), s, false);
    } catch (SystemError &) {
        /* A closed stderr must not stop cleanup code that logs. */
    }
}

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    writeFull(getStandardOutput(), std::string(s) + "\n");
}

static std::string renderErrorInfo(const ErrorInfo & ei)
{
    std::ostringstream out;
    showErrorInfo(out, ei, loggerSettings.showTrace.get());
    return out.str();
}

/* The sd-daemon(3) priority prefix for a message at `lvl`. */
static char systemdPriority(Verbosity lvl)
{
    switch (lvl) {
    case lvlError:
        return '3';
    case lvlWarn:
        return '4';
    case lvlNotice:
    case lvlInfo:
        return '5';
    case lvlTalkative:
    case lvlChatty:
        return '6';
    default:
        return '7';
    }
}

/**
 * Human-readable lines on stderr. Colours are kept only on a terminal,
 * and under systemd (`IN_SYSTEMD=1`) each line gets a priority prefix
 * for the journal.
 */
class SimpleLogger : public Logger
{
    const bool systemd = getEnv("IN_SYSTEMD") == "1";
    const bool tty = isTTY();

public:

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        std::string line;
        if (systemd) {
            line += '<';
            line += systemdPriority(lvl);
            line += '>';
        }
        line += filterANSIEscapes(s, !tty);
        line += '\n';
        writeToStderr(line);
    }

    void logEI(const ErrorInfo & ei) override
    {
        log(ei.level, renderErrorInfo(ei));
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        if (!s.empty())
            log(lvl, s + "...");
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        if (type != resRebuildLogLine || fields.empty())
            return;
        if (auto line = std::get_if<std::string>(&fields[0]))
            log(lvlInfo, ANSI_FAINT "rebuild> " ANSI_NORMAL + *line);
    }
};

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

std::unique_ptr<Logger> logger = makeSimpleLogger();

/* Activity ids carry the pid in the upper half so that the logs of
   concurrent chunkcache processes can be merged. */
static std::atomic<uint64_t> nextActivityId{0};

Activity::Activity(
    Logger & logger,
    Verbosity lvl,
    ActivityType type,
    const std::string & s,
    const Logger::Fields & fields,
    ActivityId parent)
    : logger(logger)
    , id((((uint64_t) getpid()) << 32) + nextActivityId++)
{
    logger.startActivity(id, lvl, type, s, fields, parent);
}

Activity::~Activity()
{
    try {
        logger.stopActivity(id);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

/**
 * One JSON object per line on `fd`. The first failed write turns the
 * logger off, with a single warning on stderr.
 */
class JSONLogger : public Logger
{
    const Descriptor fd;

    Sync<bool> enabled{true};

    static nlohmann::json fieldsToJSON(const Fields & fields)
    {
        auto res = nlohmann::json::array();
        for (auto & f : fields)
            std::visit([&](auto & v) { res.push_back(v); }, f);
        return res;
    }

    void emit(nlohmann::json && obj)
    {
        auto line = obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        auto on(enabled.lock());
        if (!*on)
            return;
        try {
            writeLine(fd, line);
        } catch (SystemError & e) {
            *on = false;
            writeToStderr(fmt("warning: JSON log disabled after a write error: %s\n", e.msg()));
        }
    }

public:

    JSONLogger(Descriptor fd)
        : fd(fd)
    {
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        emit({
            {"action", "msg"},
            {"level", lvl},
            {"msg", filterANSIEscapes(s, true)},
        });
    }

    void logEI(const ErrorInfo & ei) override
    {
        nlohmann::json obj{
            {"action", "msg"},
            {"level", ei.level},
            {"msg", filterANSIEscapes(renderErrorInfo(ei), true)},
            {"raw_msg", filterANSIEscapes(ei.msg.str(), true)},
        };

        if (!ei.traces.empty()) {
            auto & traces = obj["trace"] = nlohmann::json::array();
            /* Innermost context first. */
            for (auto t = ei.traces.rbegin(); t != ei.traces.rend(); ++t)
                traces.push_back(filterANSIEscapes(t->hint.str(), true));
        }

        emit(std::move(obj));
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        nlohmann::json obj{
            {"action", "start"},
            {"id", act},
            {"level", lvl},
            {"type", type},
            {"text", s},
            {"parent", parent},
        };
        if (!fields.empty())
            obj["fields"] = fieldsToJSON(fields);
        emit(std::move(obj));
    }

    void stopActivity(ActivityId act) override
    {
        emit({{"action", "stop"}, {"id", act}});
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        nlohmann::json obj{
            {"action", "result"},
            {"id", act},
            {"type", type},
        };
        if (!fields.empty())
            obj["fields"] = fieldsToJSON(fields);
        emit(std::move(obj));
    }
};

std::unique_ptr<Logger> makeJSONLogger(Descriptor fd)
{
    return std::make_unique<JSONLogger>(fd);
}

} // namespace chunkcache
