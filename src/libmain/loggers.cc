#include "chunkcache/main/loggers.hh"
#include "chunkcache/util/file-descriptor.hh"
#include "chunkcache/util/logging.hh"

namespace chunkcache {

LogFormat defaultLogFormat = LogFormat::simple;

LogFormat parseLogFormat(const std::string & logFormatStr)
{
    if (logFormatStr == "simple")
        return LogFormat::simple;
    else if (logFormatStr == "json")
        return LogFormat::json;
    throw UsageError("option 'log-format' has an invalid value '%s'", logFormatStr);
}

static std::unique_ptr<Logger> makeDefaultLogger()
{
    switch (defaultLogFormat) {
    case LogFormat::simple:
        return makeSimpleLogger();
    case LogFormat::json:
        return makeJSONLogger(getStandardError());
    default:
        unreachable();
    }
}

void setLogFormat(const std::string & logFormatStr)
{
    setLogFormat(parseLogFormat(logFormatStr));
}

void setLogFormat(const LogFormat & logFormat)
{
    defaultLogFormat = logFormat;
    createDefaultLogger();
}

void createDefaultLogger()
{
    logger = makeDefaultLogger();
}

} // namespace chunkcache
