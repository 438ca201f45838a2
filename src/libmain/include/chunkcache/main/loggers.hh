#pragma once
///@file

#include "chunkcache/util/types.hh"

namespace chunkcache {

enum class LogFormat {
    simple,
    json,
};

LogFormat parseLogFormat(const std::string & logFormatStr);

void setLogFormat(const std::string & logFormatStr);
void setLogFormat(const LogFormat & logFormat);

void createDefaultLogger();

} // namespace chunkcache
