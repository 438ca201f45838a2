#pragma once
///@file

#include "chunkcache/util/exit.hh"
#include "chunkcache/util/types.hh"
#include "chunkcache/util/util.hh"

#include <functional>

namespace chunkcache {

int handleExceptions(const std::string & programName, std::function<void()> fun);

/**
 * Initialise libstore, install the signal handler thread and set up
 * the process for the command-line tool.
 *
 * @param loadConfig Whether to load configuration from
 * `chunkcache.conf`, `CHUNKCACHE_CONFIG`, etc. May be disabled for unit
 * tests.
 */
void initChunkCache(bool loadConfig = true);

typedef std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> ArgParser;

/**
 * Process the flags every command shares (`--option`, `--verbose`,
 * `--quiet`, `--log-format`, `--store`, `--artifact-dir`) and hand
 * everything else to `parseArg`, which returns false for an argument it
 * does not recognise.
 */
void parseCmdLine(int argc, char ** argv, ArgParser parseArg);

void parseCmdLine(const std::string & programName, const Strings & args, ArgParser parseArg);

void printVersion(const std::string & programName);

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end);

} // namespace chunkcache
