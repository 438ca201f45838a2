#pragma once
///@file

#include "chunkcache/util/types.hh"
#include "chunkcache/util/error.hh"

#include <chrono>
#include <optional>

namespace chunkcache {

struct Sink;

struct RunOptions
{
    Path program;
    bool lookupPath = true;
    Strings args;
    std::optional<Path> chdir;
    /**
     * Added to (or overriding) the inherited environment.
     */
    StringMap environment;
    Sink * standardOut = nullptr;
    bool mergeStderrToStdout = false;
    /**
     * Wall-clock limit. The child runs in its own session and the whole
     * process group is killed when the limit passes.
     */
    std::optional<std::chrono::seconds> timeout;
};

/**
 * Run a program to completion.
 *
 * @throws ExecError if it exits with a non-zero status, is killed by a
 * signal or runs past `timeout`.
 */
void runProgram2(const RunOptions & options);

/**
 * Run a program and return what it wrote to stdout.
 */
std::string runProgram(Path program, bool lookupPath = false, const Strings & args = Strings());

class ExecError : public Error
{
public:
    /**
     * As returned by waitpid().
     */
    int status;
    bool timedOut = false;

    template<typename... Args>
    ExecError(int status, const Args &... args)
        : Error(args...)
        , status(status)
    {
    }
};

/**
 * Describe a waitpid() status, e.g. "failed with exit code 1".
 */
std::string statusToString(int status);

bool statusOk(int status);

} // namespace chunkcache
