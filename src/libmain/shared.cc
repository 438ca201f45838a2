#include "chunkcache/main/shared.hh"
#include "chunkcache/main/loggers.hh"
#include "chunkcache/store/globals.hh"
#include "chunkcache/util/ansicolor.hh"
#include "chunkcache/util/config-global.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/strings.hh"

#include <iostream>
#include <new>

#include <signal.h>
#include <sys/stat.h>

namespace chunkcache {

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

void initChunkCache(bool loadConfig)
{
    initLibStore(loadConfig);

    unix::startSignalHandlerThread();

    /* Rebuild commands are reaped with waitpid(), which an ignored
       SIGCHLD inherited from our parent would break. */
    if (signal(SIGCHLD, SIG_DFL) == SIG_ERR)
        throw SysError("restoring the default SIGCHLD handler");

    umask(0022);
}

void parseCmdLine(int argc, char ** argv, ArgParser parseArg)
{
    parseCmdLine(std::string(baseNameOf(argv[0])), Strings(argv + 1, argv + argc), parseArg);
}

void parseCmdLine(const std::string & programName, const Strings & _args, ArgParser parseArg)
{
    /* `-vvv` is three `-v`s. */
    Strings args;
    for (auto & arg : _args) {
        bool vs = arg.size() > 2 && arg[0] == '-' && arg.find_first_not_of('v', 1) == std::string::npos;
        if (vs)
            args.insert(args.end(), arg.size() - 1, "-v");
        else
            args.push_back(arg);
    }

    for (auto i = args.begin(); i != args.end(); ++i) {
        auto & arg = *i;
        if (arg == "--verbose" || arg == "-v")
            verbosity = (Verbosity) std::min<int>(verbosity + 1, lvlVomit);
        else if (arg == "--quiet")
            verbosity = verbosity > lvlError ? (Verbosity) (verbosity - 1) : lvlError;
        else if (arg == "--log-format")
            setLogFormat(getArg(arg, i, args.end()));
        else if (arg == "--option") {
            auto name = getArg(arg, i, args.end());
            auto value = getArg(arg, i, args.end());
            if (!globalConfig.set(name, value))
                throw UsageError("unknown setting '%s'", name);
        } else if (arg == "--store")
            settings.storeUri = getArg(arg, i, args.end());
        else if (arg == "--artifact-dir")
            settings.artifactDir = absPath(getArg(arg, i, args.end()));
        else if (!parseArg(i, args.end()))
            throw UsageError("unrecognised flag '%1%'", arg);
    }
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% (chunkcache) %2%", programName, CHUNKCACHE_VERSION) << std::endl;
    if (verbosity > lvlInfo) {
        std::cout << "Compression methods: br, none\n";
        std::cout << "Store backends: sqlite, memory\n";
        std::cout << "System configuration file: " << settings.confDir + "/chunkcache.conf" << "\n";
        std::cout << "State directory: " << settings.stateDir << "\n";
    }
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    try {
        fun();
        return 0;
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", baseNameOf(programName));
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc &) {
        printError(ANSI_RED "error:" ANSI_NORMAL " out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(ANSI_RED "error:" ANSI_NORMAL " %s", e.what());
        return 1;
    }
}

} // namespace chunkcache
