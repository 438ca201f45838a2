#include "chunkcache/store/rebuild-command.hh"
#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/processes.hh"
#include "chunkcache/util/serialise.hh"
#include "chunkcache/util/strings.hh"

namespace chunkcache {

RebuildFunction makeCommandRebuilder(Strings command, std::chrono::seconds timeout)
{
    return [command, timeout](std::string_view name, const Path & destination) -> Path {
        if (command.empty())
            throw RebuildFailure("cannot rebuild '%s': the 'rebuild-command' setting is empty", name);

        Activity act(
            *logger,
            lvlInfo,
            actRebuild,
            fmt("running %s for '%s'", concatMapStringsSep(" ", command, escapeShellArgAlways), name));

        std::string partial;
        LambdaSink output([&](std::string_view data) {
            partial.append(data);
            size_t pos;
            while ((pos = partial.find('\n')) != partial.npos) {
                act.result(resRebuildLogLine, partial.substr(0, pos));
                partial.erase(0, pos + 1);
            }
        });

        Strings args(std::next(command.begin()), command.end());
        args.push_back(std::string(name));
        args.push_back(destination);

        try {
            runProgram2({
                .program = command.front(),
                .args = args,
                .standardOut = &output,
                .mergeStderrToStdout = true,
                .timeout = timeout,
            });
        } catch (ExecError & e) {
            if (!partial.empty())
                act.result(resRebuildLogLine, partial);
            throw RebuildFailure("rebuild of '%s' failed: %s", name, e.msg());
        }

        if (!partial.empty())
            act.result(resRebuildLogLine, partial);

        if (!pathExists(destination))
            throw RebuildFailure("rebuild command for '%s' did not create '%s'", name, destination);

        return destination;
    };
}

} // namespace chunkcache
