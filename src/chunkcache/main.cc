#include "chunkcache/main/shared.hh"
#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/cache-orchestrator.hh"
#include "chunkcache/store/chunk-restorer.hh"
#include "chunkcache/store/chunk-writer.hh"
#include "chunkcache/store/globals.hh"
#include "chunkcache/store/integrity-validator.hh"
#include "chunkcache/store/rebuild-command.hh"
#include "chunkcache/util/config-global.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/strings.hh"

#include <nlohmann/json.hpp>

#include <iostream>

using namespace chunkcache;

typedef void (*Operation)(Strings opFlags, Strings opArgs);

static std::shared_ptr<ChunkStore> store;

static ref<ChunkStore> getStore()
{
    if (!store)
        throw Error("no chunk store has been opened");
    return ref<ChunkStore>(store);
}

static void checkFlags(const Strings & opFlags, const StringSet & allowed = {})
{
    for (auto & i : opFlags)
        if (!allowed.count(i))
            throw UsageError("unknown flag '%1%'", i);
}

static void expectArgs(const Strings & opArgs, size_t min, size_t max, std::string_view usage)
{
    if (opArgs.size() < min || opArgs.size() > max)
        throw UsageError("expected arguments: %s", usage);
}

static std::string showTime(time_t t)
{
    char buf[64];
    struct tm tm;
    if (!gmtime_r(&t, &tm) || !strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm))
        return std::to_string(t);
    return buf;
}

/* Make an artifact available locally, restoring or rebuilding it as
   necessary. */
static void opEnsure(Strings opFlags, Strings opArgs)
{
    checkFlags(opFlags);
    expectArgs(opArgs, 1, 1, "NAME");
    auto & name = opArgs.front();

    SQLiteArtifactValidator validator;
    CacheOrchestrator orchestrator(
        getStore(), validator, makeCommandRebuilder(settings.rebuildCommand.get(), std::chrono::seconds(settings.rebuildTimeout)));

    auto res = orchestrator.ensureReady(name);

    std::vector<std::string> states;
    for (auto s : res.trace)
        states.emplace_back(showCacheState(s));
    printInfo("'%s': %s", name, concatStringsSep(" -> ", states));

    if (!res.ready()) {
        printError("artifact '%s' is not available", name);
        throw Exit(2);
    }

    printTalkative("'%s' came from %s", name, showArtifactSource(res.source));
    logger->cout("%s", *res.path);
}

static void opUpload(Strings opFlags, Strings opArgs)
{
    checkFlags(opFlags);
    expectArgs(opArgs, 2, 2, "NAME FILE");
    auto & name = opArgs.front();
    auto path = absPath(opArgs.back());

    SQLiteArtifactValidator validator;
    ChunkWriter writer(getStore(), validator);
    auto res = writer.write(name, path);

    notice(
        "uploaded '%s' as %d chunks (%s, %s compressed)",
        name,
        res.chunks,
        renderSize(res.rawBytes),
        renderSize(res.compressedBytes));
}

/* Restore straight from the store, without the freshness and rebuild
   logic of --ensure. */
static void opRestore(Strings opFlags, Strings opArgs)
{
    checkFlags(opFlags);
    expectArgs(opArgs, 1, 2, "NAME [DEST]");
    auto & name = opArgs.front();

    SQLiteArtifactValidator validator;
    auto dest = opArgs.size() == 2 ? absPath(opArgs.back())
                                   : CacheOrchestrator(getStore(), validator, nullptr).artifactPath(name);

    ChunkRestorer restorer(getStore(), validator);
    auto res = restorer.restore(name, dest);

    switch (res.status) {
    case RestoreStatus::Restored:
        notice("restored '%s' to '%s' (%d chunks, %s)", name, dest, res.chunks, renderSize(res.bytes));
        break;
    case RestoreStatus::NotCached:
        throw Error("artifact '%s' is not in the cache", name);
    case RestoreStatus::Incomplete:
        throw IncompleteCacheError("the chunk set of '%s' is incomplete", name);
    }
}

static void opInfo(Strings opFlags, Strings opArgs)
{
    bool json = false;
    for (auto & i : opFlags)
        if (i == "--json")
            json = true;
        else
            throw UsageError("unknown flag '%1%'", i);

    std::vector<ArtifactMetadata> artifacts;
    if (opArgs.empty())
        artifacts = getStore()->listArtifacts();
    else
        for (auto & name : opArgs) {
            auto md = getStore()->getMetadata(name);
            if (!md)
                throw Error("artifact '%s' is not in the cache", name);
            artifacts.push_back(*md);
        }

    if (json) {
        auto res = nlohmann::json::object();
        for (auto & md : artifacts) {
            auto & j = res[md.name];
            j["chunksPresent"] = md.chunksPresent;
            j["totalChunks"] = md.totalChunks == totalChunksUnknown ? nlohmann::json() : nlohmann::json(md.totalChunks);
            j["compressedSize"] = md.totalSize;
            j["size"] = md.artifactSize;
            j["updatedAt"] = md.updatedAt;
            j["complete"] = md.isComplete();
        }
        logger->cout("%s", res.dump());
        return;
    }

    for (auto & md : artifacts)
        logger->cout(
            "%s\t%d/%s\t%s\t%s\t%s%s",
            md.name,
            md.chunksPresent,
            md.totalChunks == totalChunksUnknown ? "?" : std::to_string(md.totalChunks),
            renderSize(md.artifactSize),
            renderSize(md.totalSize),
            showTime(md.updatedAt),
            md.isComplete() ? "" : "\tincomplete");
}

static void opInvalidate(Strings opFlags, Strings opArgs)
{
    checkFlags(opFlags);
    expectArgs(opArgs, 1, 1, "NAME");
    getStore()->deleteAll(opArgs.front());
    notice("deleted all chunks of '%s'", opArgs.front());
}

static void opVerify(Strings opFlags, Strings opArgs)
{
    checkFlags(opFlags);
    expectArgs(opArgs, 1, 1, "FILE");
    SQLiteArtifactValidator validator;
    validator.check(absPath(opArgs.front()));
    notice("'%s' is a valid artifact", opArgs.front());
}

/* Decode every chunk of an artifact and check the sizes, without
   writing anything. */
static void opCheck(Strings opFlags, Strings opArgs)
{
    checkFlags(opFlags);
    expectArgs(opArgs, 1, 1, "NAME");
    auto & name = opArgs.front();

    SQLiteArtifactValidator validator;
    ChunkRestorer restorer(getStore(), validator);
    auto res = restorer.verify(name);

    if (res.status != RestoreStatus::Restored) {
        printError("chunk set of '%s' is %s", name, showRestoreStatus(res.status));
        throw Exit(1);
    }
    notice("'%s' is intact (%d chunks, %s)", name, res.chunks, renderSize(res.bytes));
}

static void opShowConfig(Strings opFlags, Strings opArgs)
{
    checkFlags(opFlags, {"--json"});
    expectArgs(opArgs, 0, 0, "none");
    if (!opFlags.empty())
        logger->cout("%s", globalConfig.toJSON().dump());
    else
        logger->cout("%s", chomp(globalConfig.toKeyValue()));
}

static void showHelp()
{
    std::cout << "Usage: chunkcache OPERATION [OPTIONS...] [ARGS...]\n"
                 "\n"
                 "Operations:\n"
                 "  --ensure NAME           make NAME available locally and print its path\n"
                 "  --upload NAME FILE      validate FILE and store it as NAME\n"
                 "  --restore NAME [DEST]   restore NAME from the store\n"
                 "  --info [NAME...]        show chunk metadata (--json for JSON output)\n"
                 "  --invalidate NAME       delete every chunk of NAME\n"
                 "  --verify FILE           check that FILE is a valid artifact\n"
                 "  --check NAME            decode every chunk of NAME without writing it\n"
                 "  --show-config           print the effective settings (--json for JSON output)\n"
                 "  --version               print the version\n"
                 "\n"
                 "Options:\n"
                 "  --store URI             use the chunk store at URI\n"
                 "  --artifact-dir DIR      reconstruct artifacts in DIR\n"
                 "  --option NAME VALUE     set a configuration setting\n"
                 "  -v, --verbose           increase verbosity\n"
                 "  --quiet                 decrease verbosity\n"
                 "  --log-format FORMAT     'simple' or 'json'\n";
}

int main(int argc, char ** argv)
{
    return handleExceptions(argv[0], [&]() {
        initChunkCache();

        Strings opFlags, opArgs;
        Operation op = 0;

        parseCmdLine(argc, argv, [&](Strings::iterator & arg, const Strings::iterator & end) {
            Operation oldOp = op;

            if (*arg == "--help") {
                showHelp();
                throw Exit();
            } else if (*arg == "--version")
                printVersion("chunkcache");
            else if (*arg == "--ensure")
                op = opEnsure;
            else if (*arg == "--upload")
                op = opUpload;
            else if (*arg == "--restore")
                op = opRestore;
            else if (*arg == "--info")
                op = opInfo;
            else if (*arg == "--invalidate")
                op = opInvalidate;
            else if (*arg == "--verify")
                op = opVerify;
            else if (*arg == "--check")
                op = opCheck;
            else if (*arg == "--show-config")
                op = opShowConfig;
            else if (*arg != "" && arg->at(0) == '-')
                opFlags.push_back(*arg);
            else
                opArgs.push_back(*arg);

            if (oldOp && oldOp != op)
                throw UsageError("only one operation may be specified");

            return true;
        });

        if (!op)
            throw UsageError("no operation specified");

        if (op != opVerify && op != opShowConfig)
            store = openChunkStore(settings.storeUri);

        op(opFlags, opArgs);

        logger->stop();
    });
}
