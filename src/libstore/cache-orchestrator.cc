#include "chunkcache/store/cache-orchestrator.hh"
#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/integrity-validator.hh"
#include "chunkcache/store/pathlocks.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/retry.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/util.hh"

#include <sys/stat.h>

namespace chunkcache {

std::string_view showCacheState(CacheState state)
{
    switch (state) {
    case CacheState::CheckLocal:
        return "CHECK_LOCAL";
    case CacheState::CheckCache:
        return "CHECK_CACHE";
    case CacheState::Restore:
        return "RESTORE";
    case CacheState::Invalidate:
        return "INVALIDATE";
    case CacheState::Rebuild:
        return "REBUILD";
    case CacheState::CacheWrite:
        return "CACHE_WRITE";
    case CacheState::Ready:
        return "READY";
    case CacheState::Degraded:
        return "DEGRADED";
    default:
        unreachable();
    }
}

std::string_view showArtifactSource(ArtifactSource source)
{
    switch (source) {
    case ArtifactSource::None:
        return "none";
    case ArtifactSource::Local:
        return "local";
    case ArtifactSource::Cache:
        return "cache";
    case ArtifactSource::StaleCache:
        return "stale cache";
    case ArtifactSource::Rebuild:
        return "rebuild";
    case ArtifactSource::StaleLocal:
        return "stale local";
    default:
        unreachable();
    }
}

CacheOrchestrator::CacheOrchestrator(
    ref<ChunkStore> store, IntegrityValidator & validator, RebuildFunction rebuild, OrchestratorParams params)
    : store(store)
    , validator(validator)
    , rebuild(std::move(rebuild))
    , params(std::move(params))
{
}

Path CacheOrchestrator::artifactPath(std::string_view name) const
{
    if (name.empty() || name == "." || name == ".." || name.find('/') != name.npos || name.find('\0') != name.npos)
        throw UsageError("invalid artifact name '%s'", name);
    return params.artifactDir + "/" + std::string(name);
}

static bool isFresh(time_t timestamp, std::chrono::seconds maxAge)
{
    return time(0) - timestamp < maxAge.count();
}

bool CacheOrchestrator::tryRestore(std::string_view name, const Path & path, const ArtifactMetadata & md)
{
    try {
        ChunkRestorer restorer(store, validator, params.restorer);
        auto res = restorer.restore(name, path);
        if (res.status != RestoreStatus::Restored) {
            printInfo("cached copy of '%s' became unusable (%s)", name, showRestoreStatus(res.status));
            return false;
        }
        /* The local copy is as old as the chunk set it came from. */
        setWriteTime(path, md.updatedAt);
        return true;
    } catch (Error & e) {
        logError(e.info());
        return false;
    } catch (Interrupted &) {
        throw;
    } catch (std::exception & e) {
        printError("restoring '%s' failed: %s", name, e.what());
        return false;
    }
}

bool CacheOrchestrator::tryRebuild(std::string_view name, const Path & path)
{
    if (!rebuild) {
        printError("cannot rebuild artifact '%s': no rebuild function is configured", name);
        return false;
    }

    auto tmpPath = makeTempPath(path, ".rebuild");
    AutoDelete delTmp(tmpPath, true);

    try {
        Activity act(*logger, lvlInfo, actRebuild, fmt("rebuilding '%s'", name));

        auto produced = rebuild(name, tmpPath);

        try {
            validator.check(produced);
        } catch (CorruptArtifactError & e) {
            throw RebuildFailure("rebuilt artifact '%s' is not valid: %s", name, e.msg());
        }

        moveFile(produced, path);
        if (produced == tmpPath)
            delTmp.cancel();
        syncParent(path);

        printInfo("rebuilt artifact '%s'", name);
        return true;
    } catch (Error & e) {
        e.addTrace("while rebuilding artifact '%s'", name);
        logError(e.info());
        return false;
    } catch (Interrupted &) {
        throw;
    } catch (std::exception & e) {
        /* The rebuild function is caller-supplied and need not throw
           our own error types. */
        printError("rebuilding artifact '%s' failed: %s", name, e.what());
        return false;
    }
}

void CacheOrchestrator::tryCacheWrite(std::string_view name, const Path & path)
{
    try {
        ChunkWriter writer(store, validator, params.writer);
        writer.write(name, path);
    } catch (LeaseUnavailable & e) {
        printInfo("not caching '%s': %s", name, e.msg());
    } catch (Error & e) {
        logWarning({.msg = HintFmt("could not cache artifact '%s', continuing without: %s", name, Uncolored(e.msg()))});
    } catch (Interrupted &) {
        throw;
    } catch (std::exception & e) {
        warn("could not cache artifact '%s', continuing without: %s", name, e.what());
    }
}

void CacheOrchestrator::invalidate(std::string_view name)
{
    try {
        retry<void>(params.storeRetries, [&]() { store->deleteAll(name); });
        printInfo("invalidated cached copy of '%s'", name);
    } catch (Error & e) {
        logWarning({.msg = HintFmt("could not invalidate cached copy of '%s': %s", name, Uncolored(e.msg()))});
    }
}

EnsureResult CacheOrchestrator::ensureReady(std::string_view name)
{
    auto path = artifactPath(name);

    EnsureResult res;

    auto enter = [&](CacheState state) {
        res.trace.push_back(state);
        debug("artifact '%s': %s", name, showCacheState(state));
    };

    auto ready = [&](ArtifactSource source) {
        enter(CacheState::Ready);
        res.state = CacheState::Ready;
        res.path = path;
        res.source = source;
        printInfo("artifact '%s' is ready at '%s' (from %s)", name, path, showArtifactSource(source));
        return res;
    };

    auto degraded = [&]() {
        enter(CacheState::Degraded);
        res.state = CacheState::Degraded;
        printError("artifact '%s' is unavailable", name);
        return res;
    };

    Activity act(*logger, lvlTalkative, actEnsure, fmt("ensuring artifact '%s'", name));
    PushActivity pact(act.id);

    std::optional<PathLock> lock;
    try {
        createDirs(params.artifactDir);
        lock.emplace(path + ".lock", params.lockTimeout, name);
    } catch (Error & e) {
        logError(e.info());
        return degraded();
    }

    enter(CacheState::CheckLocal);

    auto st = maybeStat(path);
    bool haveLocal = st && S_ISREG(st->st_mode);
    if (haveLocal && isFresh(st->st_mtime, params.maxAge)) {
        if (!params.validateLocal || validator.validate(path))
            return ready(ArtifactSource::Local);
    } else if (haveLocal)
        printInfo("local copy of '%s' is stale", name);

    enter(CacheState::CheckCache);

    std::optional<ArtifactMetadata> md;
    try {
        md = retry<std::optional<ArtifactMetadata>>(params.storeRetries, [&]() { return store->getMetadata(name); });
    } catch (Error & e) {
        logWarning({.msg = HintFmt("cannot query the chunk store, treating it as a miss: %s", Uncolored(e.msg()))});
    }

    bool haveCache = md && md->isComplete();
    if (md && !haveCache)
        printInfo(
            "cached copy of '%s' is incomplete (%d of %d chunks), ignoring it",
            name,
            md->chunksPresent,
            md->totalChunks);

    if (haveCache && isFresh(md->updatedAt, params.maxAge)) {
        enter(CacheState::Restore);
        if (tryRestore(name, path, *md))
            return ready(ArtifactSource::Cache);
        enter(CacheState::Invalidate);
        invalidate(name);
        haveCache = false;
    } else if (haveCache)
        printInfo("cached copy of '%s' is stale", name);

    enter(CacheState::Rebuild);
    if (tryRebuild(name, path)) {
        enter(CacheState::CacheWrite);
        tryCacheWrite(name, path);
        return ready(ArtifactSource::Rebuild);
    }

    if (haveCache) {
        warn("falling back to the stale cached copy of '%s'", name);
        enter(CacheState::Restore);
        if (tryRestore(name, path, *md))
            return ready(ArtifactSource::StaleCache);
        enter(CacheState::Invalidate);
        invalidate(name);
    }

    if (haveLocal && validator.validate(path)) {
        warn("falling back to the stale local copy of '%s'", name);
        return ready(ArtifactSource::StaleLocal);
    }

    return degraded();
}

} // namespace chunkcache
