#pragma once
///@file

#include "chunkcache/store/chunk-restorer.hh"
#include "chunkcache/store/chunk-writer.hh"
#include "chunkcache/store/globals.hh"

#include <chrono>
#include <functional>

namespace chunkcache {

class IntegrityValidator;

enum class CacheState {
    CheckLocal,
    CheckCache,
    Restore,
    Invalidate,
    Rebuild,
    CacheWrite,
    Ready,
    Degraded,
};

std::string_view showCacheState(CacheState state);

/**
 * Where a ready artifact came from.
 */
enum class ArtifactSource {
    None,
    Local,
    Cache,
    StaleCache,
    Rebuild,
    StaleLocal,
};

std::string_view showArtifactSource(ArtifactSource source);

struct EnsureResult
{
    /**
     * Either `Ready` or `Degraded`.
     */
    CacheState state = CacheState::Degraded;

    /**
     * The artifact, if `state` is `Ready`.
     */
    std::optional<Path> path;

    ArtifactSource source = ArtifactSource::None;

    /**
     * Every state visited, in order.
     */
    std::vector<CacheState> trace;

    bool ready() const
    {
        return state == CacheState::Ready;
    }
};

/**
 * Regenerates artifact `name` from its original source into
 * `destination` and returns the path of the result (normally
 * `destination`). Signals failure by throwing.
 */
typedef std::function<Path(std::string_view name, const Path & destination)> RebuildFunction;

struct OrchestratorParams
{
    Path artifactDir = settings.artifactDir;
    std::chrono::seconds maxAge{settings.maxAge.get()};
    unsigned int lockTimeout = settings.lockTimeout;
    unsigned int storeRetries = settings.storeRetries;
    bool validateLocal = settings.validateLocal;
    ChunkWriterParams writer;
    ChunkRestorerParams restorer;
};

/**
 * Makes a named artifact available on local disk, preferring in order
 * a fresh local copy, a fresh complete chunk set, a rebuild, a stale
 * chunk set and finally a stale local copy. Only this class decides
 * which failures are fatal; everything short of a usage error ends in
 * either READY or DEGRADED.
 */
class CacheOrchestrator
{
    ref<ChunkStore> store;
    IntegrityValidator & validator;
    RebuildFunction rebuild;
    OrchestratorParams params;

    bool tryRestore(std::string_view name, const Path & path, const ArtifactMetadata & md);
    bool tryRebuild(std::string_view name, const Path & path);
    void tryCacheWrite(std::string_view name, const Path & path);
    void invalidate(std::string_view name);

public:

    CacheOrchestrator(
        ref<ChunkStore> store, IntegrityValidator & validator, RebuildFunction rebuild, OrchestratorParams params = {});

    /**
     * @throws UsageError if `name` cannot be used as a file name.
     */
    Path artifactPath(std::string_view name) const;

    EnsureResult ensureReady(std::string_view name);
};

} // namespace chunkcache
