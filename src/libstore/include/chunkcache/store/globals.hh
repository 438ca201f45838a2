#pragma once
///@file

#include "chunkcache/util/types.hh"
#include "chunkcache/util/configuration.hh"

#include <chrono>

namespace chunkcache {

class CacheSettings : public Config
{
public:

    CacheSettings();

    /**
     * The directory holding `chunkcache.conf`; `$CHUNKCACHE_CONF_DIR`
     * or the build-time default.
     */
    Path confDir;

    /**
     * Root of the default store and artifact locations;
     * `$CHUNKCACHE_STATE_DIR` or the build-time default.
     */
    Path stateDir;

    Setting<std::string> storeUri{
        this,
        "sqlite://" + stateDir + "/chunks.sqlite",
        "store",
        R"(
          The URI of the backing chunk store. Supported schemes are
          `sqlite://<path>` and `memory://`.
        )"};

    PathSetting artifactDir{
        this,
        stateDir + "/artifacts",
        "artifact-dir",
        "The directory in which artifacts are reconstructed."};

    Setting<uint64_t> chunkSize{
        this,
        10 * 1024 * 1024,
        "chunk-size",
        R"(
          The size in bytes of the window in which an artifact is cut
          before compression. Every chunk but the last holds exactly
          this many uncompressed bytes.
        )"};

    Setting<std::string> chunkCompression{
        this, "br", "chunk-compression", "The codec applied to each chunk (`br` or `none`)."};

    Setting<int> chunkCompressionLevel{
        this,
        -1,
        "chunk-compression-level",
        "The codec level; `-1` selects the library default."};

    Setting<unsigned int> maxAge{
        this,
        30 * 24 * 3600,
        "max-age",
        R"(
          How old, in seconds, a local artifact or a cached chunk set may
          be before it is considered stale.
        )"};

    Setting<unsigned int> reclaimInterval{
        this,
        10,
        "reclaim-interval",
        "Return freed heap memory to the operating system every this many chunks (`0` disables it)."};

    Setting<uint64_t> restoreBufferSize{
        this,
        0,
        "restore-buffer-size",
        R"(
          The maximum number of decompressed bytes queued for the output
          file during a restore. `0` means twice `chunk-size`.
        )"};

    Setting<unsigned int> storeRetries{
        this, 3, "store-retries", "Number of attempts for a chunk operation that fails transiently."};

    Setting<unsigned int> storeTimeout{
        this, 30, "store-timeout", "Seconds a store call may wait for a busy database."};

    Setting<Strings> rebuildCommand{
        this,
        {},
        "rebuild-command",
        R"(
          The program (and leading arguments) that regenerates an
          artifact. It is called with the artifact name and the
          destination path appended.
        )"};

    Setting<unsigned int> rebuildTimeout{
        this, 3600, "rebuild-timeout", "Seconds after which the rebuild command is killed."};

    Setting<unsigned int> lockTimeout{
        this, 600, "lock-timeout", "Seconds to wait for the lock on a local artifact (`0` waits forever)."};

    Setting<unsigned int> leaseTtl{
        this, 3600, "lease-ttl", "Seconds an upload lease on a chunk set stays valid."};

    Setting<std::string> validationTable{
        this,
        "wikipedia_articles",
        "validation-table",
        "The table that must exist in a valid artifact."};

    Setting<uint64_t> minRecords{
        this, 1, "min-records", "The minimum number of rows `validation-table` must hold."};

    Setting<bool> validateLocal{
        this,
        false,
        "validate-local",
        "Whether a fresh local artifact is validated before it is used."};

    uint64_t effectiveRestoreBufferSize() const;
};

extern CacheSettings settings;

/**
 * Load the configuration (from `chunkcache.conf`, `CHUNKCACHE_CONFIG`,
 * etc.) into the given configuration object.
 */
void loadConfFile(AbstractConfig & config);

/**
 * Must be called before any other libstore function.
 */
void initLibStore(bool loadConfig = true);

} // namespace chunkcache
