#include "chunkcache/store/globals.hh"
#include "chunkcache/util/config-global.hh"
#include "chunkcache/util/environment-variables.hh"
#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/util.hh"

namespace chunkcache {

CacheSettings settings;

static GlobalConfig::Register rSettings(&settings);

CacheSettings::CacheSettings()
    : confDir(canonPath(getEnvNonEmpty("CHUNKCACHE_CONF_DIR").value_or(CHUNKCACHE_CONF_DIR)))
    , stateDir(canonPath(getEnvNonEmpty("CHUNKCACHE_STATE_DIR").value_or(CHUNKCACHE_STATE_DIR)))
{
}

uint64_t CacheSettings::effectiveRestoreBufferSize() const
{
    return restoreBufferSize.get() ? restoreBufferSize.get() : 2 * chunkSize.get();
}

void loadConfFile(AbstractConfig & config)
{
    auto applyConfigFile = [&](const Path & path) {
        try {
            std::string contents = readFile(path);
            config.applyConfig(contents, path);
        } catch (SystemError &) {
        }
    };

    applyConfigFile(settings.confDir + "/chunkcache.conf");

    config.resetOverridden();

    auto confEnv = getEnv("CHUNKCACHE_CONFIG");
    if (confEnv.has_value())
        config.applyConfig(confEnv.value(), "CHUNKCACHE_CONFIG");
}

static bool initLibStoreDone = false;

void initLibStore(bool loadConfig)
{
    if (initLibStoreDone)
        return;

    initLibUtil();

    if (loadConfig) {
        loadConfFile(globalConfig);
        globalConfig.warnUnknownSettings();
    }

    initLibStoreDone = true;
}

} // namespace chunkcache
