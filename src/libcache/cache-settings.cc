#include "papercache/cache/cache-settings.hh"
#include "papercache/util/environment-variables.hh"
#include "papercache/util/file-system.hh"
#include "papercache/util/logging.hh"
#include "papercache/util/users.hh"

namespace papercache {

CacheSettings::CacheSettings() {}

Path CacheSettings::defaultCacheDir()
{
    return getCacheDir().string();
}

void loadConfFile(Config & config)
{
    auto applyConfigFile = [&](const std::filesystem::path & path) {
        try {
            std::string contents = readFile(path);
            config.applyConfig(contents, path.string());
        } catch (SystemError & e) {
            debug("not reading configuration file '%s': %s", path.string(), e.message());
        }
    };

    applyConfigFile(getConfigDir() / "papercache.conf");

    if (auto configEnv = getEnv("PAPERCACHE_CONFIG"))
        config.applyConfig(*configEnv, "PAPERCACHE_CONFIG");

    config.warnUnknownSettings();
}

} // namespace papercache
