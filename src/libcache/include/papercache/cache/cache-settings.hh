#pragma once
///@file

#include "papercache/util/configuration.hh"

namespace papercache {

struct CacheSettings : public Config
{
    CacheSettings();

    PathSetting cacheDir{
        this,
        defaultCacheDir(),
        "cache-dir",
        R"(
          Directory holding one subdirectory per key, plus the `.locks`
          and `.staging` directories. Defaults to `$PAPERCACHE_CACHE_HOME`,
          or `$XDG_CACHE_HOME/papercache`, or `~/.cache/papercache`.
        )"};

    Setting<unsigned int> lockTimeout{
        this,
        30,
        "lock-timeout",
        R"(
          Seconds to wait for another process building the same entry.
          0 waits indefinitely.
        )"};

    Setting<bool> useCache{
        this,
        true,
        "use-cache",
        "Whether a valid existing entry is returned without downloading it again."};

    Setting<bool> repairStale{
        this,
        true,
        "repair-stale",
        "Whether an existing but incomplete entry is rebuilt rather than reported as a failure."};

    Setting<std::string> payloadExtension{
        this,
        ".tex",
        "payload-extension",
        "File name suffix of the files that make an entry worth serving."};

    Setting<std::string> sourceUrl{
        this,
        "https://arxiv.org/e-print/",
        "source-url",
        "URL prefix the key is appended to in order to download its archive."};

    Setting<std::string> probeUrl{
        this,
        "https://arxiv.org/format/",
        "probe-url",
        "URL prefix the key is appended to in order to check whether an archive exists."};

    Setting<std::string> probeMarker{
        this,
        "Download source",
        "probe-marker",
        "Text the probe response must contain for the archive to count as available."};

    Setting<std::string> userAgent{this, "Mozilla/5.0", "user-agent", "`User-Agent` header sent with every request."};

    Setting<unsigned long> connectTimeout{
        this, 5, "connect-timeout", "Seconds allowed for establishing a connection. 0 means the curl default."};

    Setting<unsigned long> transferTimeout{
        this, 30, "transfer-timeout", "Seconds allowed for a whole request. 0 means no limit."};

    Setting<unsigned int> probeAttempts{
        this,
        3,
        "probe-attempts",
        "How many times the availability probe is tried before the archive is reported unavailable."};

    static Path defaultCacheDir();
};

/**
 * Apply `papercache.conf` from the user configuration directory, then
 * the contents of `$PAPERCACHE_CONFIG` if set.
 */
void loadConfFile(Config & config);

} // namespace papercache
