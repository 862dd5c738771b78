#pragma once
///@file

#include "papercache/cache/archive-source.hh"
#include "papercache/cache/cache-failure.hh"
#include "papercache/cache/entry.hh"
#include "papercache/cache/publish.hh"
#include "papercache/util/file-system.hh"

#include <filesystem>

namespace papercache {

struct CacheSettings;

/**
 * A directory of unpacked archives, one subdirectory per key, filled
 * from an `ArchiveSource`.
 *
 * Entries are built in a private staging directory and published by
 * rename under a per-key lock, so any number of threads and processes
 * can share one cache root. Readers need no lock: an entry is always
 * either the previous valid tree, the new one, or (for the duration of
 * a rename) absent.
 */
class SourceCache
{
public:

    struct Options
    {
        std::string payloadExtension{defaultPayloadExtension};

        RenameFn rename = renameFile;
    };

    SourceCache(std::filesystem::path root, ArchiveSource & source, Options options);

    SourceCache(std::filesystem::path root, ArchiveSource & source);

    /**
     * Make sure a valid entry for `key` exists.
     *
     * With `useCache`, a valid entry is returned as-is without touching
     * the source. An existing invalid entry is rebuilt only if
     * `repairStale` is set. Without `useCache` the archive is always
     * downloaded again.
     *
     * Never throws; every failure is described in the outcome and
     * logged.
     *
     * @param lockTimeout Seconds to wait for the key's lock (0 = indefinitely)
     */
    CacheOutcome ensureCached(std::string_view key, bool useCache, bool repairStale, unsigned int lockTimeout);

    std::filesystem::path entryPath(std::string_view key) const
    {
        return root / key;
    }

    const std::filesystem::path & getRoot() const
    {
        return root;
    }

private:

    std::filesystem::path root;
    ArchiveSource & source;
    Options options;

    /**
     * The part of `ensureCached()` that runs under the key's lock.
     */
    CacheOutcome buildEntry(std::string_view key, bool useCache, bool repairStale);
};

/**
 * @return true iff a valid entry for `key` exists in `root` afterwards.
 */
bool ensureCached(
    ArchiveSource & source,
    std::string_view key,
    const std::filesystem::path & root,
    bool useCache,
    bool repairStale,
    unsigned int lockTimeout);

/**
 * Like the above, with root, flags, timeout and payload extension taken
 * from `settings`, returning the full outcome.
 */
CacheOutcome ensureCached(ArchiveSource & source, std::string_view key, const CacheSettings & settings);

} // namespace papercache
