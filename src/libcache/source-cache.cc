#include "papercache/cache/source-cache.hh"
#include "papercache/cache/cache-lock-impl.hh"
#include "papercache/cache/cache-settings.hh"
#include "papercache/cache/key.hh"
#include "papercache/cache/safe-extract.hh"
#include "papercache/util/logging.hh"

#include <cerrno>

#include <sys/stat.h>

namespace papercache {

static std::filesystem::path makeAbsolute(const std::filesystem::path & path)
{
    std::error_code ec;
    auto res = std::filesystem::absolute(path, ec);
    return ec ? path : res.lexically_normal();
}

SourceCache::SourceCache(std::filesystem::path root, ArchiveSource & source, Options options)
    : root(makeAbsolute(root))
    , source(source)
    , options(std::move(options))
{
}

SourceCache::SourceCache(std::filesystem::path root, ArchiveSource & source)
    : SourceCache(std::move(root), source, Options{})
{
}

/**
 * Create `<stagingRoot>/<key>.<pid>-<counter>`, a directory nobody
 * else is using.
 */
static std::filesystem::path createStagingDir(const std::filesystem::path & stagingRoot, std::string_view key)
{
    while (true) {
        auto dir = stagingRoot / (std::string(key) + "." + uniqueSuffix());
        if (mkdir(dir.c_str(), 0700) == 0)
            return dir;
        if (errno != EEXIST)
            throw SysError("creating staging directory '%1%'", dir.string());
    }
}

CacheOutcome SourceCache::buildEntry(std::string_view key, bool useCache, bool repairStale)
{
    auto stage = CacheStage::CheckExisting;
    auto entry = entryPath(key);

    auto failure = [&](FailureKind kind, std::string message) {
        CacheOutcome outcome;
        outcome.failure = CacheFailure{.kind = kind, .stage = stage, .message = std::move(message)};
        return outcome;
    };

    try {
        if (useCache && pathExists(entry)) {
            if (isValidEntry(entry, options.payloadExtension)) {
                stage = CacheStage::FastPathHit;
                printInfo("using cached entry '%s'", entry.string());
                return CacheOutcome{.fastPath = true};
            }
            if (!repairStale)
                return failure(
                    FailureKind::StaleEntry,
                    fmt("entry '%s' is incomplete or stale, and repairing it is disabled", entry.string()));
            warn("entry '%s' is incomplete or stale; rebuilding it", entry.string());
        }

        stage = CacheStage::Fetch;
        debug("stage %s for '%s'", showCacheStage(stage), key);

        if (!source.isAvailable(key))
            return failure(FailureKind::Unavailable, fmt("no source archive is available for '%s'", key));

        auto stagingRoot = root / stagingDirName;
        removeLeftoverStaging(stagingRoot, key);

        AutoDelete staging(createStagingDir(stagingRoot, key));
        auto archivePath = staging.path() / "archive";
        auto tree = staging.path() / "tree";

        std::string bytes;
        try {
            bytes = source.fetch(key);
        } catch (Error & e) {
            return failure(FailureKind::TransferFailed, e.message());
        }
        writeFile(archivePath, bytes);
        bytes.clear();

        stage = CacheStage::Extract;
        debug("stage %s for '%s'", showCacheStage(stage), key);

        try {
            extractArchiveSafely(archivePath, tree);
        } catch (UnsafeArchive & e) {
            return failure(FailureKind::UnsafeArchive, e.message());
        } catch (BadArchive & e) {
            return failure(FailureKind::BadArchive, e.message());
        }

        stage = CacheStage::PostValidate;
        debug("stage %s for '%s'", showCacheStage(stage), key);

        if (findPayloadFiles(tree, options.payloadExtension).empty())
            return failure(
                FailureKind::EmptyArchive,
                fmt("the archive for '%s' contains no '%s' files", key, options.payloadExtension));

        /* The marker must not reach the disk before the files it
           vouches for. */
        recursiveSync(tree);
        writeFile(tree / completionMarker, std::string(key) + "\n", 0644, FsSync::Yes);

        stage = CacheStage::Publish;
        debug("stage %s for '%s'", showCacheStage(stage), key);

        publishEntry(tree, entry, options.rename);

        stage = CacheStage::Cleanup;
        debug("stage %s for '%s'", showCacheStage(stage), key);

        printInfo("source files for '%s' extracted to '%s'", key, entry.string());
        return CacheOutcome{};
    } catch (CacheError & e) {
        return CacheOutcome{.failure = e.failure()};
    } catch (Error & e) {
        return failure(FailureKind::IoError, e.message());
    }
}

CacheOutcome SourceCache::ensureCached(std::string_view key, bool useCache, bool repairStale, unsigned int lockTimeout)
{
    CacheOutcome outcome;

    auto fail = [&](FailureKind kind, std::string message) {
        outcome.failure = CacheFailure{.kind = kind, .stage = CacheStage::CheckExisting, .message = std::move(message)};
    };

    try {
        checkKey(key);

        try {
            createDirs(root);
            createDirs(root / lockDirName);
            createDirs(root / stagingDirName);
        } catch (SystemError & e) {
            throw CacheError(CacheFailure{
                .kind = FailureKind::IoError,
                .stage = CacheStage::CheckExisting,
                .message = fmt("cannot set up cache directory '%s': %s", root.string(), e.message()),
            });
        }

        outcome = withCacheLock(root, key, lockTimeout, [&]() { return buildEntry(key, useCache, repairStale); });
    } catch (CacheError & e) {
        outcome.failure = e.failure();
    } catch (InvalidKey & e) {
        fail(FailureKind::InvalidKey, e.message());
    } catch (LockTimeout & e) {
        fail(FailureKind::LockTimeout, e.message());
    } catch (Error & e) {
        fail(FailureKind::IoError, e.message());
    } catch (std::exception & e) {
        fail(FailureKind::IoError, e.what());
    }

    if (outcome.failure) {
        printError("cannot provide '%s': %s", key, outcome.failure->describe());
        if (outcome.failure->needsOperatorAttention())
            printError(
                "the previous entry for '%s' is left at its backup path in '%s' and must be restored by hand",
                key,
                root.string());
    }

    return outcome;
}

bool ensureCached(
    ArchiveSource & source,
    std::string_view key,
    const std::filesystem::path & root,
    bool useCache,
    bool repairStale,
    unsigned int lockTimeout)
{
    return SourceCache(root, source).ensureCached(key, useCache, repairStale, lockTimeout).ok();
}

CacheOutcome ensureCached(ArchiveSource & source, std::string_view key, const CacheSettings & settings)
{
    SourceCache cache(settings.cacheDir.get(), source, {.payloadExtension = settings.payloadExtension.get()});
    return cache.ensureCached(key, settings.useCache, settings.repairStale, settings.lockTimeout);
}

} // namespace papercache
