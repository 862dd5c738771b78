#include "papercache/cache/publish.hh"
#include "papercache/cache/cache-failure.hh"
#include "papercache/util/file-system.hh"
#include "papercache/util/logging.hh"
#include "papercache/util/strings.hh"

namespace papercache {

void publishEntry(const std::filesystem::path & stagedTree, const std::filesystem::path & entry, const RenameFn & rename)
{
    std::optional<std::filesystem::path> backup;

    if (pathExists(entry)) {
        backup = entry.parent_path() / (entry.filename().string() + ".old." + uniqueSuffix());
        try {
            rename(entry, *backup);
        } catch (Error & e) {
            throw CacheError(CacheFailure{
                .kind = FailureKind::PublishFailed,
                .stage = CacheStage::Publish,
                .message = fmt("cannot move old entry '%s' aside: %s", entry.string(), e.message()),
            });
        }
        debug("moved old entry '%s' to '%s'", entry.string(), backup->string());
    }

    try {
        rename(stagedTree, entry);
    } catch (Error & e) {
        CacheFailure publishFailure{
            .kind = FailureKind::PublishFailed,
            .stage = CacheStage::Publish,
            .message = fmt("cannot move '%s' into place: %s", stagedTree.string(), e.message()),
        };

        if (backup) {
            try {
                rename(*backup, entry);
            } catch (Error & e2) {
                throw CacheError(CacheFailure{
                    .kind = FailureKind::RollbackFailed,
                    .stage = CacheStage::Publish,
                    .message = fmt(
                        "cannot restore '%s' from backup '%s': %s", entry.string(), backup->string(), e2.message()),
                    .cause = std::make_shared<const CacheFailure>(std::move(publishFailure)),
                });
            }
            debug("restored old entry '%s'", entry.string());
        }

        throw CacheError(std::move(publishFailure));
    }

    try {
        syncParent(entry);
    } catch (SystemError & e) {
        warn("cannot flush directory of '%s': %s", entry.string(), e.message());
    }

    if (backup) {
        try {
            deletePath(*backup);
        } catch (Error & e) {
            warn("cannot remove backup '%s': %s", backup->string(), e.message());
        }
    }
}

bool isStagingNameFor(std::string_view name, std::string_view key)
{
    if (name.size() <= key.size() + 1 || !hasPrefix(name, key) || name[key.size()] != '.')
        return false;
    auto suffix = name.substr(key.size() + 1);
    return suffix.find_first_not_of("0123456789-") == suffix.npos;
}

void removeLeftoverStaging(const std::filesystem::path & stagingRoot, std::string_view key)
{
    std::vector<std::filesystem::path> leftovers;

    try {
        for (auto & entry : std::filesystem::directory_iterator(stagingRoot))
            if (isStagingNameFor(entry.path().filename().string(), key))
                leftovers.push_back(entry.path());
    } catch (std::filesystem::filesystem_error & e) {
        warn("cannot scan staging directory '%s': %s", stagingRoot.string(), e.code().message());
        return;
    }

    for (auto & path : leftovers) {
        warn("removing leftover staging directory '%s'", path.string());
        try {
            deletePath(path);
        } catch (Error & e) {
            warn("cannot remove '%s': %s", path.string(), e.message());
        }
    }
}

} // namespace papercache
