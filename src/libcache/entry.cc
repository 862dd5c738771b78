#include "papercache/cache/entry.hh"
#include "papercache/util/file-system.hh"
#include "papercache/util/logging.hh"
#include "papercache/util/strings.hh"

#include <algorithm>

namespace papercache {

std::vector<std::filesystem::path> findPayloadFiles(const std::filesystem::path & dir, std::string_view extension)
{
    std::vector<std::filesystem::path> res;

    auto st = maybeLstat(dir);
    if (!st || !S_ISDIR(st->st_mode))
        return res;

    try {
        for (auto & entry : std::filesystem::recursive_directory_iterator(dir)) {
            if (!std::filesystem::is_regular_file(entry.symlink_status()))
                continue;
            if (hasSuffix(entry.path().filename().string(), extension))
                res.push_back(entry.path().lexically_relative(dir));
        }
    } catch (std::filesystem::filesystem_error & e) {
        throw SysError(e.code().value(), "scanning '%1%' for payload files", dir.string());
    }

    std::sort(res.begin(), res.end());
    return res;
}

bool isValidEntry(const std::filesystem::path & entryDir, std::string_view extension)
{
    try {
        auto st = maybeLstat(entryDir);
        if (!st || !S_ISDIR(st->st_mode))
            return false;

        auto marker = maybeLstat(entryDir / completionMarker);
        if (!marker || !S_ISREG(marker->st_mode))
            return false;

        return !findPayloadFiles(entryDir, extension).empty();
    } catch (SystemError & e) {
        debug("treating '%s' as invalid: %s", entryDir.string(), e.message());
        return false;
    }
}

} // namespace papercache
