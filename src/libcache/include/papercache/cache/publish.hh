#pragma once
///@file

#include "papercache/util/types.hh"

#include <filesystem>
#include <functional>
#include <string_view>

namespace papercache {

/**
 * Name of the staging directory below a cache root.
 */
constexpr std::string_view stagingDirName = ".staging";

/**
 * Renames one path to another, atomically, or throws. Replaceable so
 * that failures of individual publish steps can be exercised.
 */
typedef std::function<void(const std::filesystem::path & from, const std::filesystem::path & to)> RenameFn;

/**
 * Make `stagedTree` the new `entry`.
 *
 * An existing entry is first renamed to a uniquely named backup
 * (`<entry>.old.<suffix>`) next to it. If the staged tree then cannot
 * be renamed into place, the backup is renamed back. On success the
 * backup is deleted; failing to delete it is only logged.
 *
 * @throws CacheError of kind `PublishFailed` if the old entry is
 * intact, or `RollbackFailed` (caused by the `PublishFailed`) if the
 * backup could not be restored and still sits at its backup path.
 */
void publishEntry(const std::filesystem::path & stagedTree, const std::filesystem::path & entry, const RenameFn & rename);

/**
 * Whether `name` is a staging directory name for `key`, i.e.
 * `<key>.<pid>-<counter>`.
 */
bool isStagingNameFor(std::string_view name, std::string_view key);

/**
 * Best-effort removal of staging directories for `key` under
 * `stagingRoot` that crashed processes left behind. Must be called
 * with the key's lock held.
 */
void removeLeftoverStaging(const std::filesystem::path & stagingRoot, std::string_view key);

} // namespace papercache
