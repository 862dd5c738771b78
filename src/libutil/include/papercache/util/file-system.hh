#pragma once
///@file

#include "papercache/util/types.hh"
#include "papercache/util/file-descriptor.hh"

#include <sys/stat.h>

#include <filesystem>
#include <optional>

namespace papercache {

/**
 * `lstat()` `path`, or return nothing if it (or a parent) is missing.
 */
std::optional<struct stat> maybeLstat(const std::filesystem::path & path);

/**
 * Whether `path` exists. Symlinks are not followed, so a dangling one
 * exists.
 */
bool pathExists(const std::filesystem::path & path);

std::string readFile(const std::filesystem::path & path);

enum struct FsSync { Yes, No };

/**
 * Replace the contents of `path` with `s`. With `FsSync::Yes` the file
 * and its directory entry are on disk when this returns.
 */
void writeFile(const std::filesystem::path & path, std::string_view s, mode_t mode = 0666, FsSync sync = FsSync::No);

/**
 * fsync() the directory containing `path`, making a rename or
 * creation of `path` durable.
 */
void syncParent(const std::filesystem::path & path);

/**
 * fsync() every regular file and directory in the tree at `path`,
 * directories after their contents.
 */
void recursiveSync(const std::filesystem::path & path);

/**
 * Remove `path` and everything below it, including directories the
 * owner cannot write to. A missing path is not an error.
 */
void deletePath(const std::filesystem::path & path);

void createDirs(const std::filesystem::path & path);

/**
 * rename(2). A directory can only replace an empty directory.
 */
void renameFile(const std::filesystem::path & oldName, const std::filesystem::path & newName);

/**
 * Deletes a path tree when it goes out of scope, unless cancelled.
 */
class AutoDelete
{
    std::filesystem::path _path;
    bool del = true;

public:
    explicit AutoDelete(std::filesystem::path path);

    AutoDelete(const AutoDelete &) = delete;
    AutoDelete & operator=(const AutoDelete &) = delete;

    ~AutoDelete();

    void cancel()
    {
        del = false;
    }

    const std::filesystem::path & path() const
    {
        return _path;
    }
};

/**
 * `<pid>-<n>`, where `n` counts up from a random start. Unique within
 * the process and very likely across processes.
 */
std::string uniqueSuffix();

/**
 * Create a fresh directory `<parent>/<prefix>-<uniqueSuffix()>`.
 * `parent` defaults to `$TMPDIR`, or `/tmp`.
 */
std::filesystem::path
createTempDir(const std::filesystem::path & parent = {}, std::string_view prefix = "papercache", mode_t mode = 0755);

} // namespace papercache
