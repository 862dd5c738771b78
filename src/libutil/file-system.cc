#include "papercache/util/file-system.hh"
#include "papercache/util/environment-variables.hh"
#include "papercache/util/logging.hh"

#include <atomic>
#include <cerrno>
#include <random>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace papercache {

std::optional<struct stat> maybeLstat(const std::filesystem::path & path)
{
    struct stat st;
    if (::lstat(path.c_str(), &st) == 0)
        return st;
    if (errno == ENOENT || errno == ENOTDIR)
        return std::nullopt;
    throw SysError("getting status of '%s'", path.string());
}

bool pathExists(const std::filesystem::path & path)
{
    return maybeLstat(path).has_value();
}

static AutoCloseFD openForReading(const std::filesystem::path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening '%s'", path.string());
    return fd;
}

std::string readFile(const std::filesystem::path & path)
{
    return readFile(openForReading(path).get());
}

void writeFile(const std::filesystem::path & path, std::string_view s, mode_t mode, FsSync sync)
{
    AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%s' for writing", path.string());

    try {
        writeFull(fd.get(), s);
        if (sync == FsSync::Yes)
            fd.fsync();
        /* close() can report a failed write-back. */
        fd.close();
    } catch (Error & e) {
        e.addTrace("writing file '%s'", path.string());
        throw;
    }

    if (sync == FsSync::Yes)
        syncParent(path);
}

void syncParent(const std::filesystem::path & path)
{
    auto parent = path.parent_path();
    openForReading(parent.empty() ? std::filesystem::path(".") : parent).fsync();
}

void recursiveSync(const std::filesystem::path & path)
{
    auto st = maybeLstat(path);
    if (!st)
        throw SysError(ENOENT, "syncing '%s'", path.string());
    if (S_ISLNK(st->st_mode))
        return;
    if (!S_ISDIR(st->st_mode)) {
        openForReading(path).fsync();
        return;
    }

    std::vector<std::filesystem::path> dirs{path};
    try {
        for (auto & entry : std::filesystem::recursive_directory_iterator(path)) {
            auto status = entry.symlink_status();
            if (std::filesystem::is_directory(status))
                dirs.push_back(entry.path());
            else if (std::filesystem::is_regular_file(status))
                openForReading(entry.path()).fsync();
        }
    } catch (std::filesystem::filesystem_error & e) {
        throw SysError(e.code().value(), "reading directory '%s'", path.string());
    }

    /* Iteration is pre-order, so backwards puts children first. */
    for (auto dir = dirs.rbegin(); dir != dirs.rend(); ++dir)
        openForReading(*dir).fsync();
}

/**
 * Give the owner full access to every directory in the tree at `path`.
 * Archives can contain directories without the write bit, and nothing
 * could be removed from those. Symlinks are not followed.
 */
static void makeTreeRemovable(const std::filesystem::path & path)
{
    auto st = maybeLstat(path);
    if (!st || !S_ISDIR(st->st_mode))
        return;

    if ((st->st_mode & S_IRWXU) != S_IRWXU && chmod(path.c_str(), st->st_mode | S_IRWXU) == -1)
        throw SysError("making '%s' writable", path.string());

    for (auto & entry : std::filesystem::directory_iterator(path))
        makeTreeRemovable(entry.path());
}

void deletePath(const std::filesystem::path & path)
{
    try {
        makeTreeRemovable(path);
        std::filesystem::remove_all(path);
    } catch (std::filesystem::filesystem_error & e) {
        throw SysError(e.code().value(), "deleting '%s'", path.string());
    }
}

void createDirs(const std::filesystem::path & path)
{
    try {
        std::filesystem::create_directories(path);
    } catch (std::filesystem::filesystem_error & e) {
        throw SysError(e.code().value(), "creating directory '%s'", path.string());
    }
}

void renameFile(const std::filesystem::path & oldName, const std::filesystem::path & newName)
{
    if (::rename(oldName.c_str(), newName.c_str()) == -1)
        throw SysError("renaming '%s' to '%s'", oldName.string(), newName.string());
}

AutoDelete::AutoDelete(std::filesystem::path path)
    : _path(std::move(path))
{
}

AutoDelete::~AutoDelete()
{
    if (!del)
        return;
    try {
        deletePath(_path);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

std::string uniqueSuffix()
{
    /* A random start makes clashes with leftovers of an earlier process
       with the same pid unlikely. */
    static std::atomic<uint32_t> counter(std::random_device{}());
    return fmt("%d-%d", getpid(), counter.fetch_add(1, std::memory_order_relaxed));
}

std::filesystem::path createTempDir(const std::filesystem::path & parent, std::string_view prefix, mode_t mode)
{
    auto dir = parent.empty() ? std::filesystem::path(getEnvNonEmpty("TMPDIR").value_or("/tmp")) : parent;

    while (true) {
        auto tmpDir = dir.lexically_normal() / fmt("%s-%s", prefix, uniqueSuffix());
        if (mkdir(tmpDir.c_str(), mode) == 0)
            return tmpDir;
        if (errno != EEXIST)
            throw SysError("creating directory '%s'", tmpDir.string());
    }
}

} // namespace papercache
