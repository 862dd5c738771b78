#include "papercache/cache/lock-file.hh"
#include "papercache/util/logging.hh"

#include <algorithm>
#include <cerrno>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace papercache {

AutoCloseFD openLockFile(const std::filesystem::path & path, bool create)
{
    AutoCloseFD fd = open(path.c_str(), O_CLOEXEC | O_RDWR | (create ? O_CREAT : 0), 0600);
    if (!fd && (create || errno != ENOENT))
        throw SysError("opening lock file '%s'", path.string());
    return fd;
}

static bool flockRetrying(Descriptor fd, int op)
{
    while (flock(fd, op) == -1) {
        if (errno == EWOULDBLOCK && (op & LOCK_NB))
            return false;
        if (errno != EINTR)
            throw SysError("changing lock on file descriptor %d", fd);
    }
    return true;
}

bool lockFile(Descriptor fd, bool wait)
{
    return flockRetrying(fd, wait ? LOCK_EX : LOCK_EX | LOCK_NB);
}

bool lockFile(Descriptor fd, std::chrono::milliseconds timeout)
{
    if (timeout == 0ms)
        return lockFile(fd, true);

    /* flock() cannot time out and alarm() is process-wide, so poll with
       a pause that doubles from 10ms up to 500ms. */
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::chrono::milliseconds pause = 10ms;

    while (!lockFile(fd, false)) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left <= 0ms)
            return false;
        std::this_thread::sleep_for(std::min(pause, left));
        pause = std::min(pause * 2, std::chrono::milliseconds(500ms));
    }

    return true;
}

void unlockFile(Descriptor fd)
{
    flockRetrying(fd, LOCK_UN);
}

/**
 * Whether the lock held on `fd` is still the lock on `path`.
 */
static bool isCurrentLock(Descriptor fd, const std::filesystem::path & path)
{
    struct stat st;
    if (fstat(fd, &st) == -1)
        throw SysError("statting lock file '%s'", path.string());

    if (st.st_size != 0) {
        /* Marked but still linked, so its holder died between the two
           steps of release(). Nobody else will remove it. */
        if (st.st_nlink > 0 && unlink(path.c_str()) == -1 && errno != ENOENT)
            throw SysError("removing stale lock file '%s'", path.string());
        return false;
    }

    if (st.st_nlink == 0)
        return false;

    struct stat stPath;
    if (stat(path.c_str(), &stPath) == -1) {
        if (errno == ENOENT)
            return false;
        throw SysError("statting lock file '%s'", path.string());
    }

    return st.st_ino == stPath.st_ino && st.st_dev == stPath.st_dev;
}

LockFile::LockFile(const std::filesystem::path & path, unsigned int timeout, std::string_view owner)
    : path(path)
{
    debug("acquiring lock '%s' for '%s'", path.string(), owner);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout);
    bool announced = false;

    while (true) {
        fd = openLockFile(path, true);

        if (!lockFile(fd.get(), false)) {
            if (!announced) {
                if (timeout)
                    printInfo("waiting for lock on '%s' (timeout: %us)...", owner, timeout);
                else
                    printInfo("waiting for lock on '%s'...", owner);
                announced = true;
            }

            /* The deadline covers every file we end up waiting on, not
               just the current one. */
            bool locked;
            if (timeout == 0)
                locked = lockFile(fd.get(), true);
            else {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                locked = left > 0ms && lockFile(fd.get(), left);
            }

            if (!locked)
                throw LockTimeout("timed out waiting for lock on '%s' after %u seconds", owner, timeout);
        }

        if (isCurrentLock(fd.get(), path))
            break;

        debug("lock file '%s' was released while waiting, retrying", path.string());
        fd.close();
    }

    debug("lock acquired on '%s'", path.string());
}

LockFile::~LockFile()
{
    try {
        release();
    } catch (...) {
        ignoreExceptionInDestructor(lvlDebug);
    }
}

void LockFile::release()
{
    if (!fd)
        return;

    AutoCloseFD held = std::move(fd);

    /* The marker goes in only after a successful unlink. On a file that
       is still linked it would make every later locker give up on it. */
    if (unlink(path.c_str()) == 0)
        writeFull(held.get(), staleLockMarker);

    debug("lock released on '%s'", path.string());
}

} // namespace papercache
