#pragma once
///@file

#include "papercache/util/file-descriptor.hh"

#include <chrono>
#include <filesystem>

namespace papercache {

MakeError(LockTimeout, Error);

/**
 * Written into a lock file by a holder that has just unlinked it.
 */
constexpr std::string_view staleLockMarker = "d";

/**
 * Open a lock file, creating it if `create` is set. Returns an invalid
 * descriptor if the file does not exist and `create` is not set.
 */
AutoCloseFD openLockFile(const std::filesystem::path & path, bool create);

/**
 * Take an exclusive flock() on `fd`. Without `wait`, return false
 * instead of blocking when another descriptor holds it.
 */
bool lockFile(Descriptor fd, bool wait);

/**
 * Like `lockFile(fd, true)`, but return false once `timeout` has
 * passed. A zero timeout waits forever.
 */
bool lockFile(Descriptor fd, std::chrono::milliseconds timeout);

void unlockFile(Descriptor fd);

/**
 * An exclusive lock on a file, removed again on release.
 *
 * Removing the file means a process that was waiting on it may end up
 * locking an unlinked inode while a newcomer locks a fresh file under
 * the same name. To detect that, the releasing holder writes
 * `staleLockMarker` into the file after unlinking it, and the
 * constructor retries until it holds a lock on an empty file that is
 * still the one at `path`.
 */
class LockFile
{
    std::filesystem::path path;
    AutoCloseFD fd;

public:

    /**
     * @param timeout Seconds to wait in total, however often the file
     * is replaced meanwhile. 0 waits forever.
     * @param owner What the lock protects, for messages.
     * @throws LockTimeout
     */
    LockFile(const std::filesystem::path & path, unsigned int timeout, std::string_view owner);

    LockFile(LockFile &&) = default;

    ~LockFile();

    /**
     * Unlink and mark the file, then drop the lock. Does nothing if
     * already released.
     */
    void release();

    Descriptor get() const
    {
        return fd.get();
    }
};

} // namespace papercache
