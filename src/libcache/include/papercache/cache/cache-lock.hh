#pragma once
///@file

#include "papercache/util/types.hh"

#include <filesystem>
#include <string_view>

namespace papercache {

/**
 * Name of the lock directory below a cache root.
 */
constexpr std::string_view lockDirName = ".locks";

/**
 * Get the lock file path for a key:
 * `<root>/.locks/<hashKey(key)>.lock`.
 */
std::filesystem::path getCacheLockPath(const std::filesystem::path & root, std::string_view key);

/**
 * Run `body` while holding the exclusive lock for `key`.
 *
 * The lock directory is created if needed. The lock is released and
 * its file removed on every exit path, including exceptions.
 *
 * @param lockTimeout Timeout in seconds (0 = wait indefinitely)
 * @return Result of `body`
 * @throws LockTimeout if the lock could not be acquired in time, in which case `body` is not run
 */
template<typename Body>
auto withCacheLock(const std::filesystem::path & root, std::string_view key, unsigned int lockTimeout, Body && body)
    -> decltype(body());

} // namespace papercache
