#pragma once
/**
 * @file
 *
 * Template implementations for cache-lock.hh.
 *
 * Include this file when you need to use withCacheLock().
 */

#include "papercache/cache/cache-lock.hh"
#include "papercache/cache/lock-file.hh"
#include "papercache/util/file-system.hh"

namespace papercache {

template<typename Body>
auto withCacheLock(const std::filesystem::path & root, std::string_view key, unsigned int lockTimeout, Body && body)
    -> decltype(body())
{
    auto lockPath = getCacheLockPath(root, key);
    createDirs(lockPath.parent_path());

    /* Released, and its file removed, when this scope exits. Removing
       the file keeps the lock directory from growing without bound. */
    LockFile lock(lockPath, lockTimeout, key);

    return body();
}

} // namespace papercache
