#pragma once
///@file

#include "papercache/util/types.hh"

#include <filesystem>

#include <sys/types.h>

namespace papercache {

/**
 * The home directory recorded for `userId` in the password database.
 */
Path getHomeOf(uid_t userId);

/**
 * `$HOME`, unless it belongs to another user, in which case the
 * password database is asked instead. Computed once per process.
 */
Path getHome();

/**
 * Default location of the cache: `$PAPERCACHE_CACHE_HOME`, else
 * `$XDG_CACHE_HOME/papercache`, else `~/.cache/papercache`.
 */
std::filesystem::path getCacheDir();

/**
 * Where `papercache.conf` is looked for: `$PAPERCACHE_CONFIG_HOME`,
 * else `$XDG_CONFIG_HOME/papercache`, else `~/.config/papercache`.
 */
std::filesystem::path getConfigDir();

} // namespace papercache
