#pragma once
///@file

#include "papercache/util/error.hh"

#include <string_view>

namespace papercache {

/**
 * The key cannot be used as a directory name in the cache root.
 */
MakeError(InvalidKey, Error);

/**
 * Throw `InvalidKey` unless `key` is usable as a single path component
 * of the cache root: non-empty, not `.` or `..`, free of `/` and NUL,
 * and not starting with `.` (dot-names are reserved for `.locks`,
 * `.staging` and the like).
 */
void checkKey(std::string_view key);

/**
 * Deterministic, fixed-length and filename-safe name for `key`: the
 * hexadecimal SHA-256 of the key, 64 characters.
 */
std::string hashKey(std::string_view key);

} // namespace papercache
