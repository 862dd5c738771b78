#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <string_view>
#include <map>
#include <vector>

namespace papercache {

typedef std::list<std::string> Strings;

/**
 * Ordered string map with a transparent comparator, so lookups by
 * `std::string_view` don't allocate.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

/**
 * Ordered string set with a transparent comparator.
 *
 * @see StringMap
 */
using StringSet = std::set<std::string, std::less<>>;

/**
 * Paths in settings are plain strings; code that operates on files
 * takes `std::filesystem::path`.
 */
typedef std::string Path;

} // namespace papercache
