#pragma once
///@file

#include "papercache/util/types.hh"

#include <filesystem>
#include <string_view>
#include <vector>

namespace papercache {

/**
 * File written last into a fully built entry. Markers of any other
 * name are not recognised.
 */
constexpr std::string_view completionMarker = ".papercache-complete";

/**
 * Default extension of the files an entry exists to serve.
 */
constexpr std::string_view defaultPayloadExtension = ".tex";

/**
 * Regular files below `dir` whose name ends in `extension`, as paths
 * relative to `dir`, sorted. Symlinks are neither followed nor
 * counted. A missing directory has no payload files.
 */
std::vector<std::filesystem::path>
findPayloadFiles(const std::filesystem::path & dir, std::string_view extension = defaultPayloadExtension);

/**
 * Whether `entryDir` can be handed downstream as-is: it is a directory,
 * it holds the completion marker, and it holds at least one payload
 * file. Never touches the network, and never throws: an entry that
 * cannot be inspected is not valid.
 */
bool isValidEntry(const std::filesystem::path & entryDir, std::string_view extension = defaultPayloadExtension);

} // namespace papercache
