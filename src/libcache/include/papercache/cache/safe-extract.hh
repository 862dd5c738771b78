#pragma once
///@file

#include "papercache/util/error.hh"

#include <filesystem>

namespace papercache {

/**
 * An archive member would escape the destination or create a link.
 */
MakeError(UnsafeArchive, Error);

/**
 * The archive is corrupt or in a format we cannot read.
 */
MakeError(BadArchive, Error);

/**
 * Read every member header of `archivePath` without writing anything.
 *
 * @throws UnsafeArchive on the first member with an absolute path, a
 * `..` segment, or a symlink, hardlink or device type
 * @throws BadArchive if the archive cannot be read
 */
void checkArchiveMembers(const std::filesystem::path & archivePath);

/**
 * Unpack `archivePath` into `destDir`, but only after
 * `checkArchiveMembers()` has accepted every member. On failure
 * `destDir` may hold partial output; the caller discards it.
 */
void extractArchiveSafely(const std::filesystem::path & archivePath, const std::filesystem::path & destDir);

} // namespace papercache
