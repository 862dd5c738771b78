#pragma once
///@file

#include "papercache/util/error.hh"

#include <filesystem>

#include <archive.h>
#include <archive_entry.h>

namespace papercache {

/**
 * libarchive could not read or write an archive.
 */
MakeError(ArchiveError, Error);

/**
 * An archive opened for reading. Every compression filter and format
 * libarchive supports is accepted.
 */
class TarArchive
{
    struct archive * archive;

    void check(int err, std::string_view doing);

public:

    explicit TarArchive(const std::filesystem::path & path);

    TarArchive(const TarArchive &) = delete;
    TarArchive & operator=(const TarArchive &) = delete;

    ~TarArchive();

    /**
     * Read the next member header.
     *
     * @return nullptr at the end of the archive. The entry stays valid
     * until the next call.
     */
    struct archive_entry * next();

    void skipData();

    /**
     * Write the member just returned by `next()` below `destDir`.
     */
    void extract(struct archive_entry * entry, const std::filesystem::path & destDir);

    /**
     * Finish reading, reporting errors that freeing would discard.
     */
    void close();
};

/**
 * Extract every member of `tarFile` below `destDir`, which is created
 * if needed. libarchive's refusal to follow symlinks or `..` is in
 * effect, but nothing else is checked.
 */
void unpackTarfile(const std::filesystem::path & tarFile, const std::filesystem::path & destDir);

} // namespace papercache
