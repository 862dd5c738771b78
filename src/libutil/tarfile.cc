#include "papercache/util/tarfile.hh"
#include "papercache/util/file-system.hh"
#include "papercache/util/logging.hh"

namespace papercache {

TarArchive::TarArchive(const std::filesystem::path & path)
    : archive(archive_read_new())
{
    if (!archive)
        throw ArchiveError("cannot allocate an archive reader");
    archive_read_support_filter_all(archive);
    archive_read_support_format_all(archive);
    check(archive_read_open_filename(archive, path.c_str(), 64 * 1024), "opening archive");
}

TarArchive::~TarArchive()
{
    archive_read_free(archive);
}

void TarArchive::check(int err, std::string_view doing)
{
    if (err == ARCHIVE_WARN)
        warn("%s: %s", doing, archive_error_string(archive));
    else if (err != ARCHIVE_OK) {
        auto reason = archive_error_string(archive);
        throw ArchiveError("%s: %s", doing, reason ? reason : "unknown libarchive error");
    }
}

struct archive_entry * TarArchive::next()
{
    struct archive_entry * entry;
    int r = archive_read_next_header(archive, &entry);
    if (r == ARCHIVE_EOF)
        return nullptr;
    check(r, "reading member header");
    return entry;
}

void TarArchive::skipData()
{
    check(archive_read_data_skip(archive), "skipping member data");
}

void TarArchive::extract(struct archive_entry * entry, const std::filesystem::path & destDir)
{
    auto pathname = archive_entry_pathname(entry);
    if (!pathname)
        throw ArchiveError("archive member has no name");
    std::string name = pathname;

    archive_entry_copy_pathname(entry, (destDir / name).c_str());
    if (auto target = archive_entry_hardlink(entry))
        archive_entry_copy_hardlink(entry, (destDir / std::string(target)).c_str());

    /* Source tarballs can contain directories we could not enter and
       files we could not read. */
    auto mode = archive_entry_mode(entry);
    auto type = archive_entry_filetype(entry);
    if (type == AE_IFDIR && (mode & 0700) != 0700)
        archive_entry_set_mode(entry, mode | 0700);
    else if (type == AE_IFREG && (mode & 0600) != 0600)
        archive_entry_set_mode(entry, mode | 0600);

    check(
        archive_read_extract(
            archive, entry, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_SECURE_SYMLINKS | ARCHIVE_EXTRACT_SECURE_NODOTDOT),
        fmt("extracting '%s'", name));
}

void TarArchive::close()
{
    check(archive_read_close(archive), "closing archive");
}

void unpackTarfile(const std::filesystem::path & tarFile, const std::filesystem::path & destDir)
{
    TarArchive archive(tarFile);
    createDirs(destDir);
    while (auto entry = archive.next())
        archive.extract(entry, destDir);
    archive.close();
}

} // namespace papercache
