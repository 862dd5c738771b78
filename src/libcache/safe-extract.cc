#include "papercache/cache/safe-extract.hh"
#include "papercache/util/logging.hh"
#include "papercache/util/strings.hh"
#include "papercache/util/tarfile.hh"

namespace papercache {

static void checkMember(struct archive_entry * entry, std::string_view name)
{
    if (name.empty())
        throw UnsafeArchive("archive member has an empty name");

    if (name[0] == '/')
        throw UnsafeArchive("archive member '%s' has an absolute path", name);

    for (auto & segment : tokenizeString<std::vector<std::string>>(name, "/"))
        if (segment == "..")
            throw UnsafeArchive("archive member '%s' refers to a parent directory", name);

    if (archive_entry_hardlink(entry))
        throw UnsafeArchive("archive member '%s' is a hard link to '%s'", name, archive_entry_hardlink(entry));

    switch (archive_entry_filetype(entry)) {
    case AE_IFREG:
    case AE_IFDIR:
        break;
    case AE_IFLNK: {
        auto target = archive_entry_symlink(entry);
        throw UnsafeArchive("archive member '%s' is a symbolic link to '%s'", name, target ? target : "");
    }
    default:
        throw UnsafeArchive("archive member '%s' has unsupported type %o", name, archive_entry_filetype(entry));
    }
}

void checkArchiveMembers(const std::filesystem::path & archivePath)
{
    try {
        TarArchive archive(archivePath);

        size_t members = 0;
        while (auto entry = archive.next()) {
            auto name = archive_entry_pathname(entry);
            if (!name)
                throw BadArchive("archive member %d has no name", members);
            checkMember(entry, name);
            members++;
            archive.skipData();
        }
        archive.close();

        debug("archive '%s' has %d safe members", archivePath.string(), members);
    } catch (ArchiveError & e) {
        throw BadArchive("cannot read archive '%s': %s", archivePath.string(), e.message());
    }
}

void extractArchiveSafely(const std::filesystem::path & archivePath, const std::filesystem::path & destDir)
{
    checkArchiveMembers(archivePath);

    try {
        unpackTarfile(archivePath, destDir);
    } catch (ArchiveError & e) {
        throw BadArchive("cannot extract archive '%s': %s", archivePath.string(), e.message());
    }
}

} // namespace papercache
