#include "papercache/cache/tests/archives.hh"
#include "papercache/util/error.hh"

#include <memory>

#include <archive.h>
#include <archive_entry.h>

namespace papercache::tests {

namespace {

struct ArchiveWriteDeleter
{
    void operator()(struct archive * a) const
    {
        archive_write_free(a);
    }
};

struct ArchiveEntryDeleter
{
    void operator()(struct archive_entry * e) const
    {
        archive_entry_free(e);
    }
};

la_ssize_t appendToString(struct archive *, void * clientData, const void * buffer, size_t length)
{
    static_cast<std::string *>(clientData)->append(static_cast<const char *>(buffer), length);
    return length;
}

void check(struct archive * a, int err, const std::string & reason)
{
    if (err != ARCHIVE_OK)
        throw Error(reason, archive_error_string(a));
}

} // namespace

std::string makeTarball(const std::vector<ArchiveMember> & members, bool gzip)
{
    std::string out;

    std::unique_ptr<struct archive, ArchiveWriteDeleter> a(archive_write_new());
    if (!a)
        throw Error("cannot create archive writer");

    check(a.get(), archive_write_set_format_pax_restricted(a.get()), "cannot set archive format (%s)");
    if (gzip)
        check(a.get(), archive_write_add_filter_gzip(a.get()), "cannot enable gzip (%s)");
    check(a.get(), archive_write_open(a.get(), &out, nullptr, appendToString, nullptr), "cannot open archive (%s)");

    for (auto & member : members) {
        std::unique_ptr<struct archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
        archive_entry_set_pathname(entry.get(), member.name.c_str());
        archive_entry_set_mtime(entry.get(), 1700000000, 0);

        switch (member.type) {
        case ArchiveMember::File:
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), member.perm);
            archive_entry_set_size(entry.get(), member.contents.size());
            break;
        case ArchiveMember::Directory:
            archive_entry_set_filetype(entry.get(), AE_IFDIR);
            archive_entry_set_perm(entry.get(), 0755);
            archive_entry_set_size(entry.get(), 0);
            break;
        case ArchiveMember::Symlink:
            archive_entry_set_filetype(entry.get(), AE_IFLNK);
            archive_entry_set_perm(entry.get(), 0777);
            archive_entry_set_symlink(entry.get(), member.contents.c_str());
            archive_entry_set_size(entry.get(), 0);
            break;
        case ArchiveMember::Hardlink:
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            archive_entry_set_hardlink(entry.get(), member.contents.c_str());
            archive_entry_set_size(entry.get(), 0);
            break;
        }

        check(a.get(), archive_write_header(a.get(), entry.get()), "cannot write member header (%s)");

        if (member.type == ArchiveMember::File && !member.contents.empty())
            if (archive_write_data(a.get(), member.contents.data(), member.contents.size()) < 0)
                throw Error("cannot write member data (%s)", archive_error_string(a.get()));
    }

    check(a.get(), archive_write_close(a.get()), "cannot finish archive (%s)");

    return out;
}

std::string makePaperTarball(const std::string & mainTex)
{
    return makeTarball({fileMember("main.tex", mainTex)});
}

} // namespace papercache::tests
