#pragma once
///@file

#include <string>
#include <vector>

namespace papercache::tests {

/**
 * One member of an archive built by `makeTarball()`. Names are written
 * exactly as given, so unsafe names can be produced on purpose.
 */
struct ArchiveMember
{
    enum Type { File, Directory, Symlink, Hardlink };

    Type type;
    std::string name;

    /**
     * File contents, or the link target for symlinks and hardlinks.
     */
    std::string contents;

    /**
     * Permission bits of a regular file.
     */
    unsigned int perm = 0644;
};

inline ArchiveMember fileMember(std::string name, std::string contents)
{
    return {ArchiveMember::File, std::move(name), std::move(contents)};
}

inline ArchiveMember dirMember(std::string name)
{
    return {ArchiveMember::Directory, std::move(name), ""};
}

inline ArchiveMember symlinkMember(std::string name, std::string target)
{
    return {ArchiveMember::Symlink, std::move(name), std::move(target)};
}

inline ArchiveMember hardlinkMember(std::string name, std::string target)
{
    return {ArchiveMember::Hardlink, std::move(name), std::move(target)};
}

/**
 * A pax tarball holding `members` in order, gzip-compressed unless
 * `gzip` is false.
 */
std::string makeTarball(const std::vector<ArchiveMember> & members, bool gzip = true);

/**
 * A gzipped tarball of a single `main.tex` with the given contents.
 */
std::string makePaperTarball(const std::string & mainTex);

} // namespace papercache::tests
