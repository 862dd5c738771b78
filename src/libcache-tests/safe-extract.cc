#include <gtest/gtest.h>
#include <random>

#include "papercache/cache/safe-extract.hh"
#include "papercache/cache/tests/archives.hh"
#include "papercache/cache/tests/cache-root.hh"

namespace papercache {

using namespace tests;

class SafeExtractTest : public CacheRootTest
{
protected:
    std::filesystem::path archivePath;
    std::filesystem::path dest;

    void SetUp() override
    {
        CacheRootTest::SetUp();
        archivePath = tmpDir / "archive";
        dest = tmpDir / "tree";
    }

    void writeArchive(const std::vector<ArchiveMember> & members, bool gzip = true)
    {
        writeFile(archivePath, makeTarball(members, gzip));
    }
};

TEST_F(SafeExtractTest, extractsFilesAndDirectories)
{
    writeArchive({
        dirMember("sections/"),
        fileMember("main.tex", "\\documentclass{article}"),
        fileMember("sections/intro.tex", "Intro"),
    });

    extractArchiveSafely(archivePath, dest);

    EXPECT_EQ(readFile(dest / "main.tex"), "\\documentclass{article}");
    EXPECT_EQ(readFile(dest / "sections" / "intro.tex"), "Intro");
}

TEST_F(SafeExtractTest, extractsUncompressedTar)
{
    writeArchive({fileMember("main.tex", "plain")}, false);

    extractArchiveSafely(archivePath, dest);

    EXPECT_EQ(readFile(dest / "main.tex"), "plain");
}

TEST_F(SafeExtractTest, acceptsDotSlashPrefix)
{
    writeArchive({fileMember("./main.tex", "dotted")});

    extractArchiveSafely(archivePath, dest);

    EXPECT_EQ(readFile(dest / "main.tex"), "dotted");
}

TEST_F(SafeExtractTest, filesWithoutReadPermissionBecomeReadable)
{
    auto noAccess = fileMember("main.tex", "hidden");
    noAccess.perm = 0000;
    auto writeOnly = fileMember("refs.bib", "refs");
    writeOnly.perm = 0200;
    writeArchive({noAccess, writeOnly});

    extractArchiveSafely(archivePath, dest);

    for (auto name : {"main.tex", "refs.bib"}) {
        auto st = maybeLstat(dest / name);
        ASSERT_TRUE(st) << name;
        EXPECT_EQ(st->st_mode & 0600, 0600u) << name;
    }
    EXPECT_EQ(readFile(dest / "main.tex"), "hidden");
    ASSERT_NO_THROW(recursiveSync(dest));
}

TEST_F(SafeExtractTest, rejectsAbsolutePath)
{
    writeArchive({fileMember("main.tex", "ok"), fileMember("/tmp/evil.tex", "evil")});

    EXPECT_THROW(extractArchiveSafely(archivePath, dest), UnsafeArchive);

    /* Nothing is written before every member has been checked. */
    EXPECT_FALSE(pathExists(dest / "main.tex"));
}

TEST_F(SafeExtractTest, rejectsParentTraversal)
{
    writeArchive({fileMember("../escape.tex", "evil")});

    EXPECT_THROW(extractArchiveSafely(archivePath, dest), UnsafeArchive);
    EXPECT_FALSE(pathExists(tmpDir / "escape.tex"));
}

TEST_F(SafeExtractTest, rejectsNestedParentTraversal)
{
    writeArchive({fileMember("sections/../../escape.tex", "evil")});

    EXPECT_THROW(extractArchiveSafely(archivePath, dest), UnsafeArchive);
}

TEST_F(SafeExtractTest, allowsDotsInsideNames)
{
    writeArchive({fileMember("v1..2.tex", "dots")});

    extractArchiveSafely(archivePath, dest);

    EXPECT_EQ(readFile(dest / "v1..2.tex"), "dots");
}

TEST_F(SafeExtractTest, rejectsSymlink)
{
    writeArchive({fileMember("main.tex", "ok"), symlinkMember("passwd.tex", "/etc/passwd")});

    EXPECT_THROW(extractArchiveSafely(archivePath, dest), UnsafeArchive);
    EXPECT_FALSE(pathExists(dest / "passwd.tex"));
}

TEST_F(SafeExtractTest, rejectsRelativeSymlinkToo)
{
    writeArchive({fileMember("main.tex", "ok"), symlinkMember("alias.tex", "main.tex")});

    EXPECT_THROW(checkArchiveMembers(archivePath), UnsafeArchive);
}

TEST_F(SafeExtractTest, rejectsHardlink)
{
    writeArchive({fileMember("main.tex", "ok"), hardlinkMember("copy.tex", "main.tex")});

    EXPECT_THROW(extractArchiveSafely(archivePath, dest), UnsafeArchive);
}

TEST_F(SafeExtractTest, corruptArchiveIsBad)
{
    /* A stream cut off halfway through a member's data. */
    std::mt19937 rng(42);
    std::string big;
    for (unsigned int i = 0; i < 65536; i++)
        big += static_cast<char>(rng() & 0xff);
    auto tarball = makeTarball({fileMember("main.tex", big)}, false);
    writeFile(archivePath, tarball.substr(0, tarball.size() / 2));

    EXPECT_THROW(extractArchiveSafely(archivePath, dest), BadArchive);
}

TEST_F(SafeExtractTest, missingArchiveIsBad)
{
    EXPECT_THROW(checkArchiveMembers(tmpDir / "does-not-exist"), BadArchive);
}

} // namespace papercache
