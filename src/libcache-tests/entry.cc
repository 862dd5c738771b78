#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "papercache/cache/entry.hh"
#include "papercache/cache/tests/cache-root.hh"

#include <sys/stat.h>
#include <unistd.h>

namespace papercache {

static std::vector<std::string> payloadNames(const std::filesystem::path & dir, std::string_view extension = ".tex")
{
    std::vector<std::string> res;
    for (auto & p : findPayloadFiles(dir, extension))
        res.push_back(p.string());
    return res;
}

class EntryTest : public tests::CacheRootTest
{
protected:
    std::filesystem::path entry;

    void SetUp() override
    {
        CacheRootTest::SetUp();
        entry = root / "2301.00001";
        createDirs(entry);
    }
};

/* ----------------------------------------------------------------------------
 * findPayloadFiles
 * --------------------------------------------------------------------------*/

TEST_F(EntryTest, findPayloadFiles_missingDirectory)
{
    EXPECT_TRUE(findPayloadFiles(root / "nope").empty());
}

TEST_F(EntryTest, findPayloadFiles_recursiveAndSorted)
{
    createDirs(entry / "sections");
    writeFile(entry / "main.tex", "main");
    writeFile(entry / "sections" / "intro.tex", "intro");
    writeFile(entry / "refs.bib", "refs");
    writeFile(entry / "figure.tex.png", "png");

    EXPECT_THAT(payloadNames(entry), ::testing::ElementsAre("main.tex", "sections/intro.tex"));
}

TEST_F(EntryTest, findPayloadFiles_otherExtension)
{
    writeFile(entry / "main.tex", "main");
    writeFile(entry / "paper.md", "md");

    EXPECT_THAT(payloadNames(entry, ".md"), ::testing::ElementsAre("paper.md"));
}

TEST_F(EntryTest, findPayloadFiles_ignoresSymlinks)
{
    writeFile(tmpDir / "outside.tex", "outside");
    std::filesystem::create_symlink(tmpDir / "outside.tex", entry / "linked.tex");

    EXPECT_TRUE(findPayloadFiles(entry).empty());
}

/* ----------------------------------------------------------------------------
 * isValidEntry
 * --------------------------------------------------------------------------*/

TEST_F(EntryTest, isValidEntry_complete)
{
    writeFile(entry / "main.tex", "main");
    writeFile(entry / completionMarker, "2301.00001\n");

    EXPECT_TRUE(isValidEntry(entry));
}

TEST_F(EntryTest, isValidEntry_missing)
{
    EXPECT_FALSE(isValidEntry(root / "nope"));
}

TEST_F(EntryTest, isValidEntry_withoutMarker)
{
    writeFile(entry / "main.tex", "main");

    EXPECT_FALSE(isValidEntry(entry));
}

TEST_F(EntryTest, isValidEntry_withoutPayload)
{
    writeFile(entry / "refs.bib", "refs");
    writeFile(entry / completionMarker, "");

    EXPECT_FALSE(isValidEntry(entry));
}

TEST_F(EntryTest, isValidEntry_foreignMarkerNameNotRecognised)
{
    writeFile(entry / "main.tex", "main");
    writeFile(entry / ".complete", "");

    EXPECT_FALSE(isValidEntry(entry));
}

TEST_F(EntryTest, isValidEntry_markerMustBeRegularFile)
{
    writeFile(entry / "main.tex", "main");
    createDirs(entry / completionMarker);

    EXPECT_FALSE(isValidEntry(entry));
}

TEST_F(EntryTest, isValidEntry_fileInsteadOfDirectory)
{
    writeFile(root / "plain", "not a directory");

    EXPECT_FALSE(isValidEntry(root / "plain"));
}

TEST_F(EntryTest, isValidEntry_unreadableSubdirectory)
{
    if (getuid() == 0)
        GTEST_SKIP() << "permission bits do not apply to root";

    createDirs(entry / "sections");
    writeFile(entry / "main.tex", "main");
    writeFile(entry / completionMarker, "");
    ASSERT_EQ(chmod((entry / "sections").c_str(), 0), 0);

    EXPECT_FALSE(isValidEntry(entry));
}

TEST_F(EntryTest, isValidEntry_unsearchableEntry)
{
    if (getuid() == 0)
        GTEST_SKIP() << "permission bits do not apply to root";

    writeFile(entry / "main.tex", "main");
    writeFile(entry / completionMarker, "");
    ASSERT_EQ(chmod(entry.c_str(), 0600), 0);

    EXPECT_FALSE(isValidEntry(entry));
}

TEST_F(EntryTest, isValidEntry_symlinkedEntryNotAccepted)
{
    writeFile(entry / "main.tex", "main");
    writeFile(entry / completionMarker, "");
    std::filesystem::create_directory_symlink(entry, root / "alias");

    EXPECT_FALSE(isValidEntry(root / "alias"));
}

} // namespace papercache
