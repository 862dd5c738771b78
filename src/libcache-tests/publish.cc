#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <set>

#include "papercache/cache/cache-failure.hh"
#include "papercache/cache/publish.hh"
#include "papercache/cache/tests/cache-root.hh"
#include "papercache/util/strings.hh"

namespace papercache {

using tests::listDir;

/**
 * A rename that fails on selected calls (counting from 1) and otherwise
 * does the real thing.
 */
struct FlakyRename
{
    unsigned int calls = 0;
    std::set<unsigned int> failOn;

    RenameFn fn()
    {
        return [this](const std::filesystem::path & from, const std::filesystem::path & to) {
            if (failOn.count(++calls))
                throw SysError(EIO, "renaming '%1%' to '%2%'", from.string(), to.string());
            renameFile(from, to);
        };
    }
};

class PublishTest : public tests::CacheRootTest
{
protected:
    std::filesystem::path staged;
    std::filesystem::path entry;

    void SetUp() override
    {
        CacheRootTest::SetUp();
        staged = tmpDir / "cache" / ".staging" / "k.1-1" / "tree";
        entry = root / "k";
        createDirs(staged);
        writeFile(staged / "main.tex", "new");
    }

    void makeOldEntry()
    {
        createDirs(entry);
        writeFile(entry / "main.tex", "old");
    }

    std::vector<std::string> backups()
    {
        std::vector<std::string> res;
        for (auto & name : listDir(root))
            if (name.find(".old.") != name.npos)
                res.push_back(name);
        return res;
    }

    CacheFailure publishExpectingFailure(const RenameFn & rename)
    {
        try {
            publishEntry(staged, entry, rename);
        } catch (CacheError & e) {
            return e.failure();
        }
        ADD_FAILURE() << "publishEntry() did not fail";
        return {};
    }
};

TEST_F(PublishTest, createsNewEntry)
{
    publishEntry(staged, entry, renameFile);

    EXPECT_EQ(readFile(entry / "main.tex"), "new");
    EXPECT_FALSE(pathExists(staged));
    EXPECT_TRUE(backups().empty());
}

TEST_F(PublishTest, replacesExistingEntry)
{
    makeOldEntry();

    publishEntry(staged, entry, renameFile);

    EXPECT_EQ(readFile(entry / "main.tex"), "new");
    EXPECT_FALSE(pathExists(staged));
    EXPECT_TRUE(backups().empty());
}

TEST_F(PublishTest, moveAsideFailureKeepsOldEntry)
{
    makeOldEntry();
    FlakyRename rename{.failOn = {1}};

    auto failure = publishExpectingFailure(rename.fn());

    EXPECT_EQ(failure.kind, FailureKind::PublishFailed);
    EXPECT_EQ(failure.stage, CacheStage::Publish);
    EXPECT_EQ(readFile(entry / "main.tex"), "old");
    EXPECT_TRUE(pathExists(staged));
    EXPECT_TRUE(backups().empty());
}

TEST_F(PublishTest, publishFailureRollsBack)
{
    makeOldEntry();
    FlakyRename rename{.failOn = {2}};

    auto failure = publishExpectingFailure(rename.fn());

    EXPECT_EQ(failure.kind, FailureKind::PublishFailed);
    EXPECT_FALSE(failure.cause);
    EXPECT_FALSE(failure.needsOperatorAttention());
    EXPECT_EQ(rename.calls, 3u);
    EXPECT_EQ(readFile(entry / "main.tex"), "old");
    EXPECT_TRUE(backups().empty());
}

TEST_F(PublishTest, failedRollbackIsReportedWithCause)
{
    makeOldEntry();
    FlakyRename rename{.failOn = {2, 3}};

    auto failure = publishExpectingFailure(rename.fn());

    EXPECT_EQ(failure.kind, FailureKind::RollbackFailed);
    EXPECT_TRUE(failure.needsOperatorAttention());
    ASSERT_TRUE(failure.cause);
    EXPECT_EQ(failure.cause->kind, FailureKind::PublishFailed);
    EXPECT_THAT(failure.describe(), ::testing::HasSubstr("caused by publish-failed"));

    /* The old tree survives at its backup path for an operator to restore. */
    EXPECT_FALSE(pathExists(entry));
    auto left = backups();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_TRUE(hasPrefix(left[0], "k.old."));
    EXPECT_EQ(readFile(root / left[0] / "main.tex"), "old");
}

TEST_F(PublishTest, publishFailureWithoutOldEntry)
{
    FlakyRename rename{.failOn = {1}};

    auto failure = publishExpectingFailure(rename.fn());

    EXPECT_EQ(failure.kind, FailureKind::PublishFailed);
    EXPECT_EQ(rename.calls, 1u);
    EXPECT_FALSE(pathExists(entry));
}

/* ----------------------------------------------------------------------------
 * staging directory names
 * --------------------------------------------------------------------------*/

TEST(isStagingNameFor, matchesOwnSuffixes)
{
    ASSERT_TRUE(isStagingNameFor("2301.00001.1234-5678", "2301.00001"));
    ASSERT_TRUE(isStagingNameFor("k.1-2", "k"));
}

TEST(isStagingNameFor, rejectsOtherKeys)
{
    ASSERT_FALSE(isStagingNameFor("kk.1-2", "k"));
    ASSERT_FALSE(isStagingNameFor("2301.00001v2.1-2", "2301.00001"));
    ASSERT_FALSE(isStagingNameFor("k", "k"));
    ASSERT_FALSE(isStagingNameFor("k.", "k"));
    ASSERT_FALSE(isStagingNameFor("k.tmp", "k"));
}

TEST_F(PublishTest, removeLeftoverStaging)
{
    auto stagingRoot = root / ".staging";
    createDirs(stagingRoot / "k.123-4" / "tree");
    createDirs(stagingRoot / "k.5-6");
    createDirs(stagingRoot / "kk.1-2");
    createDirs(stagingRoot / "other.1-2");

    removeLeftoverStaging(stagingRoot, "k");

    EXPECT_THAT(listDir(stagingRoot), ::testing::ElementsAre("kk.1-2", "other.1-2"));
}

} // namespace papercache
