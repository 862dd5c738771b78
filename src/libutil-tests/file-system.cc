#include "papercache/util/file-system.hh"
#include "papercache/util/strings.hh"

#include <gtest/gtest.h>

#include <set>
#include <sys/stat.h>
#include <unistd.h>

namespace papercache {

class FileSystemTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    std::filesystem::path tmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir);
    }

    void TearDown() override
    {
        delTmpDir.reset();
    }
};

/* ----------------------------------------------------------------------------
 * readFile, writeFile
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, writeThenRead)
{
    auto p = tmpDir / "main.tex";
    writeFile(p, "\\documentclass{article}\n");
    ASSERT_EQ(readFile(p), "\\documentclass{article}\n");

    writeFile(p, "short", 0644, FsSync::Yes);
    ASSERT_EQ(readFile(p), "short");
}

TEST_F(FileSystemTest, writeFileMode)
{
    auto p = tmpDir / "ro";
    writeFile(p, "x", 0600);
    auto st = maybeLstat(p);
    ASSERT_TRUE(st);
    ASSERT_EQ(st->st_mode & 0777, 0600u);
}

TEST_F(FileSystemTest, readMissingFileThrows)
{
    ASSERT_THROW(readFile(tmpDir / "missing"), SysError);
}

TEST_F(FileSystemTest, writeIntoMissingDirectoryThrows)
{
    ASSERT_THROW(writeFile(tmpDir / "no" / "such" / "file", "x"), SysError);
}

/* ----------------------------------------------------------------------------
 * pathExists, maybeLstat
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, pathExists)
{
    ASSERT_TRUE(pathExists(tmpDir));
    ASSERT_FALSE(pathExists(tmpDir / "missing"));
    ASSERT_FALSE(pathExists(tmpDir / "missing" / "deeper"));
}

TEST_F(FileSystemTest, pathExistsDoesNotFollowSymlinks)
{
    std::filesystem::create_symlink(tmpDir / "missing", tmpDir / "dangling");
    ASSERT_TRUE(pathExists(tmpDir / "dangling"));
    auto st = maybeLstat((tmpDir / "dangling").string());
    ASSERT_TRUE(st);
    ASSERT_TRUE(S_ISLNK(st->st_mode));
}

TEST_F(FileSystemTest, maybeLstatThroughFile)
{
    writeFile(tmpDir / "file", "");
    ASSERT_FALSE(maybeLstat((tmpDir / "file" / "child").string()));
}

/* ----------------------------------------------------------------------------
 * createDirs, deletePath
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, createDirsIsIdempotent)
{
    createDirs(tmpDir / "a" / "b" / "c");
    ASSERT_NO_THROW(createDirs(tmpDir / "a" / "b" / "c"));
    ASSERT_TRUE(std::filesystem::is_directory(tmpDir / "a" / "b" / "c"));
}

TEST_F(FileSystemTest, createDirsBlockedByFile)
{
    writeFile(tmpDir / "a", "");
    ASSERT_THROW(createDirs(tmpDir / "a" / "b"), SysError);
}

TEST_F(FileSystemTest, deletePathRemovesTree)
{
    createDirs(tmpDir / "tree" / "sub" / "deeper");
    writeFile(tmpDir / "tree" / "top.tex", "top");
    writeFile(tmpDir / "tree" / "sub" / "deeper" / "leaf.tex", "leaf");
    std::filesystem::create_symlink("/", tmpDir / "tree" / "sub" / "root-link");

    deletePath(tmpDir / "tree");

    ASSERT_FALSE(pathExists(tmpDir / "tree"));
    ASSERT_TRUE(pathExists("/"));
}

TEST_F(FileSystemTest, deletePathHandlesReadOnlyDirectories)
{
    createDirs(tmpDir / "tree" / "locked");
    writeFile(tmpDir / "tree" / "locked" / "file", "x");
    chmod((tmpDir / "tree" / "locked").c_str(), 0555);

    deletePath(tmpDir / "tree");

    ASSERT_FALSE(pathExists(tmpDir / "tree"));
}

TEST_F(FileSystemTest, deletePathOfMissingPathIsNoop)
{
    ASSERT_NO_THROW(deletePath(tmpDir / "missing"));
    ASSERT_NO_THROW(deletePath(tmpDir / "missing" / "deeper"));
}

TEST_F(FileSystemTest, recursiveSync)
{
    createDirs(tmpDir / "tree" / "sub");
    writeFile(tmpDir / "tree" / "sub" / "a", "a");
    writeFile(tmpDir / "tree" / "b", "b");

    ASSERT_NO_THROW(recursiveSync(tmpDir / "tree"));
    ASSERT_NO_THROW(recursiveSync(tmpDir / "tree" / "b"));
}

/* ----------------------------------------------------------------------------
 * renameFile
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, renameFileReplacesTarget)
{
    writeFile(tmpDir / "new", "new");
    writeFile(tmpDir / "old", "old");

    renameFile(tmpDir / "new", tmpDir / "old");

    ASSERT_EQ(readFile(tmpDir / "old"), "new");
    ASSERT_FALSE(pathExists(tmpDir / "new"));
}

TEST_F(FileSystemTest, renameMissingThrows)
{
    try {
        renameFile(tmpDir / "missing", tmpDir / "other");
        FAIL() << "renaming a missing file succeeded";
    } catch (SysError & e) {
        ASSERT_EQ(e.errNo, ENOENT);
    }
}

TEST_F(FileSystemTest, renameDirectoryOntoNonEmptyDirectoryFails)
{
    createDirs(tmpDir / "a");
    createDirs(tmpDir / "b");
    writeFile(tmpDir / "b" / "keep", "");

    ASSERT_THROW(renameFile(tmpDir / "a", tmpDir / "b"), SysError);
    ASSERT_TRUE(pathExists(tmpDir / "b" / "keep"));
}

/* ----------------------------------------------------------------------------
 * AutoDelete, temporary paths
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, autoDeleteRemovesOnScopeExit)
{
    auto p = tmpDir / "scoped";
    {
        createDirs(p / "inner");
        AutoDelete del(p);
    }
    ASSERT_FALSE(pathExists(p));
}

TEST_F(FileSystemTest, autoDeleteCancel)
{
    auto p = tmpDir / "kept";
    {
        createDirs(p);
        AutoDelete del(p);
        del.cancel();
    }
    ASSERT_TRUE(pathExists(p));
}

TEST_F(FileSystemTest, autoDeleteOfMissingPathIsHarmless)
{
    ASSERT_NO_THROW({ AutoDelete del(tmpDir / "never-created"); });
}

TEST_F(FileSystemTest, createTempDirUnderRoot)
{
    auto dir = createTempDir(tmpDir.string(), "staging");
    ASSERT_TRUE(std::filesystem::is_directory(dir));
    ASSERT_EQ(std::filesystem::path(dir).parent_path().string(), tmpDir.string());
    ASSERT_TRUE(hasPrefix(std::filesystem::path(dir).filename().string(), "staging-"));
}

TEST(uniqueSuffix, isUniqueWithinProcess)
{
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i)
        ASSERT_TRUE(seen.insert(uniqueSuffix()).second);
}

TEST(uniqueSuffix, startsWithPid)
{
    ASSERT_TRUE(hasPrefix(uniqueSuffix(), std::to_string(getpid()) + "-"));
}

} // namespace papercache
