#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "papercache/cache/lock-file.hh"
#include "papercache/util/file-system.hh"

using namespace std::chrono_literals;

namespace papercache {

class LockFileTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    std::filesystem::path tmpDir;
    std::filesystem::path lockPath;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir);
        lockPath = tmpDir / "2301.00001.lock";
    }

    /* Lock `lockPath` through a descriptor of our own, as another process would. */
    AutoCloseFD holdExternally()
    {
        auto fd = openLockFile(lockPath, true);
        if (!lockFile(fd.get(), false))
            throw Error("lock '%s' unexpectedly held", lockPath.string());
        return fd;
    }

    static struct stat fstatOf(Descriptor fd)
    {
        struct stat st;
        if (fstat(fd, &st) == -1)
            throw SysError("fstat");
        return st;
    }
};

/* ----------------------------------------------------------------------------
 * openLockFile, lockFile
 * --------------------------------------------------------------------------*/

TEST_F(LockFileTest, openWithoutCreateOfMissingFile)
{
    ASSERT_FALSE(openLockFile(lockPath, false));
    ASSERT_FALSE(pathExists(lockPath));
}

TEST_F(LockFileTest, openInMissingDirectoryThrows)
{
    ASSERT_THROW(openLockFile(tmpDir / ".locks" / "x.lock", true), SysError);
}

TEST_F(LockFileTest, secondDescriptorCannotLock)
{
    auto holder = holdExternally();
    auto other = openLockFile(lockPath, true);

    ASSERT_FALSE(lockFile(other.get(), false));

    unlockFile(holder.get());
    ASSERT_TRUE(lockFile(other.get(), false));
}

TEST_F(LockFileTest, zeroTimeoutWaitsForever)
{
    auto fd = openLockFile(lockPath, true);
    ASSERT_TRUE(lockFile(fd.get(), 0s));
}

TEST_F(LockFileTest, timedLockGivesUpAtDeadline)
{
    auto holder = holdExternally();
    auto other = openLockFile(lockPath, true);

    auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(lockFile(other.get(), 1s));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 900ms);
    EXPECT_LE(elapsed, 1500ms);
}

TEST_F(LockFileTest, timedLockSucceedsOnceReleased)
{
    auto holder = holdExternally();

    std::thread releaser([&]() {
        std::this_thread::sleep_for(100ms);
        unlockFile(holder.get());
    });

    auto other = openLockFile(lockPath, true);
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(lockFile(other.get(), 5s));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);

    releaser.join();
}

TEST_F(LockFileTest, lockDiesWithProcess)
{
    pid_t pid = fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        auto fd = openLockFile(lockPath, true);
        _exit(lockFile(fd.get(), false) ? 0 : 1);
    }

    int status;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    ASSERT_EQ(WEXITSTATUS(status), 0);

    auto fd = openLockFile(lockPath, true);
    ASSERT_TRUE(lockFile(fd.get(), false));
}

/* ----------------------------------------------------------------------------
 * LockFile
 * --------------------------------------------------------------------------*/

TEST_F(LockFileTest, uncontestedLockCreatesFile)
{
    LockFile lock(lockPath, 1, "2301.00001");

    ASSERT_TRUE(pathExists(lockPath));
    ASSERT_EQ(fstatOf(lock.get()).st_size, 0);
}

TEST_F(LockFileTest, releaseRemovesFileAndMarksIt)
{
    LockFile lock(lockPath, 1, "2301.00001");
    auto observer = openLockFile(lockPath, false);
    ASSERT_TRUE(observer);

    lock.release();

    ASSERT_FALSE(pathExists(lockPath));
    auto st = fstatOf(observer.get());
    EXPECT_EQ(st.st_nlink, 0u);
    EXPECT_EQ(st.st_size, (off_t) staleLockMarker.size());

    ASSERT_NO_THROW(lock.release());
}

TEST_F(LockFileTest, releaseAfterFileVanishedLeavesNoMarker)
{
    LockFile lock(lockPath, 1, "2301.00001");
    auto observer = openLockFile(lockPath, false);
    ASSERT_EQ(unlink(lockPath.c_str()), 0);

    lock.release();

    EXPECT_EQ(fstatOf(observer.get()).st_size, 0);
}

TEST_F(LockFileTest, destructorReleases)
{
    {
        LockFile lock(lockPath, 1, "2301.00001");
    }
    ASSERT_FALSE(pathExists(lockPath));

    LockFile again(lockPath, 1, "2301.00001");
}

TEST_F(LockFileTest, movedFromLockReleasesNothing)
{
    LockFile first(lockPath, 1, "2301.00001");
    {
        LockFile second(std::move(first));
        ASSERT_TRUE(pathExists(lockPath));
    }
    ASSERT_FALSE(pathExists(lockPath));
}

TEST_F(LockFileTest, contestedLockTimesOut)
{
    auto holder = holdExternally();

    auto start = std::chrono::steady_clock::now();
    ASSERT_THROW(LockFile(lockPath, 1, "2301.00001"), LockTimeout);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 900ms);
    EXPECT_LE(elapsed, 1500ms);
}

TEST_F(LockFileTest, markedFileLeftByCrashIsReplaced)
{
    {
        auto fd = openLockFile(lockPath, true);
        writeFull(fd.get(), staleLockMarker);
    }
    struct stat old;
    ASSERT_EQ(stat(lockPath.c_str(), &old), 0);

    LockFile lock(lockPath, 1, "2301.00001");

    auto st = fstatOf(lock.get());
    EXPECT_EQ(st.st_size, 0);
    EXPECT_EQ(st.st_nlink, 1u);
}

TEST_F(LockFileTest, waiterMovesToFreshFileAfterRelease)
{
    auto holder = std::make_unique<LockFile>(lockPath, 1, "holder");

    std::thread releaser([&]() {
        std::this_thread::sleep_for(100ms);
        holder.reset();
    });

    LockFile waiter(lockPath, 5, "waiter");
    releaser.join();

    struct stat stPath;
    ASSERT_EQ(stat(lockPath.c_str(), &stPath), 0);
    auto st = fstatOf(waiter.get());
    EXPECT_EQ(st.st_ino, stPath.st_ino);
    EXPECT_EQ(st.st_size, 0);
}

TEST_F(LockFileTest, timeoutSpansReplacedLockFiles)
{
    auto first = std::make_unique<LockFile>(lockPath, 1, "first");

    bool timedOut = false;
    std::chrono::steady_clock::duration elapsed;

    std::thread waiter([&]() {
        auto start = std::chrono::steady_clock::now();
        try {
            LockFile lock(lockPath, 2, "waiter");
        } catch (LockTimeout &) {
            timedOut = true;
        }
        elapsed = std::chrono::steady_clock::now() - start;
    });

    /* Hand over to a newcomer while the waiter sleeps between polls, so
       the waiter wakes up on the released file and has to start over on
       the new one. */
    std::this_thread::sleep_for(1500ms);
    first.reset();
    LockFile second(lockPath, 5, "second");

    waiter.join();

    EXPECT_TRUE(timedOut);
    EXPECT_GE(elapsed, 1900ms);
    EXPECT_LE(elapsed, 2600ms);
}

TEST_F(LockFileTest, processesTakeTurns)
{
    int ready[2];
    ASSERT_EQ(pipe(ready), 0);

    pid_t pid = fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        close(ready[0]);
        {
            LockFile lock(lockPath, 5, "child");
            if (write(ready[1], "1", 1) != 1)
                _exit(1);
            std::this_thread::sleep_for(200ms);
        }
        _exit(0);
    }

    close(ready[1]);
    char c;
    ASSERT_EQ(read(ready[0], &c, 1), 1);
    close(ready[0]);

    auto start = std::chrono::steady_clock::now();
    LockFile lock(lockPath, 5, "parent");
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);

    int status;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

} // namespace papercache
