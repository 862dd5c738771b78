#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

#include "papercache/cache/cache-lock.hh"
#include "papercache/cache/cache-lock-impl.hh"
#include "papercache/cache/key.hh"
#include "papercache/cache/tests/cache-root.hh"

using namespace std::chrono_literals;

namespace papercache {

using tests::listDir;

class CacheLockTest : public tests::CacheRootTest
{
protected:
    /* Hold the lock for `key` the way a process that is not using
       withCacheLock() would. */
    AutoCloseFD holdLock(std::string_view key)
    {
        auto path = getCacheLockPath(root, key);
        createDirs(path.parent_path());
        auto fd = openLockFile(path, true);
        if (!lockFile(fd.get(), false))
            throw Error("lock for '%s' is already held", key);
        return fd;
    }
};

TEST_F(CacheLockTest, lockPathDependsOnlyOnKey)
{
    EXPECT_EQ(getCacheLockPath(root, "2301.00001"), getCacheLockPath(root, "2301.00001"));
    EXPECT_NE(getCacheLockPath(root, "2301.00001"), getCacheLockPath(root, "2301.00002"));
    EXPECT_NE(getCacheLockPath(root, "2301.00001"), getCacheLockPath(root / "other", "2301.00001"));
}

TEST_F(CacheLockTest, lockPathLayout)
{
    auto path = getCacheLockPath(root, "hep-th/9901001");
    EXPECT_EQ(path.parent_path().string(), (root / ".locks").string());
    EXPECT_EQ(path.filename().string(), hashKey("hep-th/9901001") + ".lock");
}

TEST_F(CacheLockTest, bodyResultIsReturned)
{
    auto res = withCacheLock(root, "2301.00001", 1, [&]() {
        EXPECT_TRUE(pathExists(getCacheLockPath(root, "2301.00001")));
        return std::string("built");
    });

    EXPECT_EQ(res, "built");
    EXPECT_FALSE(pathExists(getCacheLockPath(root, "2301.00001")));
    EXPECT_TRUE(listDir(root / ".locks").empty());
}

TEST_F(CacheLockTest, lockIsReleasedWhenBodyThrows)
{
    EXPECT_THROW(
        withCacheLock(root, "2301.00001", 1, [&]() -> int { throw Error("extraction failed"); }), Error);

    EXPECT_TRUE(listDir(root / ".locks").empty());

    int runs = 0;
    withCacheLock(root, "2301.00001", 1, [&]() { runs++; });
    EXPECT_EQ(runs, 1);
}

TEST_F(CacheLockTest, timeoutSkipsBody)
{
    auto holder = holdLock("2301.00001");

    bool ran = false;
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(withCacheLock(root, "2301.00001", 1, [&]() { ran = true; }), LockTimeout);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(ran);
    EXPECT_GE(elapsed, 900ms);
    EXPECT_LE(elapsed, 1500ms);
}

TEST_F(CacheLockTest, keysAreIndependent)
{
    auto holder = holdLock("2301.00001");

    bool ran = false;
    withCacheLock(root, "2301.00002", 1, [&]() { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(CacheLockTest, threadsTakeTurns)
{
    /* An unguarded read-modify-write of a file; lost updates would show
       up as a short count. */
    auto counter = root / "counter";
    createDirs(root);
    writeFile(counter, "0");

    auto worker = [&]() {
        for (int i = 0; i < 5; ++i)
            withCacheLock(root, "2301.00001", 10, [&]() {
                auto n = std::stoi(readFile(counter));
                std::this_thread::sleep_for(2ms);
                writeFile(counter, std::to_string(n + 1));
            });
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++)
        threads.emplace_back(worker);
    for (auto & t : threads)
        t.join();

    EXPECT_EQ(readFile(counter), "20");
    EXPECT_TRUE(listDir(root / ".locks").empty());
}

TEST_F(CacheLockTest, otherProcessWaitsForHolder)
{
    int ready[2];
    ASSERT_EQ(pipe(ready), 0);

    pid_t pid = fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        close(ready[0]);
        withCacheLock(root, "2301.00001", 5, [&]() {
            if (write(ready[1], "1", 1) != 1)
                _exit(1);
            std::this_thread::sleep_for(200ms);
            writeFile(root / "child-done", "");
        });
        _exit(0);
    }

    close(ready[1]);
    char c;
    ASSERT_EQ(read(ready[0], &c, 1), 1);
    close(ready[0]);

    bool sawChildWork = false;
    withCacheLock(root, "2301.00001", 5, [&]() { sawChildWork = pathExists(root / "child-done"); });
    EXPECT_TRUE(sawChildWork);

    int status;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST_F(CacheLockTest, crashedHolderDoesNotBlock)
{
    createDirs(root / ".locks");

    pid_t pid = fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        /* Dies holding the lock, without removing the file. */
        auto fd = openLockFile(getCacheLockPath(root, "2301.00001"), true);
        _exit(lockFile(fd.get(), false) ? 0 : 1);
    }

    int status;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_EQ(WEXITSTATUS(status), 0);
    ASSERT_TRUE(pathExists(getCacheLockPath(root, "2301.00001")));

    bool ran = false;
    withCacheLock(root, "2301.00001", 1, [&]() { ran = true; });
    EXPECT_TRUE(ran);
}

} // namespace papercache
