#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

#include "papercache/cache/cache-lock.hh"
#include "papercache/cache/cache-settings.hh"
#include "papercache/cache/lock-file.hh"
#include "papercache/cache/source-cache.hh"
#include "papercache/cache/tests/archives.hh"
#include "papercache/cache/tests/cache-root.hh"
#include "papercache/cache/tests/fake-source.hh"
#include "papercache/util/strings.hh"

namespace papercache {

using namespace tests;

class SourceCacheTest : public CacheRootTest
{
protected:
    FakeArchiveSource source;

    void SetUp() override
    {
        CacheRootTest::SetUp();
        source.archive = [](std::string_view key) { return makePaperTarball(fmt("paper %s", key)); };
    }

    CacheOutcome ensure(std::string_view key, bool useCache = true, bool repairStale = true, unsigned int lockTimeout = 30)
    {
        return SourceCache(root, source).ensureCached(key, useCache, repairStale, lockTimeout);
    }

    /**
     * A complete entry built by hand, as an earlier run would have left it.
     */
    void makeEntry(std::string_view key, const std::string & mainTex)
    {
        auto entry = root / key;
        createDirs(entry);
        writeFile(entry / "main.tex", mainTex);
        writeFile(entry / completionMarker, std::string(key) + "\n");
    }

    std::vector<std::string> backups()
    {
        std::vector<std::string> res;
        for (auto & name : listDir(root))
            if (name.find(".old.") != name.npos)
                res.push_back(name);
        return res;
    }
};

/* ----------------------------------------------------------------------------
 * Building entries
 * --------------------------------------------------------------------------*/

TEST_F(SourceCacheTest, freshKeyIsFetchedAndPublished)
{
    ASSERT_TRUE(ensureCached(source, "P1", root, false, true, 30));

    EXPECT_EQ(readFile(root / "P1" / "main.tex"), "paper P1");
    EXPECT_EQ(readFile(root / "P1" / completionMarker), "P1\n");
    EXPECT_TRUE(isValidEntry(root / "P1"));
    EXPECT_EQ(source.probes.load(), 1u);
    EXPECT_EQ(source.fetches.load(), 1u);

    /* No staging directories, lock files or backups are left behind. */
    EXPECT_TRUE(listDir(root / ".staging").empty());
    EXPECT_TRUE(listDir(root / ".locks").empty());
    EXPECT_TRUE(backups().empty());
}

TEST_F(SourceCacheTest, validEntryIsServedFromCache)
{
    ASSERT_TRUE(ensure("P1", false));
    ASSERT_EQ(source.fetches.load(), 1u);

    auto outcome = ensure("P1", true);

    EXPECT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.fastPath);
    EXPECT_EQ(source.fetches.load(), 1u);
    EXPECT_EQ(source.probes.load(), 1u);
}

TEST_F(SourceCacheTest, validEntryIsRefetchedWithoutUseCache)
{
    makeEntry("P1", "stale copy");

    auto outcome = ensure("P1", false);

    EXPECT_TRUE(outcome.ok());
    EXPECT_FALSE(outcome.fastPath);
    EXPECT_EQ(source.fetches.load(), 1u);
    EXPECT_EQ(readFile(root / "P1" / "main.tex"), "paper P1");
    EXPECT_TRUE(backups().empty());
}

TEST_F(SourceCacheTest, nestedPayloadIsEnough)
{
    source.archive = [](std::string_view) {
        return makeTarball({
            dirMember("src/"),
            fileMember("src/paper.tex", "nested"),
            fileMember("figure.png", "png"),
        });
    };

    ASSERT_TRUE(ensure("P2").ok());
    EXPECT_EQ(readFile(root / "P2" / "src" / "paper.tex"), "nested");
}

TEST_F(SourceCacheTest, unreadableMembersArePublished)
{
    source.archive = [](std::string_view) {
        auto main = fileMember("main.tex", "locked away");
        main.perm = 0000;
        auto bib = fileMember("refs.bib", "write only");
        bib.perm = 0200;
        return makeTarball({main, bib});
    };

    auto outcome = ensure("P2");
    ASSERT_TRUE(outcome.ok()) << outcome.failure->describe();
    EXPECT_EQ(readFile(root / "P2" / "main.tex"), "locked away");
    EXPECT_TRUE(isValidEntry(root / "P2"));
}

TEST_F(SourceCacheTest, customPayloadExtension)
{
    source.archive = [](std::string_view) { return makeTarball({fileMember("README.md", "# hi")}); };

    SourceCache cache(root, source, {.payloadExtension = ".md"});
    ASSERT_TRUE(cache.ensureCached("P3", true, true, 30).ok());
    EXPECT_TRUE(isValidEntry(root / "P3", ".md"));
    EXPECT_FALSE(isValidEntry(root / "P3"));
}

TEST_F(SourceCacheTest, relativeRootIsMadeAbsolute)
{
    SourceCache cache("relative/cache", source);
    EXPECT_TRUE(cache.getRoot().is_absolute());
    EXPECT_EQ(cache.entryPath("k"), cache.getRoot() / "k");
}

/* ----------------------------------------------------------------------------
 * Stale entries
 * --------------------------------------------------------------------------*/

TEST_F(SourceCacheTest, staleEntryLeftAloneWithoutRepair)
{
    createDirs(root / "P1");
    writeFile(root / "P1" / "main.tex", "half-written");

    auto outcome = ensure("P1", true, false);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::StaleEntry);
    EXPECT_EQ(outcome.failure->stage, CacheStage::CheckExisting);
    EXPECT_EQ(source.probes.load(), 0u);
    EXPECT_EQ(source.fetches.load(), 0u);
    EXPECT_EQ(readFile(root / "P1" / "main.tex"), "half-written");
    EXPECT_FALSE(pathExists(root / "P1" / completionMarker));
}

TEST_F(SourceCacheTest, staleEntryIsRepaired)
{
    createDirs(root / "P1");
    writeFile(root / "P1" / "main.tex", "half-written");

    auto outcome = ensure("P1", true, true);

    ASSERT_TRUE(outcome.ok());
    EXPECT_FALSE(outcome.fastPath);
    EXPECT_EQ(readFile(root / "P1" / "main.tex"), "paper P1");
    EXPECT_TRUE(isValidEntry(root / "P1"));
}

TEST_F(SourceCacheTest, entryWithForeignMarkerIsStale)
{
    createDirs(root / "P1");
    writeFile(root / "P1" / "main.tex", "old layout");
    writeFile(root / "P1" / ".complete", "");

    auto outcome = ensure("P1", true, false);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::StaleEntry);
}

/* ----------------------------------------------------------------------------
 * Failures leave the existing entry alone
 * --------------------------------------------------------------------------*/

TEST_F(SourceCacheTest, unavailableKeyIsNotFetched)
{
    source.available = [](std::string_view) { return false; };

    auto outcome = ensure("P1");

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::Unavailable);
    EXPECT_EQ(outcome.failure->stage, CacheStage::Fetch);
    EXPECT_EQ(source.fetches.load(), 0u);
    EXPECT_FALSE(pathExists(root / "P1"));
}

TEST_F(SourceCacheTest, transferFailureKeepsOldEntry)
{
    makeEntry("P1", "previous");
    source.archive = nullptr;

    auto outcome = ensure("P1", false);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::TransferFailed);
    EXPECT_EQ(outcome.failure->stage, CacheStage::Fetch);
    EXPECT_EQ(readFile(root / "P1" / "main.tex"), "previous");
    EXPECT_TRUE(isValidEntry(root / "P1"));
    EXPECT_TRUE(listDir(root / ".staging").empty());
}

TEST_F(SourceCacheTest, unsafeArchiveKeepsOldEntry)
{
    makeEntry("P1", "previous");
    source.archive = [](std::string_view) {
        return makeTarball({fileMember("main.tex", "evil"), fileMember("../../escape.tex", "evil")});
    };

    auto outcome = ensure("P1", false);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::UnsafeArchive);
    EXPECT_EQ(outcome.failure->stage, CacheStage::Extract);
    EXPECT_EQ(readFile(root / "P1" / "main.tex"), "previous");
    EXPECT_FALSE(pathExists(tmpDir / "escape.tex"));
    EXPECT_TRUE(listDir(root / ".staging").empty());
}

TEST_F(SourceCacheTest, symlinkArchiveIsUnsafe)
{
    source.archive = [](std::string_view) {
        return makeTarball({fileMember("main.tex", "ok"), symlinkMember("secret.tex", "/etc/passwd")});
    };

    auto outcome = ensure("P1");

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::UnsafeArchive);
    EXPECT_FALSE(pathExists(root / "P1"));
}

TEST_F(SourceCacheTest, archiveWithoutPayloadIsEmpty)
{
    makeEntry("P1", "previous");
    source.archive = [](std::string_view) { return makeTarball({fileMember("paper.pdf", "%PDF")}); };

    auto outcome = ensure("P1", false);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::EmptyArchive);
    EXPECT_EQ(outcome.failure->stage, CacheStage::PostValidate);
    EXPECT_EQ(readFile(root / "P1" / "main.tex"), "previous");
}

TEST_F(SourceCacheTest, garbageIsBadArchive)
{
    source.archive = [](std::string_view) {
        /* The member claims far more data than the archive holds. */
        auto tarball = makeTarball({fileMember("main.tex", std::string(100000, 'x'))}, false);
        return tarball.substr(0, 2048);
    };

    auto outcome = ensure("P1");

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::BadArchive);
    EXPECT_EQ(outcome.failure->stage, CacheStage::Extract);
    EXPECT_FALSE(pathExists(root / "P1"));
}

TEST_F(SourceCacheTest, invalidKeyIsRejected)
{
    auto outcome = ensure("../escape");

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::InvalidKey);
    EXPECT_EQ(source.probes.load(), 0u);
}

TEST_F(SourceCacheTest, unusableRootIsIoError)
{
    writeFile(tmpDir / "blocker", "");
    SourceCache cache(tmpDir / "blocker" / "cache", source);

    auto outcome = cache.ensureCached("P1", true, true, 30);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::IoError);
    EXPECT_EQ(source.probes.load(), 0u);
}

/* ----------------------------------------------------------------------------
 * Publishing
 * --------------------------------------------------------------------------*/

TEST_F(SourceCacheTest, publishFailureKeepsOldEntry)
{
    makeEntry("P1", "previous");

    unsigned int calls = 0;
    SourceCache::Options options;
    options.rename = [&](const std::filesystem::path & from, const std::filesystem::path & to) {
        if (++calls == 2)
            throw SysError(EIO, "renaming '%1%' to '%2%'", from.string(), to.string());
        renameFile(from, to);
    };

    auto outcome = SourceCache(root, source, options).ensureCached("P1", false, true, 30);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::PublishFailed);
    EXPECT_EQ(outcome.failure->stage, CacheStage::Publish);
    EXPECT_EQ(readFile(root / "P1" / "main.tex"), "previous");
    EXPECT_TRUE(backups().empty());
    EXPECT_TRUE(listDir(root / ".staging").empty());
}

TEST_F(SourceCacheTest, failedRollbackNeedsOperator)
{
    makeEntry("P1", "previous");

    unsigned int calls = 0;
    SourceCache::Options options;
    options.rename = [&](const std::filesystem::path & from, const std::filesystem::path & to) {
        if (++calls >= 2)
            throw SysError(EIO, "renaming '%1%' to '%2%'", from.string(), to.string());
        renameFile(from, to);
    };

    auto outcome = SourceCache(root, source, options).ensureCached("P1", false, true, 30);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::RollbackFailed);
    EXPECT_TRUE(outcome.failure->needsOperatorAttention());
    ASSERT_TRUE(outcome.failure->cause);
    EXPECT_EQ(outcome.failure->cause->kind, FailureKind::PublishFailed);
    ASSERT_EQ(backups().size(), 1u);
    EXPECT_EQ(readFile(root / backups()[0] / "main.tex"), "previous");
}

TEST_F(SourceCacheTest, leftoverStagingIsRemoved)
{
    createDirs(root / ".staging" / "P1.999-1" / "tree");
    createDirs(root / ".staging" / "P2.999-1");

    ASSERT_TRUE(ensure("P1").ok());

    EXPECT_THAT(listDir(root / ".staging"), ::testing::ElementsAre("P2.999-1"));
}

/* ----------------------------------------------------------------------------
 * Locking
 * --------------------------------------------------------------------------*/

TEST_F(SourceCacheTest, lockTimeoutIsReported)
{
    createDirs(root / ".locks");
    auto holder = openLockFile(getCacheLockPath(root, "P1"), true);
    ASSERT_TRUE(lockFile(holder.get(), false));

    auto start = std::chrono::steady_clock::now();
    auto outcome = ensure("P1", true, true, 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::LockTimeout);
    EXPECT_EQ(source.probes.load(), 0u);
    EXPECT_FALSE(pathExists(root / "P1"));
    EXPECT_LE(elapsed, std::chrono::milliseconds(1500));
}

TEST_F(SourceCacheTest, waiterSeesEntryBuiltByHolder)
{
    /* The second caller blocks on the lock while the first fetches, then
       finds the finished entry and does not fetch again. */
    std::atomic<bool> fetching{false};
    source.archive = [&](std::string_view key) {
        fetching = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return makePaperTarball(fmt("paper %s", key));
    };

    std::thread first([&]() { EXPECT_TRUE(ensure("P1").ok()); });
    while (!fetching)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    auto outcome = ensure("P1");
    first.join();

    EXPECT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.fastPath);
    EXPECT_EQ(source.fetches.load(), 1u);
}

TEST_F(SourceCacheTest, concurrentRefreshesSerialize)
{
    constexpr unsigned int nThreads = 8;

    std::atomic<unsigned int> counter{0};
    std::atomic<unsigned int> inFetch{0};
    std::atomic<bool> overlapped{false};
    source.archive = [&](std::string_view) {
        if (++inFetch > 1)
            overlapped = true;
        auto n = ++counter;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --inFetch;
        return makePaperTarball(fmt("fetch #%d", n));
    };

    std::atomic<bool> done{false};
    std::atomic<unsigned int> badReads{0};

    /* Readers take no lock: whenever they can read the payload, it must
       be one complete version. */
    std::thread reader([&]() {
        while (!done) {
            try {
                auto s = readFile(root / "P1" / "main.tex");
                if (!hasPrefix(s, "fetch #"))
                    badReads++;
            } catch (SystemError &) {
            }
        }
    });

    std::vector<std::thread> threads;
    std::atomic<unsigned int> succeeded{0};
    for (unsigned int i = 0; i < nThreads; i++)
        threads.emplace_back([&]() {
            if (ensure("P1", false).ok())
                succeeded++;
        });
    for (auto & t : threads)
        t.join();

    done = true;
    reader.join();

    EXPECT_EQ(succeeded.load(), nThreads);
    EXPECT_EQ(source.fetches.load(), nThreads);
    EXPECT_FALSE(overlapped);
    EXPECT_EQ(badReads.load(), 0u);
    EXPECT_EQ(readFile(root / "P1" / "main.tex"), fmt("fetch #%d", nThreads));
    EXPECT_TRUE(isValidEntry(root / "P1"));
    EXPECT_TRUE(listDir(root / ".staging").empty());
    EXPECT_TRUE(backups().empty());
}

TEST_F(SourceCacheTest, differentKeysProceedIndependently)
{
    std::vector<std::thread> threads;
    for (auto key : {"A", "B", "C", "D"})
        threads.emplace_back([&, key]() { EXPECT_TRUE(ensure(key, false).ok()); });
    for (auto & t : threads)
        t.join();

    for (auto key : {"A", "B", "C", "D"})
        EXPECT_EQ(readFile(root / key / "main.tex"), fmt("paper %s", key));
}

TEST_F(SourceCacheTest, concurrentProcesses)
{
    constexpr int nChildren = 4;

    std::vector<pid_t> children;
    for (int i = 0; i < nChildren; i++) {
        pid_t pid = fork();
        if (pid == 0) {
            FakeArchiveSource childSource;
            childSource.archive = [i](std::string_view) { return makePaperTarball(fmt("child %d", i)); };
            bool ok = ensureCached(childSource, "P1", root, false, true, 30);
            _exit(ok ? 0 : 1);
        }
        ASSERT_GT(pid, 0);
        children.push_back(pid);
    }

    for (auto pid : children) {
        int status;
        ASSERT_EQ(waitpid(pid, &status, 0), pid);
        EXPECT_TRUE(WIFEXITED(status));
        EXPECT_EQ(WEXITSTATUS(status), 0);
    }

    EXPECT_TRUE(isValidEntry(root / "P1"));
    EXPECT_TRUE(hasPrefix(readFile(root / "P1" / "main.tex"), "child "));
    EXPECT_TRUE(listDir(root / ".staging").empty());
    EXPECT_TRUE(backups().empty());
}

/* ----------------------------------------------------------------------------
 * Settings
 * --------------------------------------------------------------------------*/

TEST_F(SourceCacheTest, settingsDriveTheCall)
{
    CacheSettings settings;
    settings.cacheDir = root.string();
    settings.useCache = false;
    settings.lockTimeout = 5;

    ASSERT_TRUE(ensureCached(source, "P1", settings).ok());
    ASSERT_TRUE(ensureCached(source, "P1", settings).ok());
    EXPECT_EQ(source.fetches.load(), 2u);

    settings.useCache = true;
    auto outcome = ensureCached(source, "P1", settings);
    EXPECT_TRUE(outcome.fastPath);
    EXPECT_EQ(source.fetches.load(), 2u);
}

} // namespace papercache
