#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>

#include "papercache/cache/cache-settings.hh"
#include "papercache/util/environment-variables.hh"
#include "papercache/util/file-system.hh"

namespace papercache {

class CacheSettingsTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    std::filesystem::path tmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir);
        setEnv("PAPERCACHE_CONFIG_HOME", (tmpDir / "config").c_str());
        unsetenv("PAPERCACHE_CONFIG");
    }

    void TearDown() override
    {
        unsetenv("PAPERCACHE_CONFIG_HOME");
        unsetenv("PAPERCACHE_CONFIG");
        unsetenv("PAPERCACHE_CACHE_HOME");
        delTmpDir.reset();
    }
};

TEST_F(CacheSettingsTest, defaults)
{
    CacheSettings settings;

    EXPECT_EQ(settings.lockTimeout.get(), 30u);
    EXPECT_TRUE(settings.useCache.get());
    EXPECT_TRUE(settings.repairStale.get());
    EXPECT_EQ(settings.payloadExtension.get(), ".tex");
    EXPECT_EQ(settings.sourceUrl.get(), "https://arxiv.org/e-print/");
    EXPECT_EQ(settings.probeMarker.get(), "Download source");
    EXPECT_EQ(settings.probeAttempts.get(), 3u);
}

TEST_F(CacheSettingsTest, cacheDirFollowsEnvironment)
{
    setEnv("PAPERCACHE_CACHE_HOME", (tmpDir / "cache").c_str());

    CacheSettings settings;

    EXPECT_EQ(settings.cacheDir.get(), (tmpDir / "cache").string());
}

TEST_F(CacheSettingsTest, noConfigFileIsFine)
{
    CacheSettings settings;

    ASSERT_NO_THROW(loadConfFile(settings));
    EXPECT_EQ(settings.lockTimeout.get(), 30u);
}

TEST_F(CacheSettingsTest, readsUserConfigFile)
{
    createDirs(tmpDir / "config");
    writeFile(
        tmpDir / "config" / "papercache.conf",
        "# papercache settings\n"
        "lock-timeout = 5\n"
        "use-cache = false\n"
        "cache-dir = /var/cache/papers//\n");

    CacheSettings settings;
    loadConfFile(settings);

    EXPECT_EQ(settings.lockTimeout.get(), 5u);
    EXPECT_FALSE(settings.useCache.get());
    EXPECT_EQ(settings.cacheDir.get(), "/var/cache/papers");
}

TEST_F(CacheSettingsTest, environmentOverridesConfigFile)
{
    createDirs(tmpDir / "config");
    writeFile(tmpDir / "config" / "papercache.conf", "lock-timeout = 5\nprobe-attempts = 7\n");
    setEnv("PAPERCACHE_CONFIG", "lock-timeout = 9\nrepair-stale = no\n");

    CacheSettings settings;
    loadConfFile(settings);

    EXPECT_EQ(settings.lockTimeout.get(), 9u);
    EXPECT_EQ(settings.probeAttempts.get(), 7u);
    EXPECT_FALSE(settings.repairStale.get());
}

TEST_F(CacheSettingsTest, invalidValueThrows)
{
    setEnv("PAPERCACHE_CONFIG", "lock-timeout = soon\n");

    CacheSettings settings;
    ASSERT_THROW(loadConfFile(settings), UsageError);
}

TEST_F(CacheSettingsTest, toJSONListsEverySetting)
{
    CacheSettings settings;
    auto json = settings.toJSON();

    for (auto name :
         {"cache-dir",
          "lock-timeout",
          "use-cache",
          "repair-stale",
          "payload-extension",
          "source-url",
          "probe-url",
          "probe-marker",
          "user-agent",
          "connect-timeout",
          "transfer-timeout",
          "probe-attempts"})
        EXPECT_TRUE(json.contains(name)) << name;

    EXPECT_EQ(json["lock-timeout"]["value"].get<unsigned int>(), 30u);
}

} // namespace papercache
