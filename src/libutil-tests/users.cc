#include "papercache/util/users.hh"
#include "papercache/util/environment-variables.hh"

#include <gtest/gtest.h>

#include <cstdlib>
#include <map>
#include <optional>

#include <unistd.h>

namespace papercache {

class UserDirsTest : public ::testing::Test
{
    std::map<std::string, std::optional<std::string>> saved;

protected:
    void SetUp() override
    {
        for (auto name :
             {"PAPERCACHE_CACHE_HOME", "PAPERCACHE_CONFIG_HOME", "XDG_CACHE_HOME", "XDG_CONFIG_HOME"}) {
            saved[name] = getEnv(name);
            unsetenv(name);
        }
    }

    void TearDown() override
    {
        for (auto & [name, value] : saved) {
            if (value)
                setEnv(name.c_str(), value->c_str());
            else
                unsetenv(name.c_str());
        }
    }
};

TEST_F(UserDirsTest, cacheDirPrecedence)
{
    ASSERT_EQ(getCacheDir().string(), (std::filesystem::path(getHome()) / ".cache" / "papercache").string());

    setEnv("XDG_CACHE_HOME", "/xdg/cache");
    ASSERT_EQ(getCacheDir().string(), "/xdg/cache/papercache");

    setEnv("PAPERCACHE_CACHE_HOME", "/srv/papers");
    ASSERT_EQ(getCacheDir().string(), "/srv/papers");
}

TEST_F(UserDirsTest, configDirPrecedence)
{
    ASSERT_EQ(getConfigDir().string(), (std::filesystem::path(getHome()) / ".config" / "papercache").string());

    setEnv("XDG_CONFIG_HOME", "/xdg/config");
    ASSERT_EQ(getConfigDir().string(), "/xdg/config/papercache");

    setEnv("PAPERCACHE_CONFIG_HOME", "/etc/papercache");
    ASSERT_EQ(getConfigDir().string(), "/etc/papercache");
}

TEST(getHomeOf, currentUser)
{
    ASSERT_FALSE(getHomeOf(geteuid()).empty());
}

} // namespace papercache
