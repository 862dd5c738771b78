#include "papercache/util/configuration.hh"
#include "papercache/util/file-system.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace papercache {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, unknownNameIsNotClaimed)
{
    Config config;
    ASSERT_FALSE(config.set("probe-attempts", "3"));
}

TEST(Config, knownNameIsClaimed)
{
    Config config;
    Setting<std::string> url{&config, "", "source-url", "Where archives come from."};

    ASSERT_TRUE(config.set("source-url", "https://example.org/e-print/{id}"));
    ASSERT_EQ(url.get(), "https://example.org/e-print/{id}");
    ASSERT_TRUE(url.overridden);
}

TEST(Config, settingsListDefaultsAndDescriptions)
{
    Config config;
    Setting<std::string> ext{&config, ".tar.gz", "payload-extension", "Suffix of the payload."};
    Setting<bool> useCache{&config, true, "use-cache", "Whether to consult the cache."};

    std::map<std::string, Config::SettingInfo> settings;
    config.getSettings(settings);

    ASSERT_EQ(settings.size(), 2u);
    ASSERT_EQ(settings["payload-extension"].value, ".tar.gz");
    ASSERT_EQ(settings["payload-extension"].description, "Suffix of the payload.");
    ASSERT_EQ(settings["use-cache"].value, "true");
}

TEST(Config, overriddenOnlySkipsUntouchedSettings)
{
    Config config;
    Setting<unsigned int> attempts{&config, 3, "probe-attempts", "description"};
    Setting<unsigned int> timeout{&config, 30, "lock-timeout", "description"};

    std::map<std::string, Config::SettingInfo> settings;
    config.getSettings(settings, /* overriddenOnly = */ true);
    ASSERT_TRUE(settings.empty());

    ASSERT_TRUE(config.set("lock-timeout", "5"));
    config.getSettings(settings, /* overriddenOnly = */ true);
    ASSERT_EQ(settings.size(), 1u);
    ASSERT_EQ(settings["lock-timeout"].value, "5");
}

TEST(Config, assignDoesNotMarkOverridden)
{
    Config config;
    Setting<std::string> agent{&config, "", "user-agent", "description"};

    agent = std::string("curl/8");
    ASSERT_EQ(agent.get(), "curl/8");
    ASSERT_FALSE(agent.overridden);

    agent.override("Mozilla/5.0");
    ASSERT_EQ(agent.get(), "Mozilla/5.0");
    ASSERT_TRUE(agent.overridden);
}

TEST(Config, descriptionIsTrimmed)
{
    Config config;
    Setting<std::string> setting{&config, "", "probe-marker", R"(
        Text that marks a reachable mirror.
    )"};

    ASSERT_EQ(setting.description, "Text that marks a reachable mirror.");
}

TEST(Config, aliasSetsSetting)
{
    Config config;
    Setting<unsigned int> setting{&config, 30, "lock-timeout", "description", {"timeout"}};

    ASSERT_TRUE(config.set("timeout", "5"));
    ASSERT_EQ(setting.get(), 5u);

    std::map<std::string, Config::SettingInfo> settings;
    config.getSettings(settings);
    ASSERT_EQ(settings.count("timeout"), 0u);
}

TEST(Config, integerSettings)
{
    Config config;
    Setting<unsigned int> size{&config, 0, "size", "description"};

    size.set("4K");
    ASSERT_EQ(size.get(), 4096u);
    ASSERT_THROW(size.set("lots"), UsageError);
    ASSERT_EQ(size.to_string(), "4096");
}

TEST(Config, booleanSettings)
{
    Config config;
    Setting<bool> flag{&config, false, "flag", "description"};

    for (auto s : {"true", "yes", "1"}) {
        flag.set(s);
        ASSERT_TRUE(flag.get()) << s;
    }
    for (auto s : {"false", "no", "0"}) {
        flag.set(s);
        ASSERT_FALSE(flag.get()) << s;
    }
    ASSERT_THROW(flag.set("maybe"), UsageError);
}

TEST(Config, pathSettingIsNormalised)
{
    Config config;
    PathSetting dir{&config, "/tmp", "dir", "description"};

    dir.set("/var//cache/./papers/");
    ASSERT_EQ(dir.get(), "/var/cache/papers");
    ASSERT_THROW(dir.set(""), UsageError);
}

TEST(Config, toJSONOnEmptyConfig)
{
    ASSERT_EQ(Config().toJSON().dump(), "{}");
}

TEST(Config, toJSONListsValueAndDefault)
{
    using nlohmann::literals::operator""_json;
    Config config;
    Setting<unsigned int> timeout{&config, 30, "lock-timeout", "Seconds to wait.", {"timeout"}};
    timeout = 10u;

    ASSERT_EQ(
        config.toJSON(),
        R"#({
            "lock-timeout": {
                "aliases": ["timeout"],
                "defaultValue": 30,
                "description": "Seconds to wait.",
                "value": 10
            }
        })#"_json);
}

TEST(Config, applyConfigEmpty)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    config.applyConfig("");
    config.getSettings(settings);
    ASSERT_TRUE(settings.empty());
}

TEST(Config, applyConfigEmptyWithComment)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    config.applyConfig("# just a comment");
    config.getSettings(settings);
    ASSERT_TRUE(settings.empty());
}

TEST(Config, applyConfigAssignment)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> setting{&config, "", "probe-url", "description"};
    config.applyConfig(
        "probe-url = https://mirror.example/ # primary\n"
        "# probe-url = https://old.example/\n");
    config.getSettings(settings);
    ASSERT_FALSE(settings.empty());
    ASSERT_EQ(settings["probe-url"].value, "https://mirror.example/");
}

TEST(Config, applyConfigMultiWordValue)
{
    Config config;
    Setting<std::string> setting{&config, "", "user-agent", "description"};
    config.applyConfig("user-agent = Mozilla/5.0   (X11)\n");
    ASSERT_EQ(setting.get(), "Mozilla/5.0 (X11)");
}

TEST(Config, applyConfigWithReassignedSetting)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> setting{&config, "", "probe-url", "description"};
    config.applyConfig(
        "probe-url = https://a.example/\n"
        "probe-url = https://b.example/\n");
    config.getSettings(settings);
    ASSERT_FALSE(settings.empty());
    ASSERT_EQ(settings["probe-url"].value, "https://b.example/");
}

TEST(Config, applyConfigFailsOnMissingEquals)
{
    Config config;
    ASSERT_THROW(config.applyConfig("probe-url value\n"), UsageError);
}

TEST(Config, applyConfigFailsOnLoneWord)
{
    Config config;
    ASSERT_THROW(config.applyConfig("probe-url\n"), UsageError);
}

TEST(Config, applyConfigRemembersUnknownSettings)
{
    Config config;
    ASSERT_NO_THROW(config.applyConfig("later-setting = 3\n"));

    Setting<unsigned int> setting{&config, 0, "later-setting", "description"};
    ASSERT_EQ(setting.get(), 3u);
    ASSERT_TRUE(setting.overridden);
}

class ConfigIncludeTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    std::filesystem::path tmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir);
    }
};

TEST_F(ConfigIncludeTest, includeIsRelativeToIncludingFile)
{
    createDirs(tmpDir / "conf.d");
    writeFile(tmpDir / "conf.d" / "extra.conf", "b = from-include\n");
    writeFile(tmpDir / "main.conf", "a = from-main\ninclude conf.d/extra.conf\n");

    Config config;
    Setting<std::string> a{&config, "", "a", "description"};
    Setting<std::string> b{&config, "", "b", "description"};
    config.applyConfig(readFile(tmpDir / "main.conf"), (tmpDir / "main.conf").string());

    ASSERT_EQ(a.get(), "from-main");
    ASSERT_EQ(b.get(), "from-include");
}

TEST_F(ConfigIncludeTest, missingIncludeThrows)
{
    Config config;
    ASSERT_THROW(config.applyConfig("include nowhere.conf\n", (tmpDir / "main.conf").string()), Error);
}

TEST_F(ConfigIncludeTest, optionalIncludeMayBeMissing)
{
    Config config;
    ASSERT_NO_THROW(config.applyConfig("!include nowhere.conf\n", (tmpDir / "main.conf").string()));
}

} // namespace papercache
