#include "charx/util/configuration.hh"
#include "charx/util/config-global.hh"
#include "charx/util/file-system.hh"

#include <cstdlib>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace charx {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    Config config;
    std::string value;
    Setting<std::string> foo{&config, value, "name-of-the-setting", "description"};
    ASSERT_EQ(config.set("name-of-the-setting", "value"), true);
    ASSERT_EQ(foo.get(), "value");
}

TEST(Config, getDefinedSetting)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> foo{&config, "", "name-of-the-setting", "description"};

    config.getSettings(settings, /* overriddenOnly = */ false);
    const auto iter = settings.find("name-of-the-setting");
    ASSERT_NE(iter, settings.end());
    ASSERT_EQ(iter->second.value, "");
    ASSERT_EQ(iter->second.description, "description");
}

TEST(Config, getDefinedOverriddenSettingNotSet)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> foo{&config, "", "name-of-the-setting", "description"};

    config.getSettings(settings, /* overriddenOnly = */ true);
    ASSERT_EQ(settings.find("name-of-the-setting"), settings.end());
}

TEST(Config, integerSettingAcceptsUnitSuffix)
{
    Config config;
    Setting<uint64_t> size{&config, 0, "max-size", "maximum size"};

    ASSERT_TRUE(config.set("max-size", "50M"));
    ASSERT_EQ(size.get(), 50ULL << 20);

    ASSERT_TRUE(config.set("max-size", "1024"));
    ASSERT_EQ(size.get(), 1024u);
}

TEST(Config, integerSettingRejectsOverflowingSuffix)
{
    Config config;
    Setting<uint64_t> size{&config, 0, "max-size", "maximum size"};

    ASSERT_TRUE(config.set("max-size", "16777215T"));
    ASSERT_THROW(config.set("max-size", "16777216T"), UsageError);
}

TEST(Config, integerSettingRejectsGarbage)
{
    Config config;
    Setting<unsigned int> n{&config, 10, "max-concurrent-saves", "workers"};

    ASSERT_THROW(config.set("max-concurrent-saves", "ten"), UsageError);
    ASSERT_THROW(config.set("max-concurrent-saves", "-1"), UsageError);
    ASSERT_EQ(n.get(), 10u);
}

TEST(Config, withInitialValue)
{
    const StringMap initials = {
        {"key", "value"},
    };
    Config config(initials);

    {
        std::map<std::string, Config::SettingInfo> settings;
        config.getSettings(settings, /* overriddenOnly = */ false);
        ASSERT_EQ(settings.find("key"), settings.end());
    }

    Setting<std::string> setting{&config, "default-value", "key", "description"};

    {
        std::map<std::string, Config::SettingInfo> settings;
        config.getSettings(settings, /* overriddenOnly = */ false);
        ASSERT_EQ(settings["key"].value, "value");
    }
}

TEST(Config, resetOverriddenWithSetting)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    {
        std::map<std::string, Config::SettingInfo> settings;

        setting.override("bar");
        ASSERT_TRUE(setting.overridden);
        ASSERT_EQ(setting.get(), "bar");
        config.getSettings(settings, /* overriddenOnly = */ true);
        ASSERT_FALSE(settings.empty());
    }

    {
        std::map<std::string, Config::SettingInfo> settings;

        config.resetOverridden();
        ASSERT_FALSE(setting.overridden);
        config.getSettings(settings, /* overriddenOnly = */ true);
        ASSERT_TRUE(settings.empty());
    }
}

TEST(Config, toJSONOnEmptyConfig)
{
    ASSERT_EQ(Config().toJSON().dump(), "{}");
}

TEST(Config, toJSONListsValueAndDefault)
{
    Config config;
    Setting<unsigned int> n{&config, 4, "max-concurrent-saves", "workers", {"jobs"}};
    config.set("jobs", "8");

    auto json = config.toJSON();
    ASSERT_EQ(json.size(), 1u);
    ASSERT_EQ(json["max-concurrent-saves"]["value"], 8);
    ASSERT_EQ(json["max-concurrent-saves"]["defaultValue"], 4);
    ASSERT_EQ(json["max-concurrent-saves"]["aliases"], nlohmann::json::array({"jobs"}));
}

TEST(Config, toKeyValueCanBeReadBack)
{
    Config config;
    Setting<std::string> dir{&config, "/var/lib/charx", "data-dir", "where state lives"};
    Setting<bool> trace{&config, true, "show-trace", "traces"};

    ASSERT_EQ(config.toKeyValue(), "data-dir = /var/lib/charx\nshow-trace = true\n");

    Config other;
    Setting<std::string> dir2{&other, "", "data-dir", "where state lives"};
    Setting<bool> trace2{&other, false, "show-trace", "traces"};
    other.applyConfig(config.toKeyValue());
    ASSERT_EQ(dir2.get(), "/var/lib/charx");
    ASSERT_TRUE(trace2.get());
}

TEST(Config, booleanSettingRejectsGarbage)
{
    Config config;
    Setting<bool> trace{&config, false, "show-trace", "traces"};
    ASSERT_TRUE(config.set("show-trace", "yes"));
    ASSERT_TRUE(trace.get());
    ASSERT_THROW(config.set("show-trace", "maybe"), UsageError);
}

TEST(Config, initialValueUnderAliasIsApplied)
{
    Config config(StringMap{{"state-dir", "/old"}});
    Setting<std::string> setting{&config, "", "data-dir", "where state lives", {"state-dir"}};
    ASSERT_EQ(setting.get(), "/old");
    ASSERT_TRUE(setting.overridden);
}

TEST(Config, setSettingAlias)
{
    Config config;
    Setting<std::string> setting{&config, "", "data-dir", "where state lives", {"state-dir"}};
    ASSERT_TRUE(config.set("data-dir", "/a"));
    ASSERT_EQ(setting.get(), "/a");
    ASSERT_TRUE(config.set("state-dir", "/b"));
    ASSERT_EQ(setting.get(), "/b");
}

/* ----------------------------------------------------------------------------
 * applyConfig
 * --------------------------------------------------------------------------*/

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
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};
    config.applyConfig(
        "name-of-the-setting = value-from-file #useful comment\n"
        "# name-of-the-setting = foo\n");
    config.getSettings(settings);
    ASSERT_EQ(settings["name-of-the-setting"].value, "value-from-file");
}

TEST(Config, applyConfigWithReassignedSetting)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};
    config.applyConfig(
        "name-of-the-setting = first-value\n"
        "name-of-the-setting = second-value\n");
    ASSERT_EQ(setting.get(), "second-value");
}

TEST(Config, applyConfigInvalidThrows)
{
    Config config;
    ASSERT_THROW(config.applyConfig("value == key"), UsageError);
    ASSERT_THROW(config.applyConfig("value "), UsageError);
}

/* ----------------------------------------------------------------------------
 * loadConfFile
 * --------------------------------------------------------------------------*/

TEST(loadConfFile, appliesFileFromEnvironment)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir);
    auto conf = tmpDir + "/charx.conf";
    writeFile(conf, "name-of-the-setting = from-env\n");

    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    setenv("CHARX_CONF", conf.c_str(), 1);
    loadConfFile(config);
    unsetenv("CHARX_CONF");

    ASSERT_EQ(setting.get(), "from-env");
}

TEST(loadConfFile, unsetVariableIsIgnored)
{
    unsetenv("CHARX_CONF");
    Config config;
    Setting<std::string> setting{&config, "default", "name-of-the-setting", "description"};
    loadConfFile(config);
    ASSERT_EQ(setting.get(), "default");
}

TEST(loadConfFile, missingFileThrows)
{
    setenv("CHARX_CONF", "/no/such/charx.conf", 1);
    Config config;
    ASSERT_THROW(loadConfFile(config), UsageError);
    unsetenv("CHARX_CONF");
}

} // namespace charx
