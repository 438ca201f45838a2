#include "chunkcache/util/configuration.hh"
#include "chunkcache/util/file-system.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace chunkcache {

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

TEST(Config, integersAcceptUnitSuffixes)
{
    Config config;
    Setting<uint64_t> size{&config, 0, "chunk-size", "description"};

    config.set("chunk-size", "10M");
    ASSERT_EQ(size.get(), 10 * 1024 * 1024);

    config.set("chunk-size", "4096");
    ASSERT_EQ(size.get(), 4096);

    ASSERT_THROW(config.set("chunk-size", "10Q"), UsageError);
    ASSERT_THROW(config.set("chunk-size", "lots"), UsageError);
}

TEST(Config, booleans)
{
    Config config;
    Setting<bool> flag{&config, false, "validate-local", "description"};

    config.set("validate-local", "true");
    ASSERT_TRUE(flag.get());
    config.set("validate-local", "false");
    ASSERT_FALSE(flag.get());
    ASSERT_THROW(config.set("validate-local", "maybe"), UsageError);
}

TEST(Config, appendToStrings)
{
    Config config;
    Setting<Strings> command{&config, {"build"}, "rebuild-command", "description"};

    config.set("extra-rebuild-command", "--fast");
    ASSERT_EQ(command.get(), (Strings{"build", "--fast"}));

    config.set("rebuild-command", "other arg");
    ASSERT_EQ(command.get(), (Strings{"other", "arg"}));
}

TEST(Config, getDefinedOverriddenSettingNotSet)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> foo{&config, "default", "name-of-the-setting", "description"};

    config.getSettings(settings, /* overriddenOnly = */ true);
    const auto e = settings.find("name-of-the-setting");
    ASSERT_EQ(e, settings.end());
}

TEST(Config, resetOverridden)
{
    Config config;
    Setting<std::string> foo{&config, "default", "name-of-the-setting", "description"};
    config.set("name-of-the-setting", "changed");

    std::map<std::string, Config::SettingInfo> settings;
    config.getSettings(settings, true);
    ASSERT_EQ(settings.size(), 1);

    config.resetOverridden();
    settings.clear();
    config.getSettings(settings, true);
    ASSERT_TRUE(settings.empty());
    ASSERT_EQ(foo.get(), "changed");
}

TEST(Config, applyConfigWithComments)
{
    Config config;
    Setting<std::string> store{&config, "", "store", "description"};
    Setting<unsigned int> retries{&config, 3, "store-retries", "description"};

    config.applyConfig(
        "# the shared cache\n"
        "store = sqlite:///var/lib/chunkcache/chunks.sqlite # trailing comment\n"
        "\n"
        "store-retries = 5\n");

    ASSERT_EQ(store.get(), "sqlite:///var/lib/chunkcache/chunks.sqlite");
    ASSERT_EQ(retries.get(), 5);
}

TEST(Config, applyConfigSyntaxError)
{
    Config config;
    ASSERT_THROW(config.applyConfig("just-a-name\n"), UsageError);
    ASSERT_THROW(config.applyConfig("name value\n"), UsageError);
}

TEST(Config, applyConfigInclude)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);
    writeFile(tmpDir + "/extra.conf", "max-age = 60\n");

    Config config;
    Setting<unsigned int> maxAge{&config, 0, "max-age", "description"};

    config.applyConfig("include extra.conf\n!include missing.conf\n", tmpDir + "/chunkcache.conf");
    ASSERT_EQ(maxAge.get(), 60);

    ASSERT_THROW(config.applyConfig("include missing.conf\n", tmpDir + "/chunkcache.conf"), Error);
}

TEST(Config, unknownSettingsAreRemembered)
{
    Config config;
    config.applyConfig("later = 1\n");

    Setting<std::string> later{&config, "", "later", "description"};
    config.reapplyUnknownSettings();
    ASSERT_EQ(later.get(), "1");
}

TEST(Config, toJSONOnDefinedSetting)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};
    setting.assign("value");

    auto json = config.toJSON();
    ASSERT_EQ(json["name-of-the-setting"]["value"], "value");
    ASSERT_EQ(json["name-of-the-setting"]["description"], "description\n");
}

TEST(Config, toKeyValue)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};
    setting.assign("value");

    ASSERT_EQ(config.toKeyValue(), "name-of-the-setting = value\n");
}

} // namespace chunkcache
