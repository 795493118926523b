#include <gtest/gtest.h>

#include "utils/Config.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace EdgeShare::Utils;

namespace
{
    Config& FreshConfig()
    {
        Config& config = Config::GetInstance();
        config.Clear();
        return config;
    }

    std::string TempPath(const std::string& name)
    {
        return ::testing::TempDir() + name;
    }
}

TEST(Config, GetReturnsDefaultForMissingKey)
{
    Config& config = FreshConfig();
    EXPECT_FALSE(config.HasKey(ConfigKeys::Port));
    EXPECT_EQ(config.Get<int>(ConfigKeys::Port, 52525), 52525);
    EXPECT_EQ(config.Get<std::string>(ConfigKeys::Name, "desk"), "desk");
}

TEST(Config, OverridesAreTypedByTheirText)
{
    Config& config = FreshConfig();
    ASSERT_TRUE(config.ApplyOverride("network.port = 6000"));
    ASSERT_TRUE(config.ApplyOverride("network.auto_reconnect=true"));
    ASSERT_TRUE(config.ApplyOverride("input.mouse_sensitivity=1.5"));
    ASSERT_TRUE(config.ApplyOverride("edge.position=left"));

    EXPECT_EQ(config.Get<int>(ConfigKeys::Port, 0), 6000);
    EXPECT_TRUE(config.Get<bool>(ConfigKeys::AutoReconnect, false));
    EXPECT_FLOAT_EQ(config.Get<float>(ConfigKeys::MouseSensitivity, 1.0f), 1.5f);
    EXPECT_EQ(config.Get<std::string>(ConfigKeys::EdgePosition, "right"), "left");
}

TEST(Config, MalformedOverrideIsRejected)
{
    Config& config = FreshConfig();
    EXPECT_FALSE(config.ApplyOverride("no equals sign"));
    EXPECT_FALSE(config.ApplyOverride("=value"));
    EXPECT_FALSE(config.HasKey(""));
}

TEST(Config, CompatibleTypesConvertOnGet)
{
    Config& config = FreshConfig();
    config.Set<int>("some.int", 3);
    EXPECT_FLOAT_EQ(config.Get<float>("some.int", 0.0f), 3.0f);
    EXPECT_EQ(config.Get<std::string>("some.int", ""), "3");
    EXPECT_TRUE(config.Get<bool>("some.int", false));

    config.Set<std::string>("some.text", "hello");
    EXPECT_EQ(config.Get<int>("some.text", 17), 17);
}

TEST(Config, EscapeComboParsesVkList)
{
    Config& config = FreshConfig();
    ASSERT_TRUE(config.ApplyOverride(Config::GetEscapeComboKey() + "=17 18 77"));
    std::vector<uint8_t> combo = config.Get<std::vector<uint8_t>>(Config::GetEscapeComboKey(), {});
    EXPECT_EQ(combo, (std::vector<uint8_t>{17, 18, 77}));

    ASSERT_TRUE(config.ApplyOverride(Config::GetEscapeComboKey() + "=17 999 0 77"));
    combo = config.Get<std::vector<uint8_t>>(Config::GetEscapeComboKey(), {});
    EXPECT_EQ(combo, (std::vector<uint8_t>{17, 77}));
}

TEST(Config, SaveThenLoadKeepsValues)
{
    Config& config = FreshConfig();
    std::string path = TempPath("edgeshare_config_test.cfg");
    config.Set<int>(ConfigKeys::Port, 7001);
    config.Set<bool>(ConfigKeys::AutoReconnect, false);
    config.Set<std::string>(ConfigKeys::Name, "laptop");
    config.Set<std::vector<uint8_t>>(ConfigKeys::EscapeCombo, {17, 18, 77});
    ASSERT_TRUE(config.SaveToFile(path));

    config.Clear();
    ASSERT_TRUE(config.LoadFromFile(path));
    EXPECT_EQ(config.Get<int>(ConfigKeys::Port, 0), 7001);
    EXPECT_FALSE(config.Get<bool>(ConfigKeys::AutoReconnect, true));
    EXPECT_EQ(config.Get<std::string>(ConfigKeys::Name, ""), "laptop");
    EXPECT_EQ(config.Get<std::vector<uint8_t>>(ConfigKeys::EscapeCombo, {}), (std::vector<uint8_t>{17, 18, 77}));

    std::remove(path.c_str());
    config.Clear();
}

TEST(Config, LoadSkipsCommentsAndBadLines)
{
    Config& config = FreshConfig();
    std::string path = TempPath("edgeshare_config_comments.cfg");
    {
        std::ofstream out(path);
        out << "# a comment\n\nedge.threshold=4\nthis line is junk\nnetwork.name = studio\n";
    }
    ASSERT_TRUE(config.LoadFromFile(path));
    EXPECT_EQ(config.Get<int>(ConfigKeys::EdgeThreshold, 2), 4);
    EXPECT_EQ(config.Get<std::string>(ConfigKeys::Name, ""), "studio");
    EXPECT_FALSE(config.LoadFromFile(TempPath("edgeshare_missing_dir/none.cfg")));

    std::remove(path.c_str());
    config.Clear();
}
