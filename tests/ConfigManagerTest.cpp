#include <gtest/gtest.h>

#include "config/ConfigManager.hpp"
#include "TestHelpers.hpp"

#include <cstdlib>

using namespace std::chrono_literals;

class ConfigManagerTest : public ::testing::Test {
  protected:
    CTempDir home;

    void     SetUp() override {
        setenv("HOME", home.path().c_str(), 1);
        unsetenv("XDG_CACHE_HOME");
    }

    CConfigManager::SSettings load(const std::string& content) {
        writeFile(home / "randpaper.conf", content);
        CConfigManager config(home / "randpaper.conf");
        config.init();
        return config.getSettings();
    }
};

TEST_F(ConfigManagerTest, Defaults) {
    const auto SETTINGS = load("");

    EXPECT_EQ(SETTINGS.stateDir, home / ".cache/randpaper");
    EXPECT_EQ(SETTINGS.listTTL, 3h);
    EXPECT_EQ(SETTINGS.feedTTL, 3h);
    EXPECT_EQ(SETTINGS.minWidth, 255u);
    EXPECT_EQ(SETTINGS.minHeight, 255u);
    EXPECT_EQ(SETTINGS.maxAttempts, 50u);
    EXPECT_EQ(SETTINGS.httpTimeout, 10s);
    EXPECT_TRUE(SETTINGS.userAgent.starts_with("randpaper/"));
    EXPECT_FALSE(SETTINGS.useLocate);
}

TEST_F(ConfigManagerTest, ValuesFromFile) {
    const auto SETTINGS = load("state_dir = ~/state\n"
                               "list_ttl = 60\n"
                               "min_width = 1920\n"
                               "min_height = 1080\n"
                               "user_agent = walls/1.0\n"
                               "use_locate = 1\n");

    EXPECT_EQ(SETTINGS.stateDir, home / "state");
    EXPECT_EQ(SETTINGS.listTTL, 60s);
    EXPECT_EQ(SETTINGS.feedTTL, 3h);
    EXPECT_EQ(SETTINGS.minWidth, 1920u);
    EXPECT_EQ(SETTINGS.minHeight, 1080u);
    EXPECT_EQ(SETTINGS.userAgent, "walls/1.0");
    EXPECT_TRUE(SETTINGS.useLocate);
}

TEST_F(ConfigManagerTest, NonPositiveValuesFallBack) {
    const auto SETTINGS = load("feed_ttl = 0\n"
                               "max_attempts = -3\n");

    EXPECT_EQ(SETTINGS.feedTTL, 3h);
    EXPECT_EQ(SETTINGS.maxAttempts, 50u);
}

TEST_F(ConfigManagerTest, XDGCacheHome) {
    setenv("XDG_CACHE_HOME", (home / "xdg").c_str(), 1);
    EXPECT_EQ(CConfigManager::defaultStateDir(), home / "xdg/randpaper");
    unsetenv("XDG_CACHE_HOME");
}
