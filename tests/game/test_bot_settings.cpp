/**
 * @file test_bot_settings.cpp
 * @brief Tests for reading bot tunables from configuration
 */

#include <gtest/gtest.h>

#include "config/BotSettings.hpp"
#include <engine/config/Config.hpp>

#include <limits>

using namespace Wayfarer;
using namespace Wayfarer::Bot;

TEST(BotSettingsTest, DefaultsFromEmptyConfig) {
    Config config;
    const BotSettings settings = BotSettings::FromConfig(config);
    const ControllerSettings& c = settings.controller;

    EXPECT_DOUBLE_EQ(2500.0, c.aggroRange);
    EXPECT_DOUBLE_EQ(250.0, c.arrivalTolerance);
    EXPECT_DOUBLE_EQ(375.0, c.earlyAdvanceDist);
    EXPECT_DOUBLE_EQ(312.0, c.combatReachDist);
    EXPECT_FALSE(c.logActions);
    EXPECT_EQ(Time::Duration(std::chrono::seconds(30)), c.statsInterval);
    EXPECT_EQ(Time::Duration(std::chrono::milliseconds(500)), c.scanInterval);
    EXPECT_DOUBLE_EQ(0.75, c.scanMoveRatio);
    EXPECT_EQ(Time::Duration(std::chrono::seconds(5)), c.rallyDebounce);
    EXPECT_EQ(Time::Duration(std::chrono::seconds(1)), settings.mission.transitionDelay);
    EXPECT_EQ(Time::Duration(std::chrono::seconds(5)), settings.mission.setupDelay);
    EXPECT_EQ("info", settings.logLevel);
    EXPECT_TRUE(settings.logFile.empty());
}

TEST(BotSettingsTest, ReadsConfiguredValues) {
    Config config;
    config.Set("bot.aggro_range", 1800.0);
    config.Set("bot.arrival_tolerance", 100.0);
    config.Set("bot.log_actions", true);
    config.Set("scanner.interval_ms", 250);
    config.Set("rally.debounce_seconds", 2.5);
    config.Set("mission.setup_delay_ms", 100);
    config.Set("logging.level", std::string("debug"));

    const BotSettings settings = BotSettings::FromConfig(config);

    EXPECT_DOUBLE_EQ(1800.0, settings.controller.aggroRange);
    EXPECT_DOUBLE_EQ(100.0, settings.controller.arrivalTolerance);
    EXPECT_TRUE(settings.controller.logActions);
    EXPECT_EQ(Time::Duration(std::chrono::milliseconds(250)), settings.controller.scanInterval);
    EXPECT_EQ(Time::Duration(std::chrono::milliseconds(2500)), settings.controller.rallyDebounce);
    EXPECT_EQ(Time::Duration(std::chrono::milliseconds(100)), settings.mission.setupDelay);
    EXPECT_EQ("debug", settings.logLevel);
}

TEST(BotSettingsTest, InvalidValuesFallBack) {
    Config config;
    config.Set("bot.aggro_range", -5.0);
    config.Set("bot.arrival_tolerance", std::string("far"));
    config.Set("bot.log_actions", 1);
    config.Set("rally.radius", std::numeric_limits<double>::infinity());

    const BotSettings settings = BotSettings::FromConfig(config);

    EXPECT_DOUBLE_EQ(2500.0, settings.controller.aggroRange);
    EXPECT_DOUBLE_EQ(250.0, settings.controller.arrivalTolerance);
    EXPECT_FALSE(settings.controller.logActions);
    EXPECT_DOUBLE_EQ(2500.0, settings.controller.rallyRadius);
}

TEST(BotSettingsTest, ShippedConfigMatchesDefaults) {
    Config config;
    ASSERT_TRUE(config.Load(std::filesystem::path(WAYFARER_TEST_ASSETS_DIR) / "config" / "bot.json").has_value());

    const BotSettings settings = BotSettings::FromConfig(config);

    EXPECT_DOUBLE_EQ(2500.0, settings.controller.aggroRange);
    EXPECT_DOUBLE_EQ(375.0, settings.controller.earlyAdvanceDist);
    EXPECT_TRUE(settings.controller.logActions);
}
