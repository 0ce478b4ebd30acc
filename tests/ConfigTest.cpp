// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include <gtest/gtest.h>

#include <fstream>

#include "TestSupport.hpp"
#include "config/AppConfig.hpp"
#include "config/DatasourceRegistry.hpp"

using namespace Lanwatch::Config;
using Lanwatch::Telemetry::LogLevel;

TEST(ConfigLoaderTest, EmptyObjectYieldsDefaults) {
    AppConfig config = ConfigLoader::parseText("{}");

    EXPECT_EQ(config.databasePath, "/data/db/LancacheManager.db");
    EXPECT_EQ(config.probe.windowSeconds, 2);
    EXPECT_EQ(config.probe.restartDelaySeconds, 5);
    EXPECT_EQ(config.probe.terminateGraceMs, 2000);
    EXPECT_EQ(config.reaper.startupDelaySeconds, 10);
    EXPECT_EQ(config.reaper.intervalSeconds, 10);
    EXPECT_EQ(config.reaper.quietThresholdSeconds, 15);
    EXPECT_EQ(config.reaper.batchSize, 10);
    EXPECT_EQ(config.reaper.batchPauseMs, 50);
    EXPECT_EQ(config.reaper.invalidAppId, 0);
    EXPECT_EQ(config.guardian.everyReaperTicks, 360);
    EXPECT_EQ(config.logLevel, LogLevel::NORMAL);

    // Régi, egyetlen útvonalas datasource
    ASSERT_EQ(config.datasources.size(), 1u);
    EXPECT_EQ(config.datasources[0].name, "default");
    EXPECT_EQ(config.datasources[0].logPath, "/logs");
    EXPECT_TRUE(config.datasources[0].isDefault);
}

TEST(ConfigLoaderTest, ReadsEverySection) {
    AppConfig config = ConfigLoader::parseText(R"({
        "database": { "path": "/tmp/lanwatch.db" },
        "lanCache": {
            "dataSources": [
                { "name": "Main", "logPath": "/logs/main", "cachePath": "/cache/main" },
                { "name": "Lab", "logPath": "/logs/lab", "enabled": false, "default": true }
            ]
        },
        "probe": { "speedTrackerPath": "/opt/st", "windowSeconds": 4, "restartDelaySeconds": 1 },
        "reaper": { "batchSize": 25, "quietThresholdSeconds": 30, "invalidAppId": -1 },
        "guardian": { "everyReaperTicks": 6 },
        "logging": { "level": "debug" }
    })");

    EXPECT_EQ(config.databasePath, "/tmp/lanwatch.db");
    ASSERT_EQ(config.datasources.size(), 2u);
    EXPECT_EQ(config.datasources[1].name, "Lab");
    EXPECT_FALSE(config.datasources[1].enabled);
    EXPECT_TRUE(config.datasources[1].isDefault);
    EXPECT_EQ(config.probe.speedTrackerPath, "/opt/st");
    EXPECT_EQ(config.probe.windowSeconds, 4);
    EXPECT_EQ(config.probe.restartDelaySeconds, 1);
    EXPECT_EQ(config.reaper.batchSize, 25);
    EXPECT_EQ(config.reaper.quietThresholdSeconds, 30);
    EXPECT_EQ(config.reaper.invalidAppId, -1);
    EXPECT_EQ(config.guardian.everyReaperTicks, 6);
    EXPECT_EQ(config.logLevel, LogLevel::DEBUG);
}

TEST(ConfigLoaderTest, AccessLogPathResolvesToItsDirectory) {
    AppConfig legacy = ConfigLoader::parseText(R"({"lanCache": {"logPath": "/var/log/lancache/access.log"}})");
    EXPECT_EQ(legacy.datasources[0].logPath, "/var/log/lancache");

    AppConfig listed = ConfigLoader::parseText(
        R"({"lanCache": {"dataSources": [{"name": "A", "logPath": "/srv/a/access-2026.log"}]}})");
    EXPECT_EQ(listed.datasources[0].logPath, "/srv/a");

    EXPECT_EQ(resolveLogDirectory("/srv/logs"), "/srv/logs");
    EXPECT_EQ(resolveLogDirectory("/srv/logs/error.log"), "/srv/logs/error.log");
}

TEST(ConfigLoaderTest, InvalidInputRaisesConfigError) {
    EXPECT_THROW(ConfigLoader::parseText("{ not json"), ConfigError);
    EXPECT_THROW(ConfigLoader::parseText("[]"), ConfigError);
    EXPECT_THROW(ConfigLoader::parseText(R"({"probe": []})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parseText(R"({"reaper": {"batchSize": "ten"}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parseText(R"({"reaper": {"batchSize": 0}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parseText(R"({"logging": {"level": "chatty"}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFile("/nonexistent/lanwatch.json"), ConfigError);
}

TEST(ConfigLoaderTest, DatasourceRulesAreEnforcedAtLoad) {
    EXPECT_THROW(ConfigLoader::parseText(
        R"({"lanCache": {"dataSources": [{"name": "Main"}, {"name": "MAIN"}]}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parseText(
        R"({"lanCache": {"dataSources": [{"name": "A", "default": true}, {"name": "B", "default": true}]}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::parseText(
        R"({"lanCache": {"dataSources": [{"name": "  "}]}})"), ConfigError);
}

TEST(ConfigLoaderTest, LoadsFromFile) {
    LanwatchTest::TempDir dir;
    std::string path = dir.file("lanwatch.json");
    {
        std::ofstream out(path);
        out << R"({ "database": { "path": "/srv/db.sqlite" } })";
    }

    EXPECT_EQ(ConfigLoader::loadFile(path).databasePath, "/srv/db.sqlite");
}

// --- Registry ---

TEST(DatasourceRegistryTest, FirstDatasourceIsDefaultWhenNoneIsFlagged) {
    ConfiguredDatasourceRegistry registry({
        LanwatchTest::makeDatasource("Main"),
        LanwatchTest::makeDatasource("Lab")});

    ASSERT_TRUE(registry.defaultDatasource().has_value());
    EXPECT_EQ(registry.defaultDatasource()->name, "Main");
}

TEST(DatasourceRegistryTest, FlaggedDatasourceIsDefault) {
    ConfiguredDatasourceRegistry registry({
        LanwatchTest::makeDatasource("Main"),
        LanwatchTest::makeDatasource("Lab", "/lab", true, true)});

    EXPECT_EQ(registry.defaultDatasource()->name, "Lab");
}

TEST(DatasourceRegistryTest, EnabledFilterAndCaseInsensitiveLookup) {
    ConfiguredDatasourceRegistry registry({
        LanwatchTest::makeDatasource("Main"),
        LanwatchTest::makeDatasource("Archive", "/archive", false)});

    auto enabled = registry.enabledDatasources();
    ASSERT_EQ(enabled.size(), 1u);
    EXPECT_EQ(enabled[0].name, "Main");

    auto found = registry.find("ARCHIVE");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "Archive");
    EXPECT_FALSE(registry.find("missing").has_value());
}

TEST(DatasourceRegistryTest, EmptyRegistryHasNoDefault) {
    ConfiguredDatasourceRegistry registry(std::vector<Datasource>{});
    EXPECT_FALSE(registry.defaultDatasource().has_value());
    EXPECT_TRUE(registry.enabledDatasources().empty());
}

TEST(DatasourceRegistryTest, CollisionIsRejected) {
    EXPECT_THROW(ConfiguredDatasourceRegistry({
        LanwatchTest::makeDatasource("Main"),
        LanwatchTest::makeDatasource("main")}), ConfigError);
}
