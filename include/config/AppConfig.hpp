// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// Daemon configuration (JSON file, every key optional)

#ifndef LANWATCH_APP_CONFIG_HPP
#define LANWATCH_APP_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <json/json.h>

#include "config/ConfigTypes.hpp"
#include "telemetry/TelemetryTypes.hpp"

namespace Lanwatch::Config {

    inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/lanwatch/lanwatch.json";

    struct ProbeConfig {
        std::string speedTrackerPath = "/app/rust-processor/speed_tracker";
        std::string logManagerPath = "/app/rust-processor/log_manager";
        std::string operationsDir = "/data/operations";
        int windowSeconds = 2;
        int restartDelaySeconds = 5;
        int terminateGraceMs = 2000;
    };

    struct ReaperConfig {
        int startupDelaySeconds = 10;
        int intervalSeconds = 10;
        int quietThresholdSeconds = 15;
        int batchSize = 10;
        int batchPauseMs = 50;
        int64_t invalidAppId = 0;
    };

    struct GuardianConfig {
        int everyReaperTicks = 360;
    };

    struct AppConfig {
        std::string databasePath = "/data/db/LancacheManager.db";
        std::vector<Datasource> datasources;
        ProbeConfig probe;
        ReaperConfig reaper;
        GuardianConfig guardian;
        Telemetry::LogLevel logLevel = Telemetry::LogLevel::NORMAL;
    };

    class ConfigLoader {
    public:
        // Hiányzó vagy olvashatatlan fájl, hibás JSON, rossz típus: ConfigError
        static AppConfig loadFile(const std::string& path);
        static AppConfig parseText(const std::string& text);
        static AppConfig fromJson(const Json::Value& root);

        static Telemetry::LogLevel parseLogLevel(const std::string& level);

    private:
        static std::vector<Datasource> readDatasources(const Json::Value& lanCache);
    };
}

#endif // LANWATCH_APP_CONFIG_HPP
