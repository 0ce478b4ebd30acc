// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "config/AppConfig.hpp"
#include "config/DatasourceRegistry.hpp"
#include "utils/StringUtils.hpp"

#include <fstream>
#include <sstream>

namespace Lanwatch::Config {

    namespace {

        const char* LEGACY_DATASOURCE_NAME = "default";
        const char* LEGACY_LOG_PATH = "/logs";
        const char* LEGACY_CACHE_PATH = "/cache";

        const Json::Value& section(const Json::Value& root, const char* key) {
            static const Json::Value empty(Json::objectValue);
            if (!root.isMember(key) || root[key].isNull()) return empty;
            if (!root[key].isObject()) {
                throw ConfigError(std::string("'") + key + "' must be an object");
            }
            return root[key];
        }

        std::string readString(const Json::Value& obj, const char* key, const std::string& fallback) {
            if (!obj.isMember(key) || obj[key].isNull()) return fallback;
            if (!obj[key].isString()) {
                throw ConfigError(std::string("'") + key + "' must be a string");
            }
            return obj[key].asString();
        }

        bool readBool(const Json::Value& obj, const char* key, bool fallback) {
            if (!obj.isMember(key) || obj[key].isNull()) return fallback;
            if (!obj[key].isBool()) {
                throw ConfigError(std::string("'") + key + "' must be a boolean");
            }
            return obj[key].asBool();
        }

        int64_t readInt(const Json::Value& obj, const char* key, int64_t fallback, int64_t minimum) {
            if (!obj.isMember(key) || obj[key].isNull()) return fallback;
            if (!obj[key].isInt64()) {
                throw ConfigError(std::string("'") + key + "' must be an integer");
            }
            int64_t value = obj[key].asInt64();
            if (value < minimum) {
                throw ConfigError(std::string("'") + key + "' must be >= " + std::to_string(minimum));
            }
            return value;
        }

        int readInt32(const Json::Value& obj, const char* key, int fallback, int minimum) {
            int64_t value = readInt(obj, key, fallback, minimum);
            if (value > INT32_MAX) {
                throw ConfigError(std::string("'") + key + "' is out of range");
            }
            return static_cast<int>(value);
        }
    }

    AppConfig ConfigLoader::loadFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ConfigError("Cannot open config file: " + path);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parseText(buffer.str());
    }

    AppConfig ConfigLoader::parseText(const std::string& text) {
        Json::CharReaderBuilder builder;
        Json::CharReaderBuilder::strictMode(&builder.settings_);
        builder["allowComments"] = true;

        Json::Value root;
        std::string errors;
        std::istringstream stream(text);
        if (!Json::parseFromStream(builder, stream, &root, &errors)) {
            throw ConfigError("Invalid config JSON: " + LanwatchUtils::trim(errors));
        }
        if (!root.isObject()) {
            throw ConfigError("Config root must be an object");
        }
        return fromJson(root);
    }

    AppConfig ConfigLoader::fromJson(const Json::Value& root) {
        AppConfig config;

        const Json::Value& database = section(root, "database");
        config.databasePath = readString(database, "path", config.databasePath);

        config.datasources = readDatasources(section(root, "lanCache"));
        ConfiguredDatasourceRegistry::validate(config.datasources);

        const Json::Value& probe = section(root, "probe");
        config.probe.speedTrackerPath = readString(probe, "speedTrackerPath", config.probe.speedTrackerPath);
        config.probe.logManagerPath = readString(probe, "logManagerPath", config.probe.logManagerPath);
        config.probe.operationsDir = readString(probe, "operationsDir", config.probe.operationsDir);
        config.probe.windowSeconds = readInt32(probe, "windowSeconds", config.probe.windowSeconds, 1);
        config.probe.restartDelaySeconds = readInt32(probe, "restartDelaySeconds", config.probe.restartDelaySeconds, 0);
        config.probe.terminateGraceMs = readInt32(probe, "terminateGraceMs", config.probe.terminateGraceMs, 0);

        const Json::Value& reaper = section(root, "reaper");
        config.reaper.startupDelaySeconds = readInt32(reaper, "startupDelaySeconds", config.reaper.startupDelaySeconds, 0);
        config.reaper.intervalSeconds = readInt32(reaper, "intervalSeconds", config.reaper.intervalSeconds, 1);
        config.reaper.quietThresholdSeconds = readInt32(reaper, "quietThresholdSeconds", config.reaper.quietThresholdSeconds, 0);
        config.reaper.batchSize = readInt32(reaper, "batchSize", config.reaper.batchSize, 1);
        config.reaper.batchPauseMs = readInt32(reaper, "batchPauseMs", config.reaper.batchPauseMs, 0);
        config.reaper.invalidAppId = readInt(reaper, "invalidAppId", config.reaper.invalidAppId, INT64_MIN);

        const Json::Value& guardian = section(root, "guardian");
        config.guardian.everyReaperTicks = readInt32(guardian, "everyReaperTicks", config.guardian.everyReaperTicks, 1);

        const Json::Value& logging = section(root, "logging");
        if (logging.isMember("level")) {
            config.logLevel = parseLogLevel(readString(logging, "level", "normal"));
        }

        return config;
    }

    std::vector<Datasource> ConfigLoader::readDatasources(const Json::Value& lanCache) {
        std::vector<Datasource> result;

        if (lanCache.isMember("dataSources") && !lanCache["dataSources"].isNull()) {
            const Json::Value& list = lanCache["dataSources"];
            if (!list.isArray()) {
                throw ConfigError("'dataSources' must be an array");
            }

            for (const auto& entry : list) {
                if (!entry.isObject()) {
                    throw ConfigError("'dataSources' entries must be objects");
                }
                Datasource ds;
                ds.name = LanwatchUtils::trim(readString(entry, "name", ""));
                ds.logPath = resolveLogDirectory(readString(entry, "logPath", ""));
                ds.cachePath = readString(entry, "cachePath", "");
                ds.enabled = readBool(entry, "enabled", true);
                ds.isDefault = readBool(entry, "default", false);
                result.push_back(ds);
            }
        }

        // Régi, egyetlen útvonalas konfiguráció
        if (result.empty()) {
            Datasource legacy;
            legacy.name = LEGACY_DATASOURCE_NAME;
            legacy.logPath = resolveLogDirectory(readString(lanCache, "logPath", LEGACY_LOG_PATH));
            legacy.cachePath = readString(lanCache, "cachePath", LEGACY_CACHE_PATH);
            legacy.enabled = true;
            legacy.isDefault = true;
            result.push_back(legacy);
        }

        return result;
    }

    Telemetry::LogLevel ConfigLoader::parseLogLevel(const std::string& level) {
        std::string value = LanwatchUtils::toLower(LanwatchUtils::trim(level));
        if (value == "silent" || value == "error") return Telemetry::LogLevel::SILENT;
        if (value == "normal" || value == "info") return Telemetry::LogLevel::NORMAL;
        if (value == "debug" || value == "verbose") return Telemetry::LogLevel::DEBUG;
        throw ConfigError("Unknown log level: " + level);
    }
}
