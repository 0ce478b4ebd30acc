// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "modules/LogServiceInventory.hpp"
#include "core/SafeExecutor.hpp"
#include "utils/ProcessEnvironment.hpp"
#include "utils/StringUtils.hpp"

#include <json/json.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace Lanwatch::Modules {

    namespace {
        constexpr auto WARNING_THROTTLE = std::chrono::minutes(5);
    }

    std::set<std::string> LogServiceInventory::serviceNames(bool forceRefresh) {
        std::set<std::string> names;
        for (const auto& [service, count] : serviceCounts(forceRefresh)) {
            names.insert(LanwatchUtils::toLower(service));
        }
        return names;
    }

    // --- Log manager ---

    LogManagerInventory::LogManagerInventory(const Config::DatasourceRegistry& registryRef,
                                             const Config::ProbeConfig& settings,
                                             Telemetry::LogLevel level)
        : registry(registryRef), config(settings), logLevel(level) {}

    std::string LogManagerInventory::progressFileFor(const std::string& datasourceName) const {
        return (fs::path(config.operationsDir) / ("log_count_progress_" + datasourceName + ".json")).string();
    }

    std::map<std::string, int64_t> LogManagerInventory::serviceCounts(bool forceRefresh) {
        std::lock_guard<std::mutex> lock(runMutex);

        // Letiltott datasource logjai is számítanak: az ő szolgáltatásai sem árvák
        std::map<std::string, int64_t> aggregated;
        for (const auto& datasource : registry.datasources()) {
            for (const auto& [service, count] : countDatasource(datasource, forceRefresh)) {
                aggregated[LanwatchUtils::toLower(service)] += count;
            }
        }
        return aggregated;
    }

    std::map<std::string, int64_t> LogManagerInventory::countDatasource(const Config::Datasource& datasource,
                                                                          bool forceRefresh) {
        std::error_code ec;
        if (!fs::is_directory(datasource.logPath, ec)) {
            throttledWarning("Log directory not found for datasource '" + datasource.name + "': " + datasource.logPath);
            return {};
        }

        if (!fs::exists(config.logManagerPath, ec)) {
            throw InventoryError("log manager not found: " + config.logManagerPath);
        }

        const std::string progressFile = progressFileFor(datasource.name);

        if (forceRefresh) {
            // A log manager a progress fájlból dolgozik; törlés = teljes újraszámolás
            fs::remove(progressFile, ec);
            if (ec) {
                throw InventoryError("cannot remove progress file " + progressFile + ": " + ec.message());
            }
        }

        Core::ExecRequest request{
            .binary = config.logManagerPath,
            .args = {"count", datasource.logPath, progressFile},
            .env = LanwatchUtils::buildChildEnvironment(),
            .workingDir = LanwatchUtils::executableDirectory(config.logManagerPath)
        };

        if (logLevel == Telemetry::LogLevel::DEBUG) {
            std::cout << "[Inventory][DEBUG] " << request.binary << " " << LanwatchUtils::joinQuoted(request.args) << std::endl;
        }

        Core::ExecResult result = Core::SafeExecutor::execute(request);
        if (!result.started) {
            throw InventoryError("failed to start log manager for datasource '" + datasource.name + "'");
        }

        if (result.exitCode != 0) {
            const std::string& err = result.errorOutput;
            if (err.find("No such file or directory") != std::string::npos || err.find("os error 2") != std::string::npos) {
                throttledWarning("Log file not accessible for datasource '" + datasource.name + "': " +
                                 datasource.logPath + ". Returning empty counts.");
                return {};
            }
            throw InventoryError("log manager failed for datasource '" + datasource.name + "' with exit code " +
                                 std::to_string(result.exitCode) + ": " + LanwatchUtils::trim(err));
        }

        std::ifstream file(progressFile);
        if (!file.is_open()) {
            // Nincs mit beolvasni: a log manager nem talált sort
            return {};
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return parseProgress(buffer.str());
    }

    std::map<std::string, int64_t> LogManagerInventory::parseProgress(const std::string& json) {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        std::istringstream stream(json);

        if (!Json::parseFromStream(builder, stream, &root, &errors) || !root.isObject()) {
            throw InventoryError("unreadable progress file: " + LanwatchUtils::trim(errors));
        }

        std::map<std::string, int64_t> counts;
        for (const auto& key : root.getMemberNames()) {
            if (!LanwatchUtils::iequals(key, "serviceCounts")) continue;

            const Json::Value& services = root[key];
            if (!services.isObject()) break;

            for (const auto& service : services.getMemberNames()) {
                const Json::Value& count = services[service];
                if (count.isIntegral()) {
                    counts[LanwatchUtils::toLower(service)] += count.asInt64();
                }
            }
            break;
        }
        return counts;
    }

    void LogManagerInventory::throttledWarning(const std::string& message) {
        auto now = std::chrono::steady_clock::now();
        if (lastWarning && now - *lastWarning <= WARNING_THROTTLE) {
            if (logLevel == Telemetry::LogLevel::DEBUG) {
                std::cout << "[Inventory][DEBUG] (throttled) " << message << std::endl;
            }
            return;
        }
        lastWarning = now;
        std::cerr << "[Inventory] WARNING: " << message << std::endl;
    }
}
