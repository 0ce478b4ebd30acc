// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// Services present in the log corpus (authoritative source for orphan removal)

#ifndef LANWATCH_LOG_SERVICE_INVENTORY_HPP
#define LANWATCH_LOG_SERVICE_INVENTORY_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

#include "config/AppConfig.hpp"
#include "config/DatasourceRegistry.hpp"
#include "telemetry/TelemetryTypes.hpp"

namespace Lanwatch::Modules {

    class InventoryError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class LogServiceInventory {
    public:
        virtual ~LogServiceInventory() = default;

        /**
         * @brief Kisbetűs szolgáltatásnév -> sorok száma a log korpuszban.
         * forceRefresh: a gyorsítótár megkerülése (teljes újraszámolás).
         * Hiba esetén InventoryError.
         */
        virtual std::map<std::string, int64_t> serviceCounts(bool forceRefresh) = 0;

        std::set<std::string> serviceNames(bool forceRefresh);
    };

    /**
     * @brief A külső log manager "count" parancsával számol, datasource-onként.
     * Az eredményt a log manager a progress fájlba írja, ez egyben a cache is.
     * Egyszerre csak egy log manager fut.
     */
    class LogManagerInventory : public LogServiceInventory {
    public:
        LogManagerInventory(const Config::DatasourceRegistry& registryRef,
                            const Config::ProbeConfig& settings,
                            Telemetry::LogLevel level = Telemetry::LogLevel::NORMAL);

        std::map<std::string, int64_t> serviceCounts(bool forceRefresh) override;

        std::string progressFileFor(const std::string& datasourceName) const;

        // progress fájl tartalma -> számok (case-insensitive "serviceCounts" kulcs)
        static std::map<std::string, int64_t> parseProgress(const std::string& json);

    private:
        const Config::DatasourceRegistry& registry;
        Config::ProbeConfig config;
        Telemetry::LogLevel logLevel;

        std::mutex runMutex;
        std::optional<std::chrono::steady_clock::time_point> lastWarning;

        std::map<std::string, int64_t> countDatasource(const Config::Datasource& datasource, bool forceRefresh);
        void throttledWarning(const std::string& message);
    };
}

#endif // LANWATCH_LOG_SERVICE_INVENTORY_HPP
