// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_CONSISTENCY_GUARDIAN_HPP
#define LANWATCH_CONSISTENCY_GUARDIAN_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "config/DatasourceRegistry.hpp"
#include "modules/LogServiceInventory.hpp"
#include "store/TransferStore.hpp"
#include "telemetry/TelemetryTypes.hpp"

namespace Lanwatch::Modules {

    struct OrphanCleanupResult {
        int64_t servicesRemoved = 0;
        int64_t rowsRemoved = 0;
        std::vector<Store::ServiceDeletion> deletions;
        bool aborted = false;       // biztonsági küszöb vagy hiba: nem törölt semmit
        std::string reason;
    };

    struct NormalizationResult {
        int64_t rowsUpdated = 0;
        size_t bucketsRemapped = 0;
        bool aborted = false;
        std::string reason;
    };

    /**
     * @brief A tárolt átvitel-metaadat és a log korpusz közti hosszú távú konzisztencia.
     *
     * Árva szolgáltatások törlése: csak ami az adatbázisban van, a logokban nincs.
     * Üres inventory (szkennelési hiba) vagy ha MINDEN db szolgáltatás árva lenne:
     * nulla törlés. A törlés egy tranzakció; bármilyen hiba teljes visszagörgetés.
     *
     * Datasource normalizálás: null/üres és ismeretlen érték -> default,
     * kis-nagybetűben eltérő -> a konfigurált kanonikus név.
     */
    class ConsistencyGuardian {
    public:
        ConsistencyGuardian(Store::TransferStore& storeRef,
                            const Config::DatasourceRegistry& registryRef,
                            LogServiceInventory& inventoryRef,
                            Telemetry::LogLevel level = Telemetry::LogLevel::NORMAL);

        std::string getName() const;

        OrphanCleanupResult removeOrphanedServices(bool forceRefresh = false);
        NormalizationResult normalizeDatasources();

        // Normalizálás, majd árva-takarítás; nem dob
        void runCycle(bool forceRefresh = false);

    private:
        Store::TransferStore& store;
        const Config::DatasourceRegistry& registry;
        LogServiceInventory& inventory;
        Telemetry::LogLevel logLevel;

        void logInfo(const std::string& message) const;
        void logWarning(const std::string& message) const;
    };
}

#endif // LANWATCH_CONSISTENCY_GUARDIAN_HPP
