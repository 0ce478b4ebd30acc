// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "modules/ConsistencyGuardian.hpp"
#include "utils/StringUtils.hpp"

#include <iostream>
#include <set>

namespace Lanwatch::Modules {

ConsistencyGuardian::ConsistencyGuardian(Store::TransferStore& storeRef,
                                         const Config::DatasourceRegistry& registryRef,
                                         LogServiceInventory& inventoryRef,
                                         Telemetry::LogLevel level)
    : store(storeRef), registry(registryRef), inventory(inventoryRef), logLevel(level) {}

std::string ConsistencyGuardian::getName() const {
    return "ConsistencyGuardian";
}

// --- Orphan removal ---

OrphanCleanupResult ConsistencyGuardian::removeOrphanedServices(bool forceRefresh) {
    OrphanCleanupResult result;

    std::set<std::string> logServices;
    try {
        logServices = inventory.serviceNames(forceRefresh);
    } catch (const std::exception& e) {
        // Olvashatatlan inventory = üres inventory
        std::cerr << "[Guardian] Log service inventory failed: " << e.what() << std::endl;
    }

    if (logServices.empty()) {
        logWarning("No services found in log files - skipping orphaned service cleanup");
        result.aborted = true;
        result.reason = "empty log inventory";
        return result;
    }

    logInfo("Found " + std::to_string(logServices.size()) + " service(s) in log files: " +
            LanwatchUtils::joinComma(std::vector<std::string>(logServices.begin(), logServices.end())));

    try {
        auto transaction = store.beginTransaction();

        auto dbServices = store.distinctServices();

        std::vector<std::string> orphaned;
        for (const auto& service : dbServices) {
            if (logServices.count(LanwatchUtils::toLower(service)) == 0) {
                orphaned.push_back(service);
            }
        }

        if (!dbServices.empty() && orphaned.size() >= dbServices.size()) {
            logWarning("All " + std::to_string(dbServices.size()) +
                       " database service(s) would be orphaned - looks like a log scanning issue, skipping cleanup");
            transaction->rollback();
            result.aborted = true;
            result.reason = "every database service would be orphaned";
            return result;
        }

        if (orphaned.empty()) {
            transaction->commit();
            return result;
        }

        logInfo("Found " + std::to_string(orphaned.size()) + " orphaned service(s): " + LanwatchUtils::joinComma(orphaned));

        for (const auto& service : orphaned) {
            Store::ServiceDeletion deletion;
            deletion.service = service;
            // LogEntries -> Downloads -> ServiceStats
            deletion.logEntries = store.deleteLogEntries(service);
            deletion.transfers = store.deleteTransfers(service);
            deletion.serviceStats = store.deleteServiceStats(service);

            result.rowsRemoved += deletion.total();
            result.deletions.push_back(deletion);

            logInfo("Cleaned up orphaned service '" + service + "': " + std::to_string(deletion.transfers) +
                    " transfer(s), " + std::to_string(deletion.logEntries) + " log entries, " +
                    std::to_string(deletion.serviceStats) + " service stat(s)");
        }

        transaction->commit();
        result.servicesRemoved = static_cast<int64_t>(orphaned.size());

        logInfo("Orphaned service cleanup complete: removed " + std::to_string(result.rowsRemoved) +
                " record(s) from " + std::to_string(result.servicesRemoved) + " service(s)");
    } catch (const std::exception& e) {
        // A tranzakció destruktora visszagörget
        std::cerr << "[Guardian] Error cleaning up orphaned services: " << e.what() << std::endl;
        result = OrphanCleanupResult{};
        result.aborted = true;
        result.reason = e.what();
    }

    return result;
}

// --- Datasource normalization ---

NormalizationResult ConsistencyGuardian::normalizeDatasources() {
    NormalizationResult result;

    auto defaultDatasource = registry.defaultDatasource();
    if (!defaultDatasource) {
        logWarning("No default datasource configured - skipping datasource normalization");
        result.aborted = true;
        result.reason = "no default datasource";
        return result;
    }

    const auto configured = registry.datasources();
    if (auto collision = Config::findNameCollision(configured)) {
        logWarning("Datasource names '" + collision->first + "' and '" + collision->second +
                   "' collide under case-folding - refusing to normalize");
        result.aborted = true;
        result.reason = "datasource name collision";
        return result;
    }

    const std::string& defaultName = defaultDatasource->name;

    try {
        for (const auto& value : store.distinctDatasources()) {
            std::string target = defaultName;
            std::string why = "null or empty";

            if (value && !value->empty()) {
                auto match = registry.find(*value);
                if (match && match->name == *value) {
                    continue; // már kanonikus
                }
                if (match) {
                    target = match->name;
                    why = "case mismatch";
                } else {
                    why = "not a configured datasource";
                }
            }

            int64_t updated = store.reassignDatasource(value, target);
            result.rowsUpdated += updated;
            result.bucketsRemapped++;

            logInfo("Normalized " + std::to_string(updated) + " transfer(s) from '" +
                    (value ? *value : std::string("(null)")) + "' to '" + target + "' (" + why + ")");
        }
    } catch (const std::exception& e) {
        // Részleges eredmény marad; a következő ciklus folytatja
        std::cerr << "[Guardian] Error normalizing datasources: " << e.what() << std::endl;
        result.aborted = true;
        result.reason = e.what();
    }

    return result;
}

void ConsistencyGuardian::runCycle(bool forceRefresh) {
    normalizeDatasources();
    removeOrphanedServices(forceRefresh);
}

void ConsistencyGuardian::logInfo(const std::string& message) const {
    if (logLevel == Telemetry::LogLevel::SILENT) return;
    std::cout << "[Guardian] " << message << std::endl;
}

void ConsistencyGuardian::logWarning(const std::string& message) const {
    std::cerr << "[Guardian] WARNING: " << message << std::endl;
}

} // namespace Lanwatch::Modules
