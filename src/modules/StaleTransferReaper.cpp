// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "modules/StaleTransferReaper.hpp"
#include <chrono>
#include <iostream>

namespace Lanwatch::Modules {

StaleTransferReaper::StaleTransferReaper(Store::TransferStore& storeRef,
                                         const Config::ReaperConfig& settings,
                                         Core::ShutdownSignal& shutdownRef,
                                         Telemetry::LogLevel level)
    : store(storeRef), config(settings), shutdown(shutdownRef), logLevel(level) {
    if (config.batchSize < 1) config.batchSize = 1;
}

std::string StaleTransferReaper::getName() const {
    return "StaleTransferReaper";
}

SweepResult StaleTransferReaper::startupSweep() {
    logInfo("Running initial cleanup...");

    int64_t sentinel = store.markInactiveByAppId(config.invalidAppId);
    if (sentinel > 0) {
        logInfo("Marked " + std::to_string(sentinel) + " transfer(s) with app id " +
                std::to_string(config.invalidAppId) + " as inactive");
    }

    SweepResult result = sweep();
    result.sentinelFinalized = sentinel;
    return result;
}

SweepResult StaleTransferReaper::sweep() {
    SweepResult result;

    // A küszöb a tick elején rögzül: ami közben elavul, a következő tické
    const auto cutoff = std::chrono::system_clock::now() - std::chrono::seconds(config.quietThresholdSeconds);
    const size_t batchSize = static_cast<size_t>(config.batchSize);

    while (true) {
        auto batch = store.findStaleActive(cutoff, batchSize);
        if (batch.empty()) break;

        std::vector<int64_t> ids;
        ids.reserve(batch.size());
        for (const auto& record : batch) {
            ids.push_back(record.id);
        }

        int64_t updated = store.markInactive(ids, cutoff);
        result.finalized += updated;
        result.batchSizes.push_back(batch.size());

        logDebug("Batch " + std::to_string(result.batchSizes.size()) + ": " +
                 std::to_string(updated) + "/" + std::to_string(batch.size()) + " finalized");

        if (batch.size() < batchSize) break;

        result.pauses++;
        if (shutdown.waitFor(std::chrono::milliseconds(config.batchPauseMs))) {
            result.interrupted = true;
            break;
        }
    }

    if (result.finalized > 0) {
        logInfo("Marked " + std::to_string(result.finalized) + " transfer(s) as complete (quiet for more than " +
                std::to_string(config.quietThresholdSeconds) + "s)");
    }
    return result;
}

void StaleTransferReaper::onStartup() {
    try {
        startupSweep();
    } catch (const std::exception& e) {
        std::cerr << "[Reaper] Initial cleanup failed: " << e.what() << std::endl;
    }
}

void StaleTransferReaper::onTick() {
    if (shutdown.requested()) return;
    try {
        sweep();
    } catch (const std::exception& e) {
        // A tick félbemarad; a következő elölről kezdi
        std::cerr << "[Reaper] Sweep failed: " << e.what() << std::endl;
    }
}

void StaleTransferReaper::logInfo(const std::string& message) const {
    if (logLevel == Telemetry::LogLevel::SILENT) return;
    std::cout << "[Reaper] " << message << std::endl;
}

void StaleTransferReaper::logDebug(const std::string& message) const {
    if (logLevel != Telemetry::LogLevel::DEBUG) return;
    std::cout << "[Reaper][DEBUG] " << message << std::endl;
}

} // namespace Lanwatch::Modules
