// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_STALE_TRANSFER_REAPER_HPP
#define LANWATCH_STALE_TRANSFER_REAPER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "config/AppConfig.hpp"
#include "core/ShutdownSignal.hpp"
#include "store/TransferStore.hpp"
#include "telemetry/TelemetryTypes.hpp"

namespace Lanwatch::Modules {

    struct SweepResult {
        int64_t sentinelFinalized = 0;      // csak az induló sweepben
        int64_t finalized = 0;
        std::vector<size_t> batchSizes;
        size_t pauses = 0;
        bool interrupted = false;           // leállítás a batchek között
    };

    /**
     * @brief Lezárja azokat az aktív átviteleket, amelyekbe a csendküszöbnél
     * régebben nem írtak. Értesítést nem küld.
     *
     * A batchek szigorúan egymás után futnak; teli batch után rövid szünet
     * enged levegőt a log-feldolgozó írásainak. Egy tick felső korlát nélkül
     * addig megy, amíg egy batch a méreténél kevesebb sort nem hoz.
     */
    class StaleTransferReaper {
    public:
        StaleTransferReaper(Store::TransferStore& storeRef,
                            const Config::ReaperConfig& settings,
                            Core::ShutdownSignal& shutdownRef,
                            Telemetry::LogLevel level = Telemetry::LogLevel::NORMAL);

        std::string getName() const;

        // Induláskor egyszer: sentinel app id-s rekordok, majd minden már állott rekord
        SweepResult startupSweep();

        // Egy tick: a tick kezdetekor állott rekordok lezárása
        SweepResult sweep();

        // Ütemezőből hívható változatok: a hibát naplózzák, nem dobnak
        void onStartup();
        void onTick();

    private:
        Store::TransferStore& store;
        Config::ReaperConfig config;
        Core::ShutdownSignal& shutdown;
        Telemetry::LogLevel logLevel;

        void logInfo(const std::string& message) const;
        void logDebug(const std::string& message) const;
    };
}

#endif // LANWATCH_STALE_TRANSFER_REAPER_HPP
