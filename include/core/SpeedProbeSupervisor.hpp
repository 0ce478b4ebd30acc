// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// Lifecycle of the external speed probe process

#ifndef LANWATCH_SPEED_PROBE_SUPERVISOR_HPP
#define LANWATCH_SPEED_PROBE_SUPERVISOR_HPP

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "config/AppConfig.hpp"
#include "config/DatasourceRegistry.hpp"
#include "core/NotificationChannel.hpp"
#include "core/ProbeStreamHandler.hpp"
#include "core/SafeExecutor.hpp"
#include "core/ShutdownSignal.hpp"
#include "telemetry/ProbeTelemetry.hpp"
#include "telemetry/SpeedSnapshot.hpp"

namespace Lanwatch::Core {

    class ProbeProcess;

    /**
     * @brief Egy külső szonda-folyamat felügyelete.
     *
     * Disabled -> Idle -> Running -> (Crashed -> BackoffWait -> Running) -> Stopping -> Stopped
     *
     * Az állapotot csak a saját szála írja. A stdout sorai egyenként cserélik a
     * megosztott SpeedSnapshot-ot; a stderr csak DEBUG szinten naplózódik.
     * Váratlan kilépés után fix várakozás, majd újraindítás, korlát nélkül.
     * A TransferStore-hoz nem nyúl.
     */
    class SpeedProbeSupervisor {
    public:
        SpeedProbeSupervisor(const Config::ProbeConfig& settings,
                             std::string databasePath,
                             const Config::DatasourceRegistry& registryRef,
                             NotificationChannel& channelRef,
                             ShutdownSignal& shutdownRef,
                             Telemetry::LogLevel level = Telemetry::LogLevel::NORMAL);

        // Ha még fut: leállítást kér és megvárja a szálat
        ~SpeedProbeSupervisor();

        SpeedProbeSupervisor(const SpeedProbeSupervisor&) = delete;
        SpeedProbeSupervisor& operator=(const SpeedProbeSupervisor&) = delete;

        std::string getName() const;

        // A szonda startupDelay után indul (a leállítási jel ezt a várakozást is megszakítja)
        void start(std::chrono::milliseconds startupDelay = std::chrono::milliseconds(0));

        // A leállítási jel után hívandó; a szonda ekkorra már le van állítva
        void join();

        [[nodiscard]] Telemetry::SpeedSnapshot getCurrentSnapshot() const;
        [[nodiscard]] Telemetry::ProbeState state() const { return telemetry.state.load(); }
        [[nodiscard]] pid_t currentPid() const { return childPid.load(); }
        [[nodiscard]] Telemetry::ProbeTelemetrySnapshot telemetrySnapshot() const { return telemetry.snapshot(); }

        // A futtatandó parancs az engedélyezett datasource-okból; a megjelenített
        // formában az argumentumok egyenként idézőjelesek
        ExecRequest buildRequest(const std::vector<Config::Datasource>& enabled) const;

    private:
        enum class RunOutcome { CANCELLED, EXITED, READ_FAILED, LAUNCH_FAILED };

        Config::ProbeConfig config;
        std::string databasePath;
        const Config::DatasourceRegistry& registry;
        NotificationChannel& channel;
        ShutdownSignal& shutdown;
        Telemetry::LogLevel logLevel;

        Telemetry::ProbeTelemetry telemetry;
        std::atomic<pid_t> childPid{-1};

        mutable std::mutex snapshotMutex;
        Telemetry::SpeedSnapshot currentSnapshot;

        std::chrono::milliseconds initialDelay{0};
        std::thread worker;

        void runLoop();
        RunOutcome runOnce(const ExecRequest& request, ProbeStreamHandler& handler);
        void drainStderr(int fd, const std::atomic<bool>& stop) const;
        void publishSnapshot(const Telemetry::SpeedSnapshot& snapshot);
        void setState(Telemetry::ProbeState next);

        void logInfo(const std::string& message) const;
        void logError(const std::string& message) const;
    };
}

#endif // LANWATCH_SPEED_PROBE_SUPERVISOR_HPP
