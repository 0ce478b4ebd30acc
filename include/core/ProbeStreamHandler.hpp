// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// Probe stdout line -> snapshot -> broadcast decision

#ifndef LANWATCH_PROBE_STREAM_HANDLER_HPP
#define LANWATCH_PROBE_STREAM_HANDLER_HPP

#include <functional>
#include <string>

#include "core/NotificationChannel.hpp"
#include "core/TelemetryParser.hpp"
#include "telemetry/ProbeTelemetry.hpp"
#include "telemetry/SpeedSnapshot.hpp"

namespace Lanwatch::Core {

    struct BroadcastDecision {
        bool speedUpdate = false;
        bool refresh = false;
    };

    /**
     * @brief Mikor menjen ki sebesség-frissítés.
     * Aktivitás alatt minden snapshot kimegy; a lefutó élen (volt aktivitás, most
     * nincs) még egyszer, plusz egy payload nélküli lista-frissítés. Utána csend,
     * amíg újra aktivitás nem lesz.
     */
    class BroadcastPolicy {
    private:
        bool previousHadActivity = false;

    public:
        BroadcastDecision evaluate(const Telemetry::SpeedSnapshot& snapshot);

        [[nodiscard]] bool hadActivity() const { return previousHadActivity; }
    };

    class ProbeStreamHandler {
    public:
        using SnapshotSink = std::function<void(const Telemetry::SpeedSnapshot&)>;

        ProbeStreamHandler(NotificationChannel& channelRef,
                           int defaultWindowSeconds,
                           SnapshotSink sink,
                           Telemetry::ProbeTelemetry* telemetryRef = nullptr,
                           Telemetry::LogLevel level = Telemetry::LogLevel::NORMAL);

        // Egy stdout sor teljes feldolgozása; a sor állapotát adja vissza
        LineStatus handleLine(const std::string& line);

        [[nodiscard]] const BroadcastPolicy& policy() const { return broadcastPolicy; }

    private:
        NotificationChannel& channel;
        TelemetryParser parser;
        BroadcastPolicy broadcastPolicy;
        SnapshotSink onSnapshot;
        Telemetry::ProbeTelemetry* telemetry;
        Telemetry::LogLevel logLevel;
    };
}

#endif // LANWATCH_PROBE_STREAM_HANDLER_HPP
