// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "core/ProbeStreamHandler.hpp"
#include <iostream>

namespace Lanwatch::Core {

    BroadcastDecision BroadcastPolicy::evaluate(const Telemetry::SpeedSnapshot& snapshot) {
        BroadcastDecision decision;
        bool active = snapshot.hasActivity();
        bool fallingEdge = previousHadActivity && !active;

        decision.speedUpdate = active || fallingEdge;
        decision.refresh = fallingEdge;

        previousHadActivity = active;
        return decision;
    }

    ProbeStreamHandler::ProbeStreamHandler(NotificationChannel& channelRef,
                                           int defaultWindowSeconds,
                                           SnapshotSink sink,
                                           Telemetry::ProbeTelemetry* telemetryRef,
                                           Telemetry::LogLevel level)
        : channel(channelRef),
          parser(defaultWindowSeconds),
          onSnapshot(std::move(sink)),
          telemetry(telemetryRef),
          logLevel(level) {}

    LineStatus ProbeStreamHandler::handleLine(const std::string& line) {
        ParsedLine parsed = parser.parse(line);

        if (parsed.status == LineStatus::BLANK) {
            return parsed.status;
        }

        if (parsed.status == LineStatus::MALFORMED) {
            if (telemetry) telemetry->lines_rejected++;
            if (logLevel == Telemetry::LogLevel::DEBUG) {
                std::cout << "[SpeedProbe][DEBUG] Skipping unparseable line (" << parsed.error << "): "
                          << line.substr(0, 200) << std::endl;
            }
            return parsed.status;
        }

        if (telemetry) telemetry->lines_parsed++;

        // A közös állapot cseréje előbb, hogy egy lekérdezés már az új képet lássa
        if (onSnapshot) onSnapshot(parsed.snapshot);

        BroadcastDecision decision = broadcastPolicy.evaluate(parsed.snapshot);

        if (decision.speedUpdate) {
            channel.notifyAll(Events::DOWNLOAD_SPEED_UPDATE, parsed.snapshot.toJson());
            if (telemetry) telemetry->speed_updates_sent++;
        }

        if (decision.refresh) {
            channel.notifyAll(Events::DOWNLOADS_REFRESH, Json::Value(Json::nullValue));
            if (telemetry) telemetry->refreshes_sent++;
        }

        return parsed.status;
    }
}
