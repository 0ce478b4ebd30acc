// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "telemetry/ProbeTelemetry.hpp"

namespace Lanwatch::Telemetry {

const char* toString(ProbeState state) {
    switch (state) {
        case ProbeState::DISABLED:     return "Disabled";
        case ProbeState::IDLE:         return "Idle";
        case ProbeState::RUNNING:      return "Running";
        case ProbeState::CRASHED:      return "Crashed";
        case ProbeState::BACKOFF_WAIT: return "BackoffWait";
        case ProbeState::STOPPING:     return "Stopping";
        case ProbeState::STOPPED:      return "Stopped";
    }
    return "Unknown";
}

ProbeTelemetry::ProbeTelemetry()
    : started_at(std::chrono::steady_clock::now())
{
}

ProbeTelemetrySnapshot ProbeTelemetry::snapshot() const {
    ProbeTelemetrySnapshot snap{};

    snap.launches = launches.load();
    snap.crashes  = crashes.load();

    snap.lines_parsed   = lines_parsed.load();
    snap.lines_rejected = lines_rejected.load();

    snap.speed_updates_sent = speed_updates_sent.load();
    snap.refreshes_sent     = refreshes_sent.load();

    snap.state = state.load();

    snap.uptime_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at
        ).count();

    return snap;
}

} // namespace Lanwatch::Telemetry
