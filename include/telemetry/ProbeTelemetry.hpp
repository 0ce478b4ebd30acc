#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "telemetry/TelemetryTypes.hpp"

namespace Lanwatch::Telemetry {

struct ProbeTelemetrySnapshot {
    // --- Process ---
    uint64_t launches;
    uint64_t crashes;

    // --- Stream ---
    uint64_t lines_parsed;
    uint64_t lines_rejected;

    // --- Broadcast ---
    uint64_t speed_updates_sent;
    uint64_t refreshes_sent;

    ProbeState state;
    uint64_t uptime_ms;
};

struct ProbeTelemetry {
    // Process counters
    std::atomic<uint64_t> launches{0};
    std::atomic<uint64_t> crashes{0};

    // Stream counters
    std::atomic<uint64_t> lines_parsed{0};
    std::atomic<uint64_t> lines_rejected{0};

    // Broadcast counters
    std::atomic<uint64_t> speed_updates_sent{0};
    std::atomic<uint64_t> refreshes_sent{0};

    std::atomic<ProbeState> state{ProbeState::IDLE};

    std::chrono::steady_clock::time_point started_at;

    ProbeTelemetry();
    [[nodiscard]] ProbeTelemetrySnapshot snapshot() const;
};

} // namespace Lanwatch::Telemetry
