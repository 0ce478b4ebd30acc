#pragma once

namespace Lanwatch::Telemetry {

// A szonda-folyamat életciklusa. Egyetlen hiteles állapot, csak a Supervisor loopja írja.
enum class ProbeState {
    DISABLED,     // Nincs engedélyezett datasource vagy hiányzik a bináris
    IDLE,
    RUNNING,
    CRASHED,
    BACKOFF_WAIT,
    STOPPING,
    STOPPED
};

// Log-szintek a komponensek zajszintjének kezeléséhez
enum class LogLevel {
    SILENT,  // csak hibák
    NORMAL,
    DEBUG    // stderr sorok, eldobott telemetria, batch részletek
};

const char* toString(ProbeState state);

} // namespace Lanwatch::Telemetry
