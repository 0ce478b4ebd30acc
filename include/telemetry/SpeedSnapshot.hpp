#pragma once

#include <cstdint>
#include <string>
#include <json/json.h>

namespace Lanwatch::Telemetry {

// Az aktuális mérési ablak pillanatképe. Nem perzisztens, nincs history: csak a "most".
struct SpeedSnapshot {
    std::string timestamp_utc;
    int window_seconds = 2;
    double total_bytes_per_second = 0.0;
    int64_t entries_in_window = 0;
    bool has_active_downloads = false;

    // Per-game / per-client bontás (gameSpeeds, clientSpeeds); a core számára átlátszatlan
    Json::Value breakdown{Json::objectValue};

    [[nodiscard]] bool hasActivity() const {
        return has_active_downloads || total_bytes_per_second > 0.0;
    }

    // A broadcast payload (camelCase, ahogy a szonda is küldi)
    [[nodiscard]] Json::Value toJson() const;
};

} // namespace Lanwatch::Telemetry
