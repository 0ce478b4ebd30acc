// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "telemetry/SpeedSnapshot.hpp"

namespace Lanwatch::Telemetry {

Json::Value SpeedSnapshot::toJson() const {
    Json::Value root(Json::objectValue);
    root["timestampUtc"]        = timestamp_utc;
    root["totalBytesPerSecond"] = total_bytes_per_second;
    root["windowSeconds"]       = window_seconds;
    root["entriesInWindow"]     = static_cast<Json::Int64>(entries_in_window);
    root["hasActiveDownloads"]  = has_active_downloads;

    root["gameSpeeds"]   = breakdown.isMember("gameSpeeds") ? breakdown["gameSpeeds"] : Json::Value(Json::arrayValue);
    root["clientSpeeds"] = breakdown.isMember("clientSpeeds") ? breakdown["clientSpeeds"] : Json::Value(Json::arrayValue);
    return root;
}

} // namespace Lanwatch::Telemetry
