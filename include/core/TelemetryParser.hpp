// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// Probe -> Supervisor line protocol

#ifndef LANWATCH_TELEMETRY_PARSER_HPP
#define LANWATCH_TELEMETRY_PARSER_HPP

#include <string>
#include <json/json.h>
#include "telemetry/SpeedSnapshot.hpp"

namespace Lanwatch::Core {

    enum class LineStatus {
        SNAPSHOT,   // Érvényes, önálló rekord
        BLANK,      // Üres sor, figyelmen kívül hagyjuk
        MALFORMED   // Zaj: naplózzuk és átugorjuk, nem protokollsértés
    };

    struct ParsedLine {
        LineStatus status = LineStatus::BLANK;
        Telemetry::SpeedSnapshot snapshot;
        std::string error;
    };

    /**
     * @brief Egy stdout sor értelmezése SpeedSnapshot-tá.
     * A mezőnevek kis-nagybetű függetlenek (windowSeconds, totalBytesPerSecond,
     * hasActiveDownloads, entriesInWindow, timestampUtc, gameSpeeds, clientSpeeds).
     */
    class TelemetryParser {
    public:
        explicit TelemetryParser(int defaultWindowSeconds = 2);

        [[nodiscard]] ParsedLine parse(const std::string& line) const;

    private:
        int defaultWindowSeconds;

        // Case-insensitive member lookup; nullptr ha nincs ilyen mező vagy null az értéke
        static const Json::Value* findMember(const Json::Value& object, const char* name);

        static bool readFields(const Json::Value& root, Telemetry::SpeedSnapshot& snap, std::string& error);
    };

} // namespace Lanwatch::Core

#endif // LANWATCH_TELEMETRY_PARSER_HPP
