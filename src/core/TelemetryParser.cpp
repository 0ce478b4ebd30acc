// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "core/TelemetryParser.hpp"
#include "utils/StringUtils.hpp"
#include <memory>

namespace Lanwatch::Core {

    TelemetryParser::TelemetryParser(int defaultWindowSeconds)
        : defaultWindowSeconds(defaultWindowSeconds) {}

    const Json::Value* TelemetryParser::findMember(const Json::Value& object, const char* name) {
        for (const auto& key : object.getMemberNames()) {
            if (LanwatchUtils::iequals(key, name)) {
                const Json::Value& value = object[key];
                return value.isNull() ? nullptr : &value;
            }
        }
        return nullptr;
    }

    bool TelemetryParser::readFields(const Json::Value& root, Telemetry::SpeedSnapshot& snap, std::string& error) {
        if (const auto* v = findMember(root, "windowSeconds")) {
            if (!v->isNumeric()) { error = "windowSeconds is not numeric"; return false; }
            snap.window_seconds = v->asInt();
        }
        if (const auto* v = findMember(root, "totalBytesPerSecond")) {
            if (!v->isNumeric()) { error = "totalBytesPerSecond is not numeric"; return false; }
            snap.total_bytes_per_second = v->asDouble();
        }
        if (const auto* v = findMember(root, "entriesInWindow")) {
            if (!v->isNumeric()) { error = "entriesInWindow is not numeric"; return false; }
            snap.entries_in_window = v->asInt64();
        }
        if (const auto* v = findMember(root, "timestampUtc")) {
            if (!v->isString()) { error = "timestampUtc is not a string"; return false; }
            snap.timestamp_utc = v->asString();
        }

        // Ha a szonda nem küldi explicit, a bejegyzések számából származtatjuk
        if (const auto* v = findMember(root, "hasActiveDownloads")) {
            if (!v->isBool()) { error = "hasActiveDownloads is not a boolean"; return false; }
            snap.has_active_downloads = v->asBool();
        } else {
            snap.has_active_downloads = snap.entries_in_window > 0;
        }

        for (const char* key : {"gameSpeeds", "clientSpeeds"}) {
            if (const auto* v = findMember(root, key)) {
                if (!v->isArray()) { error = std::string(key) + " is not an array"; return false; }
                snap.breakdown[key] = *v;
            }
        }
        return true;
    }

    ParsedLine TelemetryParser::parse(const std::string& line) const {
        ParsedLine result;

        const std::string text = LanwatchUtils::trim(line);
        if (text.empty()) {
            result.status = LineStatus::BLANK;
            return result;
        }

        result.status = LineStatus::MALFORMED;

        // Szigorú mód: egyetlen objektum, nincs komment, nincs maradék a sor végén
        Json::CharReaderBuilder builder;
        Json::CharReaderBuilder::strictMode(&builder.settings_);
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

        Json::Value root;
        std::string errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
            result.error = LanwatchUtils::trim(errors);
            return result;
        }
        if (!root.isObject()) {
            result.error = "record is not an object";
            return result;
        }

        Telemetry::SpeedSnapshot snap;
        snap.window_seconds = defaultWindowSeconds;

        try {
            if (!readFields(root, snap, result.error)) {
                return result;
            }
        } catch (const Json::Exception& e) {
            // pl. tartományon kívüli szám az asInt() hívásnál
            result.error = e.what();
            return result;
        }

        result.status = LineStatus::SNAPSHOT;
        result.snapshot = std::move(snap);
        return result;
    }

} // namespace Lanwatch::Core
