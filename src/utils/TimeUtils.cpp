// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "utils/TimeUtils.hpp"
#include <cstdio>
#include <ctime>

namespace LanwatchUtils {

    std::string formatUtc(UtcTime t) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
        std::time_t seconds = static_cast<std::time_t>(ms / 1000);
        int millis = static_cast<int>(ms % 1000);
        if (millis < 0) {
            millis += 1000;
            --seconds;
        }

        std::tm tm{};
        gmtime_r(&seconds, &tm);

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
        return buffer;
    }

    std::optional<UtcTime> parseUtc(const std::string& text) {
        std::tm tm{};
        int consumed = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2d%*[ T]%2d:%2d:%2d%n",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
            return std::nullopt;
        }
        tm.tm_year -= 1900;
        tm.tm_mon -= 1;

        UtcTime result = std::chrono::system_clock::from_time_t(timegm(&tm));

        // .FFFFFFF
        size_t pos = static_cast<size_t>(consumed);
        if (pos < text.size() && text[pos] == '.') {
            long long fraction = 0;
            int digits = 0;
            for (++pos; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos) {
                if (digits < 9) {
                    fraction = fraction * 10 + (text[pos] - '0');
                    ++digits;
                }
            }
            for (; digits < 9; ++digits) fraction *= 10;
            result += std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::nanoseconds(fraction));
        }
        return result;
    }
}
