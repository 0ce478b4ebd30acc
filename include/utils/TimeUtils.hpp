// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_TIME_UTILS_HPP
#define LANWATCH_TIME_UTILS_HPP

#include <chrono>
#include <optional>
#include <string>

namespace LanwatchUtils {
    using UtcTime = std::chrono::system_clock::time_point;

    /**
     * @brief "YYYY-MM-DD HH:MM:SS.mmm" UTC; ugyanaz a rendezhető szöveges forma,
     * amit az adatbázis EndTimeUtc oszlopa használ.
     */
    std::string formatUtc(UtcTime t);

    // Tört másodperc opcionális, tetszőleges pontossággal
    std::optional<UtcTime> parseUtc(const std::string& text);
}

#endif
