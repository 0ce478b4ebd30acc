// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_STRING_UTILS_HPP
#define LANWATCH_STRING_UTILS_HPP

#include <string>
#include <vector>

namespace LanwatchUtils {
    /**
     * @brief Whitespace eltávolítása a sorok végéről és elejéről (telemetria/config tisztítás).
     */
    std::string trim(const std::string& s);

    /**
     * @brief ASCII kisbetűsítés. A szolgáltatásnevek azonosítása kis-nagybetű független.
     */
    std::string toLower(std::string s);

    bool iequals(const std::string& a, const std::string& b);

    /**
     * @brief Egy argumentum idézőjelbe tétele a naplózott parancssorhoz.
     */
    std::string quote(const std::string& arg);

    // "a" "b" "c" -- space-joined, individually quoted
    std::string joinQuoted(const std::vector<std::string>& args);

    std::string joinComma(const std::vector<std::string>& items, size_t limit = 10);
}

#endif
