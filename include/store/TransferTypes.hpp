// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_TRANSFER_TYPES_HPP
#define LANWATCH_TRANSFER_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace Lanwatch::Store {

    using UtcTime = std::chrono::system_clock::time_point;

    /**
     * @brief Egy cache-proxy átvitel rekordja (Downloads tábla).
     * A bájtszámlálókat a core nem módosítja, csak átviszi.
     */
    struct TransferRecord {
        int64_t id = 0;
        std::string service;                    // case-insensitive identitás
        std::string clientIp;
        std::optional<int64_t> appId;           // 0 = érvénytelen / placeholder
        std::optional<std::string> datasource;  // null, üres vagy egy konfigurált név
        bool active = false;
        UtcTime startTime{};
        UtcTime lastWrite{};                    // EndTimeUtc: az utolsó írás ideje
        int64_t cacheHitBytes = 0;
        int64_t cacheMissBytes = 0;
    };

    // Egy árva szolgáltatás törlésének soronkénti mérlege
    struct ServiceDeletion {
        std::string service;
        int64_t logEntries = 0;
        int64_t transfers = 0;
        int64_t serviceStats = 0;

        [[nodiscard]] int64_t total() const { return logEntries + transfers + serviceStats; }
    };

    class StoreError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}

#endif // LANWATCH_TRANSFER_TYPES_HPP
