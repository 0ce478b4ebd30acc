// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// Persistent transfer store seam: the sweeps only see this interface

#ifndef LANWATCH_TRANSFER_STORE_HPP
#define LANWATCH_TRANSFER_STORE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "store/TransferTypes.hpp"

namespace Lanwatch::Store {

    /**
     * @brief Többlépéses törlés tranzakciója.
     * Ha commit() nélkül szűnik meg, a destruktor visszagörget.
     */
    class StoreTransaction {
    public:
        virtual ~StoreTransaction() = default;

        virtual void commit() = 0;
        virtual void rollback() = 0;
    };

    /**
     * @brief A core által használt tárolóműveletek.
     * Minden hiba StoreError kivételként jön.
     */
    class TransferStore {
    public:
        virtual ~TransferStore() = default;

        // --- Reaper ---

        // Aktív rekordok, amelyek utolsó írása cutoff előtti; legfeljebb limit darab, id szerint
        virtual std::vector<TransferRecord> findStaleActive(const UtcTime& cutoff, size_t limit) = 0;

        /**
         * @brief Inaktívra állítja a megadott rekordokat.
         * Csak azt írja át, ami még aktív ÉS még mindig cutoff előtti, így egy
         * közben újra írt átvitel nem záródik le, és semmi nem "támad fel".
         * @return Az átállított sorok száma.
         */
        virtual int64_t markInactive(const std::vector<int64_t>& ids, const UtcTime& cutoff) = 0;

        // Kortól függetlenül lezár minden aktív rekordot az adott app id-val
        virtual int64_t markInactiveByAppId(int64_t appId) = 0;

        // --- Guardian ---

        // Kisbetűs, egyedi szolgáltatásnevek
        virtual std::vector<std::string> distinctServices() = 0;

        // Egyedi datasource értékek; null és üres egy vödör (nullopt)
        virtual std::vector<std::optional<std::string>> distinctDatasources() = 0;

        /**
         * @brief Minden rekord, amelynek datasource-a pontosan "from", "to"-ra vált.
         * from == nullopt a null és az üres értékeket együtt jelenti.
         */
        virtual int64_t reassignDatasource(const std::optional<std::string>& from, const std::string& to) = 0;

        [[nodiscard]] virtual std::unique_ptr<StoreTransaction> beginTransaction() = 0;

        // Szolgáltatásonkénti törlések (case-insensitive egyezés); tranzakción belül hívandók
        virtual int64_t deleteLogEntries(const std::string& service) = 0;
        virtual int64_t deleteTransfers(const std::string& service) = 0;
        virtual int64_t deleteServiceStats(const std::string& service) = 0;
    };
}

#endif // LANWATCH_TRANSFER_STORE_HPP
