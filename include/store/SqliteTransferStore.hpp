// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// SQLite backed TransferStore (Downloads / LogEntries / ServiceStats)

#ifndef LANWATCH_SQLITE_TRANSFER_STORE_HPP
#define LANWATCH_SQLITE_TRANSFER_STORE_HPP

#include <mutex>
#include <string>

#include "store/TransferStore.hpp"

struct sqlite3;

namespace Lanwatch::Store {

    enum class Table {
        DOWNLOADS,
        LOG_ENTRIES,
        SERVICE_STATS
    };

    /**
     * @brief Egyetlen kapcsolat, WAL módban, busy timeouttal.
     * A kapcsolatot egy rekurzív mutex védi: egy nyitott tranzakció a commitig
     * fogja, így a többi szál írása addig vár, a tranzakciót nyitó szál pedig
     * szabadon hívhatja a törlő műveleteket.
     */
    class SqliteTransferStore : public TransferStore {
    private:
        sqlite3* db = nullptr;
        std::string path;
        std::recursive_mutex connectionMutex;

        void exec(const char* sql);
        void ensureSchema();

        friend class SqliteTransaction;

    public:
        // ":memory:" is elfogadott (tesztek)
        explicit SqliteTransferStore(const std::string& databasePath);
        ~SqliteTransferStore() override;

        SqliteTransferStore(const SqliteTransferStore&) = delete;
        SqliteTransferStore& operator=(const SqliteTransferStore&) = delete;

        const std::string& databasePath() const { return path; }

        // --- TransferStore ---
        std::vector<TransferRecord> findStaleActive(const UtcTime& cutoff, size_t limit) override;
        int64_t markInactive(const std::vector<int64_t>& ids, const UtcTime& cutoff) override;
        int64_t markInactiveByAppId(int64_t appId) override;

        std::vector<std::string> distinctServices() override;
        std::vector<std::optional<std::string>> distinctDatasources() override;
        int64_t reassignDatasource(const std::optional<std::string>& from, const std::string& to) override;

        std::unique_ptr<StoreTransaction> beginTransaction() override;
        int64_t deleteLogEntries(const std::string& service) override;
        int64_t deleteTransfers(const std::string& service) override;
        int64_t deleteServiceStats(const std::string& service) override;

        // --- Ingestion oldali segédek (a core nem hívja, a tesztek és a karbantartás igen) ---
        int64_t insertTransfer(const TransferRecord& record);
        int64_t insertLogEntry(const std::string& service, std::optional<int64_t> downloadId);
        void upsertServiceStat(const std::string& service, int64_t hitBytes, int64_t missBytes);

        std::optional<TransferRecord> findTransfer(int64_t id);
        int64_t countRows(Table table, const std::optional<std::string>& service = std::nullopt);
        int64_t countActive();
    };
}

#endif // LANWATCH_SQLITE_TRANSFER_STORE_HPP
