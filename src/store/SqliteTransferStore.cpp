// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "store/SqliteTransferStore.hpp"
#include "utils/TimeUtils.hpp"

#include <sqlite3.h>

namespace Lanwatch::Store {

    namespace {

        const char* SCHEMA_SQL = R"SQL(
            CREATE TABLE IF NOT EXISTS Downloads (
                Id              INTEGER PRIMARY KEY AUTOINCREMENT,
                Service         TEXT NOT NULL,
                ClientIp        TEXT NOT NULL DEFAULT '',
                GameAppId       INTEGER,
                Datasource      TEXT,
                IsActive        INTEGER NOT NULL DEFAULT 0,
                StartTimeUtc    TEXT NOT NULL,
                EndTimeUtc      TEXT NOT NULL,
                CacheHitBytes   INTEGER NOT NULL DEFAULT 0,
                CacheMissBytes  INTEGER NOT NULL DEFAULT 0
            );
            CREATE INDEX IF NOT EXISTS IX_Downloads_IsActive_EndTimeUtc ON Downloads(IsActive, EndTimeUtc);
            CREATE INDEX IF NOT EXISTS IX_Downloads_Service ON Downloads(Service);

            CREATE TABLE IF NOT EXISTS LogEntries (
                Id          INTEGER PRIMARY KEY AUTOINCREMENT,
                Timestamp   TEXT NOT NULL,
                Service     TEXT NOT NULL,
                DownloadId  INTEGER
            );
            CREATE INDEX IF NOT EXISTS IX_LogEntries_Service ON LogEntries(Service);

            CREATE TABLE IF NOT EXISTS ServiceStats (
                Service              TEXT PRIMARY KEY,
                TotalCacheHitBytes   INTEGER NOT NULL DEFAULT 0,
                TotalCacheMissBytes  INTEGER NOT NULL DEFAULT 0,
                TotalDownloads       INTEGER NOT NULL DEFAULT 0,
                LastActivityUtc      TEXT
            );
        )SQL";

        const char* TRANSFER_COLUMNS =
            "Id, Service, ClientIp, GameAppId, Datasource, IsActive, StartTimeUtc, EndTimeUtc, "
            "CacheHitBytes, CacheMissBytes";

        /**
         * @brief Prepared statement RAII burok: finalize a destruktorban.
         */
        class Statement {
        private:
            sqlite3* db;
            sqlite3_stmt* stmt = nullptr;

        public:
            Statement(sqlite3* connection, const std::string& sql) : db(connection) {
                if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
                    throw StoreError("prepare failed: " + std::string(sqlite3_errmsg(db)) + " [" + sql + "]");
                }
            }

            ~Statement() {
                if (stmt) sqlite3_finalize(stmt);
            }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            void bind(int index, const std::string& value) {
                check(sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT));
            }

            void bind(int index, int64_t value) {
                check(sqlite3_bind_int64(stmt, index, value));
            }

            void bind(int index, const std::optional<std::string>& value) {
                if (value) bind(index, *value);
                else check(sqlite3_bind_null(stmt, index));
            }

            void bind(int index, const std::optional<int64_t>& value) {
                if (value) bind(index, *value);
                else check(sqlite3_bind_null(stmt, index));
            }

            // true = van sor, false = kész
            bool step() {
                int rc = sqlite3_step(stmt);
                if (rc == SQLITE_ROW) return true;
                if (rc == SQLITE_DONE) return false;
                throw StoreError("step failed: " + std::string(sqlite3_errmsg(db)));
            }

            int64_t run() {
                while (step()) {}
                return sqlite3_changes(db);
            }

            bool isNull(int column) const { return sqlite3_column_type(stmt, column) == SQLITE_NULL; }

            int64_t int64At(int column) const { return sqlite3_column_int64(stmt, column); }

            std::string textAt(int column) const {
                const unsigned char* text = sqlite3_column_text(stmt, column);
                return text ? reinterpret_cast<const char*>(text) : "";
            }

        private:
            void check(int rc) {
                if (rc != SQLITE_OK) {
                    throw StoreError("bind failed: " + std::string(sqlite3_errmsg(db)));
                }
            }
        };

        UtcTime timeAt(const Statement& stmt, int column) {
            auto parsed = LanwatchUtils::parseUtc(stmt.textAt(column));
            return parsed ? *parsed : UtcTime{};
        }

        TransferRecord readTransfer(const Statement& stmt) {
            TransferRecord record;
            record.id = stmt.int64At(0);
            record.service = stmt.textAt(1);
            record.clientIp = stmt.textAt(2);
            if (!stmt.isNull(3)) record.appId = stmt.int64At(3);
            if (!stmt.isNull(4)) record.datasource = stmt.textAt(4);
            record.active = stmt.int64At(5) != 0;
            record.startTime = timeAt(stmt, 6);
            record.lastWrite = timeAt(stmt, 7);
            record.cacheHitBytes = stmt.int64At(8);
            record.cacheMissBytes = stmt.int64At(9);
            return record;
        }

        const char* tableName(Table table) {
            switch (table) {
                case Table::DOWNLOADS:     return "Downloads";
                case Table::LOG_ENTRIES:   return "LogEntries";
                case Table::SERVICE_STATS: return "ServiceStats";
            }
            return "Downloads";
        }
    }

    // --- Transaction ---

    /**
     * @brief BEGIN IMMEDIATE ... COMMIT; commit nélkül a destruktor ROLLBACK-et futtat.
     * A kapcsolat mutexét az élettartama alatt végig tartja.
     */
    class SqliteTransaction : public StoreTransaction {
    private:
        SqliteTransferStore& store;
        std::unique_lock<std::recursive_mutex> lock;
        bool open = false;

    public:
        explicit SqliteTransaction(SqliteTransferStore& owner)
            : store(owner), lock(owner.connectionMutex) {
            store.exec("BEGIN IMMEDIATE");
            open = true;
        }

        ~SqliteTransaction() override {
            if (open) {
                // Destruktorból nem dobhatunk; a ROLLBACK hibakódja itt nem menthető meg
                sqlite3_exec(store.db, "ROLLBACK", nullptr, nullptr, nullptr);
            }
        }

        void commit() override {
            if (!open) throw StoreError("commit on a finished transaction");
            store.exec("COMMIT");
            open = false;
        }

        void rollback() override {
            if (!open) return;
            open = false;
            store.exec("ROLLBACK");
        }
    };

    // --- Connection ---

    SqliteTransferStore::SqliteTransferStore(const std::string& databasePath) : path(databasePath) {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
            std::string message = db ? sqlite3_errmsg(db) : "out of memory";
            if (db) sqlite3_close(db);
            db = nullptr;
            throw StoreError("Cannot open database " + path + ": " + message);
        }

        sqlite3_busy_timeout(db, 5000);

        try {
            exec("PRAGMA journal_mode=WAL");
            exec("PRAGMA synchronous=NORMAL");
            ensureSchema();
        } catch (const StoreError&) {
            sqlite3_close(db);
            db = nullptr;
            throw;
        }
    }

    SqliteTransferStore::~SqliteTransferStore() {
        if (db) {
            sqlite3_close(db);
        }
    }

    void SqliteTransferStore::exec(const char* sql) {
        char* err = nullptr;
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string message = err ? err : sqlite3_errmsg(db);
            if (err) sqlite3_free(err);
            throw StoreError("SQL error: " + message);
        }
    }

    void SqliteTransferStore::ensureSchema() {
        exec(SCHEMA_SQL);
    }

    // --- Reaper ---

    std::vector<TransferRecord> SqliteTransferStore::findStaleActive(const UtcTime& cutoff, size_t limit) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, std::string("SELECT ") + TRANSFER_COLUMNS +
                           " FROM Downloads WHERE IsActive = 1 AND EndTimeUtc < ? ORDER BY Id LIMIT ?");
        stmt.bind(1, LanwatchUtils::formatUtc(cutoff));
        stmt.bind(2, static_cast<int64_t>(limit));

        std::vector<TransferRecord> result;
        while (stmt.step()) {
            result.push_back(readTransfer(stmt));
        }
        return result;
    }

    int64_t SqliteTransferStore::markInactive(const std::vector<int64_t>& ids, const UtcTime& cutoff) {
        if (ids.empty()) return 0;

        std::string sql = "UPDATE Downloads SET IsActive = 0 WHERE IsActive = 1 AND EndTimeUtc < ? AND Id IN (";
        for (size_t i = 0; i < ids.size(); ++i) {
            sql += (i == 0) ? "?" : ",?";
        }
        sql += ")";

        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, sql);
        stmt.bind(1, LanwatchUtils::formatUtc(cutoff));
        for (size_t i = 0; i < ids.size(); ++i) {
            stmt.bind(static_cast<int>(i) + 2, ids[i]);
        }
        return stmt.run();
    }

    int64_t SqliteTransferStore::markInactiveByAppId(int64_t appId) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, "UPDATE Downloads SET IsActive = 0 WHERE IsActive = 1 AND GameAppId = ?");
        stmt.bind(1, appId);
        return stmt.run();
    }

    // --- Guardian ---

    std::vector<std::string> SqliteTransferStore::distinctServices() {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, "SELECT DISTINCT LOWER(Service) FROM Downloads ORDER BY 1");

        std::vector<std::string> services;
        while (stmt.step()) {
            services.push_back(stmt.textAt(0));
        }
        return services;
    }

    std::vector<std::optional<std::string>> SqliteTransferStore::distinctDatasources() {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, "SELECT DISTINCT NULLIF(Datasource, '') FROM Downloads ORDER BY 1");

        std::vector<std::optional<std::string>> values;
        while (stmt.step()) {
            if (stmt.isNull(0)) values.emplace_back(std::nullopt);
            else values.emplace_back(stmt.textAt(0));
        }
        return values;
    }

    int64_t SqliteTransferStore::reassignDatasource(const std::optional<std::string>& from, const std::string& to) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);

        if (!from || from->empty()) {
            Statement stmt(db, "UPDATE Downloads SET Datasource = ? WHERE Datasource IS NULL OR Datasource = ''");
            stmt.bind(1, to);
            return stmt.run();
        }

        // Pontos (BINARY) egyezés: "default" és "Default" külön vödör
        Statement stmt(db, "UPDATE Downloads SET Datasource = ? WHERE Datasource = ?");
        stmt.bind(1, to);
        stmt.bind(2, *from);
        return stmt.run();
    }

    std::unique_ptr<StoreTransaction> SqliteTransferStore::beginTransaction() {
        return std::make_unique<SqliteTransaction>(*this);
    }

    int64_t SqliteTransferStore::deleteLogEntries(const std::string& service) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, "DELETE FROM LogEntries WHERE LOWER(Service) = LOWER(?)");
        stmt.bind(1, service);
        return stmt.run();
    }

    int64_t SqliteTransferStore::deleteTransfers(const std::string& service) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, "DELETE FROM Downloads WHERE LOWER(Service) = LOWER(?)");
        stmt.bind(1, service);
        return stmt.run();
    }

    int64_t SqliteTransferStore::deleteServiceStats(const std::string& service) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, "DELETE FROM ServiceStats WHERE LOWER(Service) = LOWER(?)");
        stmt.bind(1, service);
        return stmt.run();
    }

    // --- Ingestion helpers ---

    int64_t SqliteTransferStore::insertTransfer(const TransferRecord& record) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db,
            "INSERT INTO Downloads (Service, ClientIp, GameAppId, Datasource, IsActive, StartTimeUtc, EndTimeUtc, "
            "CacheHitBytes, CacheMissBytes) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        stmt.bind(1, record.service);
        stmt.bind(2, record.clientIp);
        stmt.bind(3, record.appId);
        stmt.bind(4, record.datasource);
        stmt.bind(5, static_cast<int64_t>(record.active ? 1 : 0));
        stmt.bind(6, LanwatchUtils::formatUtc(record.startTime));
        stmt.bind(7, LanwatchUtils::formatUtc(record.lastWrite));
        stmt.bind(8, record.cacheHitBytes);
        stmt.bind(9, record.cacheMissBytes);
        stmt.run();
        return sqlite3_last_insert_rowid(db);
    }

    int64_t SqliteTransferStore::insertLogEntry(const std::string& service, std::optional<int64_t> downloadId) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, "INSERT INTO LogEntries (Timestamp, Service, DownloadId) VALUES (?, ?, ?)");
        stmt.bind(1, LanwatchUtils::formatUtc(std::chrono::system_clock::now()));
        stmt.bind(2, service);
        stmt.bind(3, downloadId);
        stmt.run();
        return sqlite3_last_insert_rowid(db);
    }

    void SqliteTransferStore::upsertServiceStat(const std::string& service, int64_t hitBytes, int64_t missBytes) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db,
            "INSERT INTO ServiceStats (Service, TotalCacheHitBytes, TotalCacheMissBytes, TotalDownloads, LastActivityUtc) "
            "VALUES (?, ?, ?, 1, ?) "
            "ON CONFLICT(Service) DO UPDATE SET "
            "TotalCacheHitBytes = TotalCacheHitBytes + excluded.TotalCacheHitBytes, "
            "TotalCacheMissBytes = TotalCacheMissBytes + excluded.TotalCacheMissBytes, "
            "TotalDownloads = TotalDownloads + 1, "
            "LastActivityUtc = excluded.LastActivityUtc");
        stmt.bind(1, service);
        stmt.bind(2, hitBytes);
        stmt.bind(3, missBytes);
        stmt.bind(4, LanwatchUtils::formatUtc(std::chrono::system_clock::now()));
        stmt.run();
    }

    std::optional<TransferRecord> SqliteTransferStore::findTransfer(int64_t id) {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, std::string("SELECT ") + TRANSFER_COLUMNS + " FROM Downloads WHERE Id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) return std::nullopt;
        return readTransfer(stmt);
    }

    int64_t SqliteTransferStore::countRows(Table table, const std::optional<std::string>& service) {
        std::string sql = std::string("SELECT COUNT(*) FROM ") + tableName(table);
        if (service) sql += " WHERE LOWER(Service) = LOWER(?)";

        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, sql);
        if (service) stmt.bind(1, *service);
        return stmt.step() ? stmt.int64At(0) : 0;
    }

    int64_t SqliteTransferStore::countActive() {
        std::lock_guard<std::recursive_mutex> lock(connectionMutex);
        Statement stmt(db, "SELECT COUNT(*) FROM Downloads WHERE IsActive = 1");
        return stmt.step() ? stmt.int64At(0) : 0;
    }
}
