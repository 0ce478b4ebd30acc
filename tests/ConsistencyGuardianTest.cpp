// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "TestSupport.hpp"
#include "modules/ConsistencyGuardian.hpp"

using namespace Lanwatch;
using namespace LanwatchTest;
using namespace std::chrono_literals;

class ConsistencyGuardianTest : public ::testing::Test {
protected:
    Store::SqliteTransferStore store{":memory:"};
    FakeInventory inventory;
    FakeRegistry registry;

    void SetUp() override {
        registry.entries = {makeDatasource("Default", "/logs", true, true)};
        registry.defaultName = "Default";
    }

    // service: 2 átvitel, 3 log sor, 1 stat sor
    void seedService(const std::string& service) {
        int64_t a = store.insertTransfer(makeTransfer(service, 60s, false));
        int64_t b = store.insertTransfer(makeTransfer(service, 60s, false));
        store.insertLogEntry(service, a);
        store.insertLogEntry(service, a);
        store.insertLogEntry(service, b);
        store.upsertServiceStat(service, 100, 50);
    }

    int64_t totalRows() {
        return store.countRows(Store::Table::DOWNLOADS) +
               store.countRows(Store::Table::LOG_ENTRIES) +
               store.countRows(Store::Table::SERVICE_STATS);
    }
};

// --- Orphan removal ---

TEST_F(ConsistencyGuardianTest, EmptyInventoryNeverDeletes) {
    seedService("steam");
    seedService("epic");
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.removeOrphanedServices();

    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(result.servicesRemoved, 0);
    EXPECT_EQ(totalRows(), 12);
}

TEST_F(ConsistencyGuardianTest, InventoryFailureIsTreatedAsEmptyInventory) {
    seedService("steam");
    seedService("epic");
    inventory.fail = true;
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.removeOrphanedServices();

    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(totalRows(), 12);
}

TEST_F(ConsistencyGuardianTest, GuardTripsWhenEveryDatabaseServiceWouldBeOrphaned) {
    seedService("steam");
    inventory.counts = {{"epic", 10}, {"blizzard", 4}};
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.removeOrphanedServices();

    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(result.rowsRemoved, 0);
    EXPECT_EQ(store.countRows(Store::Table::DOWNLOADS, std::string("steam")), 2);
}

TEST_F(ConsistencyGuardianTest, RemovesOnlyOrphanedServicesAndCountsEveryTable) {
    seedService("steam");
    seedService("epic");
    seedService("riot");
    inventory.counts = {{"Steam", 120}, {"epic", 3}};
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.removeOrphanedServices();

    EXPECT_FALSE(result.aborted);
    EXPECT_EQ(result.servicesRemoved, 1);
    EXPECT_EQ(result.rowsRemoved, 6);
    ASSERT_EQ(result.deletions.size(), 1u);
    EXPECT_EQ(result.deletions[0].service, "riot");
    EXPECT_EQ(result.deletions[0].transfers, 2);
    EXPECT_EQ(result.deletions[0].logEntries, 3);
    EXPECT_EQ(result.deletions[0].serviceStats, 1);

    EXPECT_EQ(store.countRows(Store::Table::DOWNLOADS, std::string("riot")), 0);
    EXPECT_EQ(totalRows(), 12);
}

TEST_F(ConsistencyGuardianTest, ServiceNamesCompareCaseInsensitively) {
    seedService("Steam");
    seedService("Epic");
    inventory.counts = {{"STEAM", 1}, {"epic", 1}};
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.removeOrphanedServices();

    EXPECT_FALSE(result.aborted);
    EXPECT_EQ(result.servicesRemoved, 0);
    EXPECT_EQ(totalRows(), 12);
}

TEST_F(ConsistencyGuardianTest, FailureMidTransactionRollsBackEverything) {
    seedService("steam");
    seedService("epic");
    seedService("riot");
    inventory.counts = {{"steam", 1}};

    FaultyStore faulty(store);
    faulty.failDeleteTransfersFor = "riot";   // "epic" már törölve lesz ekkorra
    Modules::ConsistencyGuardian guardian(faulty, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.removeOrphanedServices();

    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(result.rowsRemoved, 0);
    EXPECT_EQ(totalRows(), 18);
    EXPECT_EQ(store.countRows(Store::Table::LOG_ENTRIES, std::string("epic")), 3);
}

TEST_F(ConsistencyGuardianTest, ForceRefreshIsPassedToTheInventory) {
    seedService("steam");
    inventory.counts = {{"steam", 1}};
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    guardian.removeOrphanedServices(true);

    EXPECT_EQ(inventory.calls, 1);
    EXPECT_TRUE(inventory.lastForceRefresh);
}

TEST_F(ConsistencyGuardianTest, ServicesOfADisabledDatasourceAreNotOrphaned) {
    TempDir dir;
    // A log manager a log könyvtárban talált services.json-t adja vissza progress fájlként
    auto writeLogDir = [&dir](const std::string& name, const std::string& counts) {
        std::filesystem::create_directories(dir.path() / name);
        std::ofstream out(dir.file(name + "/services.json"));
        out << counts;
    };
    writeLogDir("logs-a", R"({"serviceCounts":{"steam":3}})");
    writeLogDir("logs-off", R"({"serviceCounts":{"epic":5}})");
    std::filesystem::create_directories(dir.path() / "ops");

    Config::ProbeConfig probe;
    probe.operationsDir = dir.file("ops");
    probe.logManagerPath = writeScript(dir, "log_manager", "cat \"$2/services.json\" > \"$3\"\n");

    registry.entries = {makeDatasource("A", dir.file("logs-a"), true, true),
                        makeDatasource("Off", dir.file("logs-off"), false)};
    registry.defaultName = "A";

    store.insertTransfer(makeTransfer("steam", 60s, false, 440, std::string("A")));
    store.insertTransfer(makeTransfer("epic", 60s, false, 440, std::string("Off")));

    Modules::LogManagerInventory logInventory(registry, probe, Telemetry::LogLevel::SILENT);
    Modules::ConsistencyGuardian guardian(store, registry, logInventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.removeOrphanedServices(false);

    EXPECT_FALSE(result.aborted);
    EXPECT_EQ(result.servicesRemoved, 0);
    EXPECT_EQ(store.countRows(Store::Table::DOWNLOADS, std::string("epic")), 1);
    EXPECT_EQ(store.countRows(Store::Table::DOWNLOADS, std::string("steam")), 1);
}

// --- Datasource normalization ---

TEST_F(ConsistencyGuardianTest, AllInconsistentDatasourceValuesCollapseToTheDefault) {
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("Default")));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("default")));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("")));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::nullopt));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("unknown")));
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.normalizeDatasources();

    EXPECT_FALSE(result.aborted);
    EXPECT_EQ(result.rowsUpdated, 4);
    EXPECT_EQ(store.distinctDatasources(), (std::vector<std::optional<std::string>>{std::string("Default")}));
}

TEST_F(ConsistencyGuardianTest, CaseMismatchMapsToTheCanonicalNonDefaultName) {
    registry.entries.push_back(makeDatasource("Secondary", "/logs2"));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("SECONDARY")));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("Secondary")));
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.normalizeDatasources();

    EXPECT_EQ(result.rowsUpdated, 1);
    EXPECT_EQ(result.bucketsRemapped, 1u);
    EXPECT_EQ(store.distinctDatasources(), (std::vector<std::optional<std::string>>{std::string("Secondary")}));
}

TEST_F(ConsistencyGuardianTest, DisabledDatasourcesStillCountAsKnownNames) {
    registry.entries.push_back(makeDatasource("Archive", "/archive", false));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("Archive")));
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    EXPECT_EQ(guardian.normalizeDatasources().rowsUpdated, 0);
}

TEST_F(ConsistencyGuardianTest, NormalizationWithoutDefaultUpdatesNothing) {
    registry.defaultName.reset();
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::nullopt));
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.normalizeDatasources();

    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(result.rowsUpdated, 0);
    EXPECT_EQ(store.distinctDatasources(), (std::vector<std::optional<std::string>>{std::nullopt}));
}

TEST_F(ConsistencyGuardianTest, CollidingDatasourceNamesAreRefused) {
    registry.entries.push_back(makeDatasource("DEFAULT", "/other"));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("default")));
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    auto result = guardian.normalizeDatasources();

    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(store.distinctDatasources(), (std::vector<std::optional<std::string>>{std::string("default")}));
}

TEST_F(ConsistencyGuardianTest, RunCycleNormalizesThenRemovesOrphans) {
    seedService("steam");
    seedService("riot");
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::nullopt));
    inventory.counts = {{"steam", 5}};
    Modules::ConsistencyGuardian guardian(store, registry, inventory, Telemetry::LogLevel::SILENT);

    guardian.runCycle();

    EXPECT_EQ(store.countRows(Store::Table::DOWNLOADS, std::string("riot")), 0);
    EXPECT_EQ(store.distinctDatasources(), (std::vector<std::optional<std::string>>{std::string("Default")}));
}
