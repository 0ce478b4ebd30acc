// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include <gtest/gtest.h>

#include <algorithm>

#include "TestSupport.hpp"
#include "store/SqliteTransferStore.hpp"
#include "utils/TimeUtils.hpp"

using namespace Lanwatch::Store;
using LanwatchTest::makeTransfer;
using namespace std::chrono_literals;

class SqliteTransferStoreTest : public ::testing::Test {
protected:
    SqliteTransferStore store{":memory:"};

    UtcTime cutoff(std::chrono::seconds quiet = 15s) {
        return std::chrono::system_clock::now() - quiet;
    }
};

TEST_F(SqliteTransferStoreTest, InsertedTransferRoundTripsThroughFind) {
    auto record = makeTransfer("Steam", 60s, true, std::nullopt, std::nullopt);
    int64_t id = store.insertTransfer(record);

    auto loaded = store.findTransfer(id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->service, "Steam");
    EXPECT_FALSE(loaded->appId.has_value());
    EXPECT_FALSE(loaded->datasource.has_value());
    EXPECT_TRUE(loaded->active);
    EXPECT_EQ(LanwatchUtils::formatUtc(loaded->lastWrite), LanwatchUtils::formatUtc(record.lastWrite));
}

TEST_F(SqliteTransferStoreTest, FindStaleActiveHonoursCutoffActiveFlagAndLimit) {
    for (int i = 0; i < 5; ++i) store.insertTransfer(makeTransfer("steam", 60s));
    store.insertTransfer(makeTransfer("steam", 2s));            // friss
    store.insertTransfer(makeTransfer("steam", 60s, false));    // már lezárt

    EXPECT_EQ(store.findStaleActive(cutoff(), 100).size(), 5u);

    auto limited = store.findStaleActive(cutoff(), 3);
    ASSERT_EQ(limited.size(), 3u);
    EXPECT_LT(limited[0].id, limited[1].id);
    EXPECT_LT(limited[1].id, limited[2].id);
}

TEST_F(SqliteTransferStoreTest, MarkInactiveSkipsRowsWrittenAfterTheCutoff) {
    int64_t stale = store.insertTransfer(makeTransfer("steam", 60s));
    int64_t fresh = store.insertTransfer(makeTransfer("steam", 1s));

    EXPECT_EQ(store.markInactive({stale, fresh}, cutoff()), 1);
    EXPECT_FALSE(store.findTransfer(stale)->active);
    EXPECT_TRUE(store.findTransfer(fresh)->active);

    // Második hívás: nincs mit átírni
    EXPECT_EQ(store.markInactive({stale}, cutoff()), 0);
    EXPECT_EQ(store.markInactive({}, cutoff()), 0);
}

TEST_F(SqliteTransferStoreTest, MarkInactiveByAppIdIgnoresAge) {
    store.insertTransfer(makeTransfer("steam", 0s, true, 0));
    store.insertTransfer(makeTransfer("steam", 0s, true, 0));
    int64_t real = store.insertTransfer(makeTransfer("steam", 0s, true, 730));

    EXPECT_EQ(store.markInactiveByAppId(0), 2);
    EXPECT_TRUE(store.findTransfer(real)->active);
}

TEST_F(SqliteTransferStoreTest, DistinctServicesAreLowerCased) {
    store.insertTransfer(makeTransfer("Steam", 60s));
    store.insertTransfer(makeTransfer("steam", 60s));
    store.insertTransfer(makeTransfer("EPIC", 60s));

    EXPECT_EQ(store.distinctServices(), (std::vector<std::string>{"epic", "steam"}));
}

TEST_F(SqliteTransferStoreTest, NullAndEmptyDatasourceShareOneBucket) {
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::nullopt));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("")));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("Default")));
    store.insertTransfer(makeTransfer("steam", 60s, false, 1, std::string("default")));

    auto values = store.distinctDatasources();
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(std::count(values.begin(), values.end(), std::nullopt), 1);

    EXPECT_EQ(store.reassignDatasource(std::nullopt, "Default"), 2);
    // Pontos egyezés: a "Default" sorok nem számítanak bele
    EXPECT_EQ(store.reassignDatasource(std::string("default"), "Default"), 1);
    EXPECT_EQ(store.distinctDatasources(), (std::vector<std::optional<std::string>>{std::string("Default")}));
}

TEST_F(SqliteTransferStoreTest, DeletesMatchServiceCaseInsensitively) {
    int64_t id = store.insertTransfer(makeTransfer("Steam", 60s));
    store.insertLogEntry("STEAM", id);
    store.insertLogEntry("epic", std::nullopt);
    store.upsertServiceStat("steam", 10, 20);

    EXPECT_EQ(store.deleteLogEntries("steam"), 1);
    EXPECT_EQ(store.deleteTransfers("steam"), 1);
    EXPECT_EQ(store.deleteServiceStats("steam"), 1);
    EXPECT_EQ(store.countRows(Table::LOG_ENTRIES), 1);
}

TEST_F(SqliteTransferStoreTest, TransactionRollsBackWhenDroppedWithoutCommit) {
    store.insertTransfer(makeTransfer("steam", 60s));
    {
        auto tx = store.beginTransaction();
        EXPECT_EQ(store.deleteTransfers("steam"), 1);
        EXPECT_EQ(store.countRows(Table::DOWNLOADS), 0);
    }
    EXPECT_EQ(store.countRows(Table::DOWNLOADS), 1);

    {
        auto tx = store.beginTransaction();
        store.deleteTransfers("steam");
        tx->commit();
    }
    EXPECT_EQ(store.countRows(Table::DOWNLOADS), 0);
}

TEST(SqliteTransferStoreOpenTest, UnopenablePathRaisesStoreError) {
    EXPECT_THROW(SqliteTransferStore("/nonexistent-dir/sub/lanwatch.db"), StoreError);
}
