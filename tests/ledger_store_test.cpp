// =============================================================================
// ledger_store_test.cpp
// =============================================================================
// Unit tests for pnlsync::MemoryLedgerStore and pnlsync::FileLedgerStore.
//
// Validates:
//   - Duplicate exec ids are rejected; "-close" legs resolve by base id
//   - Position upsert keeps id, realized and open time on conflict
//   - archivePosition() moves a row to history under the same id
//   - Symbol-level queries ignore exchange and honour their windows
//   - Daily cumulative values are recomputed in date order
//   - loadSnapshot() sums realized over the whole trade log
//   - listTrades() filters and orders the trade log
//   - FileLedgerStore reloads everything it committed
//
// File tests write under the system temp directory and remove their files.
// =============================================================================

#include "pnlsync/storage/file_ledger_store.hpp"
#include "pnlsync/storage/memory_ledger_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using pnlsync::domain::HistoryEntry;
using pnlsync::domain::OpenPosition;
using pnlsync::domain::PositionKey;
using pnlsync::domain::Side;
using pnlsync::domain::TradeRecord;

namespace {

TradeRecord makeTrade(std::int64_t account_id, const PositionKey& key,
                      const std::string& exec_id, std::int64_t time_ms,
                      double realized) {
  TradeRecord t;
  t.account_id = account_id;
  t.key = key;
  t.side = Side::Buy;
  t.quantity = 1;
  t.price = 100;
  t.realized_pnl = realized;
  t.trade_time_ms = time_ms;
  t.exec_id = exec_id;
  return t;
}

OpenPosition makePosition(const PositionKey& key, double qty, double avg,
                          std::int64_t open_ms) {
  OpenPosition p;
  p.key = key;
  p.quantity = qty;
  p.avg_cost = avg;
  p.total_cost = qty * avg;
  p.open_time_ms = open_ms;
  p.con_id = 42;
  return p;
}

}  // namespace

class MemoryLedgerStoreTest : public ::testing::Test {
 protected:
  pnlsync::MemoryLedgerStore store;
  std::int64_t account{0};

  const PositionKey nasdaq{"AAPL", "NASDAQ", "USD"};
  const PositionKey ats{"AAPL", "IBKRATS", "USD"};

  void SetUp() override { account = store.upsertAccount("DU100", "USD"); }
};

// -----------------------------------------------------------------------------
// 1. The same account name always maps to the same id.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, UpsertAccountIsStable) {
  EXPECT_EQ(store.upsertAccount("DU100", "EUR"), account);
  EXPECT_NE(store.upsertAccount("DU200", "USD"), account);
  EXPECT_EQ(store.loadSnapshot(account).base_currency, "EUR");
}

// -----------------------------------------------------------------------------
// 2. A second insert with the same exec id writes nothing.
// Why: Execution replay after reconnect depends on this to stay idempotent.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, DuplicateExecIdRejected) {
  EXPECT_TRUE(store.insertTrade(makeTrade(account, nasdaq, "e1", 1000, 0)));
  EXPECT_FALSE(store.insertTrade(makeTrade(account, nasdaq, "e1", 2000, 5)));
  EXPECT_EQ(store.tradeCount(), 1u);

  // Empty exec ids never collide.
  EXPECT_TRUE(store.insertTrade(makeTrade(account, nasdaq, "", 1000, 0)));
  EXPECT_TRUE(store.insertTrade(makeTrade(account, nasdaq, "", 1000, 0)));
  EXPECT_EQ(store.tradeCount(), 3u);
}

// -----------------------------------------------------------------------------
// 3. A flip's close leg is found through the original exec id.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, FindTradeFallsBackToCloseLeg) {
  store.insertTrade(makeTrade(account, nasdaq, "x7-close", 1000, 12));
  store.insertTrade(makeTrade(account, nasdaq, "x7-open", 1000, 0));

  auto found = store.findTradeByExecId("x7");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->exec_id, "x7-close");
  EXPECT_FALSE(store.findTradeByExecId("missing").has_value());

  ASSERT_TRUE(store.updateTradeCommission(found->id, 1.5, 10.5));
  EXPECT_DOUBLE_EQ(store.findTradeByExecId("x7-close")->commission, 1.5);
  EXPECT_FALSE(store.updateTradeCommission(999, 1.0, 1.0));
}

// -----------------------------------------------------------------------------
// 4. Upsert on an existing key keeps id, realized and open time.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, UpsertPositionKeepsIdentity) {
  const auto id = store.upsertPosition(account, makePosition(nasdaq, 10, 100, 5000));
  ASSERT_TRUE(store.updatePositionRealized(account, nasdaq, 30.0));

  auto again = makePosition(nasdaq, 4, 101, 9000);
  again.id = 12345;
  EXPECT_EQ(store.upsertPosition(account, again), id);

  auto stored = store.findOpenPosition(account, nasdaq);
  ASSERT_TRUE(stored.has_value());
  EXPECT_DOUBLE_EQ(stored->quantity, 4.0);
  EXPECT_DOUBLE_EQ(stored->realized_pnl, 30.0);
  EXPECT_EQ(stored->open_time_ms, 5000);
}

// -----------------------------------------------------------------------------
// 5. Archive keeps the id; a later open of the same key gets a fresh id.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, ArchiveMovesRowToHistory) {
  const auto id = store.upsertPosition(account, makePosition(nasdaq, 10, 100, 5000));

  EXPECT_TRUE(store.archivePosition(account, HistoryEntry{id, nasdaq, 5000, 8000, 98.0}));
  EXPECT_FALSE(store.findOpenPosition(account, nasdaq).has_value());
  EXPECT_FALSE(store.archivePosition(account, HistoryEntry{id, nasdaq, 5000, 8000, 98.0}));

  auto latest = store.latestHistory(account, "AAPL", "USD");
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->id, id);
  EXPECT_DOUBLE_EQ(latest->realized_pnl, 98.0);

  const auto reopened = store.upsertPosition(account, makePosition(nasdaq, 1, 1, 9000));
  EXPECT_GT(reopened, id);
}

// -----------------------------------------------------------------------------
// 6. Symbol queries match (symbol, currency) across exchange labels.
// Why: The same instrument is booked under an alternative venue label until
//      reconciliation resolves it.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, SymbolQueriesIgnoreExchange) {
  store.insertTrade(makeTrade(account, nasdaq, "a", 1000, 5));
  store.insertTrade(makeTrade(account, ats, "b", 2000, 7));
  store.insertTrade(makeTrade(account, nasdaq, "c", 3000, 11));
  store.insertTrade(makeTrade(account, {"AAPL", "NASDAQ", "EUR"}, "d", 500, 100));

  EXPECT_DOUBLE_EQ(store.sumRealized(account, "AAPL", "USD", std::nullopt, std::nullopt), 23.0);
  EXPECT_DOUBLE_EQ(store.sumRealized(account, "AAPL", "USD", 2000, 3000), 18.0);
  EXPECT_EQ(store.firstTradeTime(account, "AAPL", "USD", std::nullopt).value_or(-1), 1000);
  EXPECT_EQ(store.firstTradeTime(account, "AAPL", "USD", 1000).value_or(-1), 2000);
  EXPECT_EQ(store.lastTradeTime(account, "AAPL", "USD").value_or(-1), 3000);

  store.upsertPosition(account, makePosition(nasdaq, 1, 1, 1));
  store.upsertPosition(account, makePosition(ats, 2, 1, 1));
  EXPECT_EQ(store.findOpenPositionsBySymbol(account, "AAPL", "USD").size(), 2u);
}

// -----------------------------------------------------------------------------
// 7. Valuations and summary fields are partial updates.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, PartialValuationAndSummaryUpdates) {
  store.upsertPosition(account, makePosition(nasdaq, 10, 100, 1));
  store.updatePositionValuations(account, {{42, 15.0, 2.0}});
  store.updatePositionValuations(account, {{42, 16.0, std::nullopt}});

  auto pos = store.findOpenPosition(account, nasdaq);
  EXPECT_DOUBLE_EQ(pos->unrealized_pnl, 16.0);
  EXPECT_DOUBLE_EQ(pos->daily_pnl.value_or(-1), 2.0);

  using pnlsync::domain::AccountField;
  store.upsertAccountSummary(account, {{AccountField::NetLiquidation, 1000.0}}, 10);
  store.upsertAccountSummary(account, {{AccountField::TotalCashValue, 400.0}}, 20);

  const auto snap = store.loadSnapshot(account);
  EXPECT_DOUBLE_EQ(snap.summary[AccountField::NetLiquidation].value_or(-1), 1000.0);
  EXPECT_DOUBLE_EQ(snap.summary[AccountField::TotalCashValue].value_or(-1), 400.0);
  EXPECT_EQ(snap.summary.as_of_ms, 20);
}

// -----------------------------------------------------------------------------
// 8. Stored cumulative values follow date order.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, DailyCumulativeRecomputed) {
  store.upsertDailyPnL(account, {"2024-03-04", 3.0, 0.0});
  store.upsertDailyPnL(account, {"2024-03-01", 1.0, 0.0});
  store.upsertDailyPnL(account, {"2024-03-04", 4.0, 0.0});

  const auto snap = store.loadSnapshot(account);
  ASSERT_EQ(snap.daily.size(), 2u);
  EXPECT_EQ(snap.daily[0].trade_date, "2024-03-01");
  EXPECT_DOUBLE_EQ(snap.daily[1].cumulative_pnl, 5.0);
}

// -----------------------------------------------------------------------------
// 9. loadSnapshot() realized total covers every trade, archived or open.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, SnapshotSumsWholeTradeLog) {
  store.insertTrade(makeTrade(account, nasdaq, "a", 1, 5));
  store.insertTrade(makeTrade(account, {"MSFT", "", "USD"}, "b", 2, -2));
  const auto other = store.upsertAccount("DU200", "USD");
  store.insertTrade(makeTrade(other, nasdaq, "c", 3, 100));

  EXPECT_DOUBLE_EQ(store.loadSnapshot(account).realized_total, 3.0);
  EXPECT_THROW(store.loadSnapshot(777), pnlsync::StoreError);
}

// -----------------------------------------------------------------------------
// 10. listTrades() filters by account, instrument and an inclusive window,
//     oldest first.
// -----------------------------------------------------------------------------
TEST_F(MemoryLedgerStoreTest, ListTradesFiltersAndOrders) {
  store.insertTrade(makeTrade(account, nasdaq, "late", 300, 0));
  store.insertTrade(makeTrade(account, ats, "early", 100, 0));
  store.insertTrade(makeTrade(account, nasdaq, "mid", 200, 0));
  store.insertTrade(makeTrade(account, {"AAPL", "SBF", "EUR"}, "eur", 150, 0));
  store.insertTrade(makeTrade(store.upsertAccount("DU200", "USD"), nasdaq, "other", 200, 0));

  const auto all = store.listTrades(account, std::nullopt, std::nullopt,
                                    std::nullopt, std::nullopt);
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0].exec_id, "early");
  EXPECT_EQ(all[3].exec_id, "late");

  const auto usd = store.listTrades(account, std::string("AAPL"),
                                    std::string("USD"), 100, 200);
  ASSERT_EQ(usd.size(), 2u);
  EXPECT_EQ(usd[0].exec_id, "early");
  EXPECT_EQ(usd[0].key.exchange, "IBKRATS");
  EXPECT_EQ(usd[1].exec_id, "mid");

  EXPECT_TRUE(store.listTrades(account, std::string("MSFT"), std::nullopt,
                               std::nullopt, std::nullopt)
                  .empty());
}

// =============================================================================
// FileLedgerStore
// =============================================================================
class FileLedgerStoreTest : public ::testing::Test {
 protected:
  std::string path;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path = (std::filesystem::temp_directory_path() /
            (std::string("pnlsync-") + info->name() + ".json"))
               .string();
    std::filesystem::remove(path);
  }

  void TearDown() override {
    std::filesystem::remove(path);
    std::filesystem::remove(path + ".tmp");
  }
};

// -----------------------------------------------------------------------------
// 11. A missing file is an empty ledger; committed state survives a reopen.
// Why: The service restarts against the same file and must resume with the
//      same ids, trades and history.
// -----------------------------------------------------------------------------
TEST_F(FileLedgerStoreTest, ReloadsCommittedState) {
  const PositionKey key{"AAPL", "NASDAQ", "USD"};
  std::int64_t account = 0;
  pnlsync::domain::PositionId archived_id = 0;
  {
    pnlsync::FileLedgerStore store(path);
    account = store.upsertAccount("DU100", "USD");
    store.insertTrade(makeTrade(account, key, "e1", 1000, 0));
    store.insertTrade(makeTrade(account, key, "e2", 2000, 98));
    archived_id = store.upsertPosition(account, makePosition(key, 10, 100, 1000));
    store.archivePosition(account, HistoryEntry{archived_id, key, 1000, 2000, 98});
    store.upsertPosition(account, makePosition({"MSFT", "", "USD"}, 3, 300, 3000));
    store.upsertDailyPnL(account, {"2024-03-01", 98.0, 0.0});
  }
  ASSERT_TRUE(std::filesystem::exists(path));

  pnlsync::FileLedgerStore reopened(path);
  EXPECT_EQ(reopened.upsertAccount("DU100", "USD"), account);
  EXPECT_EQ(reopened.tradeCount(), 2u);
  EXPECT_FALSE(reopened.insertTrade(makeTrade(account, key, "e2", 5, 0)));

  const auto snap = reopened.loadSnapshot(account);
  EXPECT_DOUBLE_EQ(snap.realized_total, 98.0);
  ASSERT_EQ(snap.positions.size(), 1u);
  EXPECT_EQ(snap.positions[0].key.symbol, "MSFT");
  ASSERT_EQ(snap.history.size(), 1u);
  EXPECT_EQ(snap.history[0].id, archived_id);
  ASSERT_EQ(snap.daily.size(), 1u);

  // Ids keep increasing after a reload.
  EXPECT_GT(reopened.upsertPosition(account, makePosition(key, 1, 1, 1)),
            snap.positions[0].id);
}

// -----------------------------------------------------------------------------
// 12. A malformed document is reported instead of silently discarded.
// -----------------------------------------------------------------------------
TEST_F(FileLedgerStoreTest, MalformedFileThrows) {
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(pnlsync::FileLedgerStore store(path), pnlsync::StoreError);
}
