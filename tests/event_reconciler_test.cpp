// =============================================================================
// event_reconciler_test.cpp
// =============================================================================
// Unit tests for pnlsync::EventReconciler.
//
// Validates:
//   - Live executions flow from the bus through the booker
//   - Replayed executions are written once and never move quantity
//   - Commission reports arriving first are buffered, repeats count once
//   - A late commission report widens the closed position's history
//   - Position snapshots open, update and archive; vanished rows archive
//   - Alternative-venue fills land on the primary listing's position
//   - A snapshot under another exchange label updates the fill's position
//   - A buffered commission enters the cost basis of a live fill
//   - A realized correction after a flip applies to the new position
//   - Malformed numbers, unknown sides and foreign accounts are dropped
//   - Valuation dedup and the flush write-back
//   - Account PnL is bucketed under the New York trading date
//
// Design: a connected SimulatedVenue stands in for the brokerage; events are
// published straight onto the bus the reconciler subscribed to.
// =============================================================================

#include "pnlsync/cache/position_cache.hpp"
#include "pnlsync/eventbus/event_bus.hpp"
#include "pnlsync/storage/memory_ledger_store.hpp"
#include "pnlsync/sync/event_reconciler.hpp"
#include "pnlsync/time/simulation_time_provider.hpp"
#include "pnlsync/time/time_utils.hpp"
#include "pnlsync/venue/simulated_venue.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>

using pnlsync::domain::AccountField;
using pnlsync::domain::PositionKey;

class EventReconcilerTest : public ::testing::Test {
 protected:
  pnlsync::SimulationTimeProvider clock{pnlsync::epoch_ms_from_utc(2024, 3, 5, 15)};
  pnlsync::EventBus bus;
  pnlsync::MemoryLedgerStore store;
  pnlsync::PositionCache cache{clock};
  pnlsync::SimulatedVenue venue{bus, clock};
  pnlsync::EventReconciler reconciler{cache, store, venue, bus, clock, "USD"};

  const PositionKey aapl{"AAPL", "NASDAQ", "USD"};
  std::int64_t account{0};

  void SetUp() override {
    venue.connect();
    account = store.upsertAccount("SIM0001", "USD");
    cache.hydrate(store.loadSnapshot(account));
    reconciler.bindAccount("SIM0001", account);
  }

  static pnlsync::ExecutionEvent execution(const std::string& exec_id,
                                           const std::string& side,
                                           double shares, double price,
                                           std::int64_t time_ms,
                                           const std::string& exchange = "NASDAQ") {
    pnlsync::ExecutionEvent e;
    e.exec_id = exec_id;
    e.account = "SIM0001";
    e.symbol = "AAPL";
    e.exchange = exchange;
    e.currency = "USD";
    e.side = side;
    e.shares = shares;
    e.price = price;
    e.time_ms = time_ms;
    e.con_id = 111;
    return e;
  }

  static pnlsync::CommissionReportEvent report(const std::string& exec_id,
                                               double commission,
                                               double realized) {
    pnlsync::CommissionReportEvent r;
    r.exec_id = exec_id;
    r.commission = commission;
    r.realized_pnl = realized;
    r.currency = "USD";
    return r;
  }

  static pnlsync::PositionSnapshotEvent snapshot(const std::string& symbol,
                                                 double qty, double avg,
                                                 std::int64_t con_id) {
    pnlsync::PositionSnapshotEvent p;
    p.account = "SIM0001";
    p.symbol = symbol;
    p.exchange = "NASDAQ";
    p.currency = "USD";
    p.quantity = qty;
    p.avg_cost = avg;
    p.con_id = con_id;
    return p;
  }
};

// -----------------------------------------------------------------------------
// 1. Buy then sell through the bus; the venue's realized figure (net of
//    commission) replaces the locally computed one exactly once.
// Why: The venue is authoritative for realized PnL; the local figure is only
//      a placeholder until the commission report lands.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, LiveRoundTripWithCommissionReports) {
  bus.publish(execution("e1", "BOT", 10, 100, 1'000));
  ASSERT_TRUE(cache.findPosition(aapl).has_value());
  EXPECT_DOUBLE_EQ(cache.findPosition(aapl)->quantity, 10.0);

  bus.publish(report("e1", 1.0, 0.0));
  bus.publish(execution("e2", "SLD", 10, 110, 2'000));
  EXPECT_FALSE(cache.findPosition(aapl).has_value());
  EXPECT_DOUBLE_EQ(cache.realizedTotal(), 100.0);

  bus.publish(report("e2", 1.0, 99.0));
  EXPECT_DOUBLE_EQ(cache.realizedTotal(), 99.0);

  bus.publish(report("e2", 1.0, 99.0));
  EXPECT_DOUBLE_EQ(cache.realizedTotal(), 99.0);

  const auto history = cache.snapshotHistory();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_DOUBLE_EQ(history[0].realized_pnl, 99.0);
  EXPECT_DOUBLE_EQ(store.latestHistory(account, "AAPL", "USD")->realized_pnl, 99.0);
  EXPECT_DOUBLE_EQ(store.findTradeByExecId("e2")->commission, 1.0);
}

// -----------------------------------------------------------------------------
// 2. Replay writes each execution once and never touches quantity.
// Why: After every reconnect the venue resends the day's executions; the
//      position snapshot already reflects them.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, ReplayIsIdempotent) {
  const auto e = execution("r1", "BOT", 10, 100, 1'000);
  reconciler.onExecution(e, false);
  reconciler.onExecution(e, false);

  EXPECT_EQ(store.tradeCount(), 1u);
  EXPECT_TRUE(cache.snapshotPositions().empty());

  // A live redelivery of an already logged exec is ignored as well.
  reconciler.onExecution(e, true);
  EXPECT_EQ(store.tradeCount(), 1u);
  EXPECT_TRUE(cache.snapshotPositions().empty());
}

// -----------------------------------------------------------------------------
// 3. A commission report that arrives before its execution is applied when
//    the execution shows up.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, EarlyCommissionReportIsBuffered) {
  bus.publish(report("e5", 2.0, 0.0));
  EXPECT_EQ(reconciler.pendingCommissionReports(), 1u);

  bus.publish(execution("e5", "BOT", 5, 50, 1'000));
  EXPECT_EQ(reconciler.pendingCommissionReports(), 0u);

  auto trade = store.findTradeByExecId("e5");
  ASSERT_TRUE(trade.has_value());
  EXPECT_DOUBLE_EQ(trade->commission, 2.0);
}

// -----------------------------------------------------------------------------
// 4. Non-finite commission values are treated as zero, not propagated.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, NonFiniteCommissionTreatedAsZero) {
  bus.publish(execution("e1", "BOT", 10, 100, 1'000));
  pnlsync::CommissionReportEvent bad = report("e1", 0.0, 0.0);
  bad.commission = std::numeric_limits<double>::infinity();
  bad.realized_pnl = std::numeric_limits<double>::quiet_NaN();
  bus.publish(bad);

  EXPECT_DOUBLE_EQ(store.findTradeByExecId("e1")->commission, 0.0);
  EXPECT_DOUBLE_EQ(cache.realizedTotal(), 0.0);
}

// -----------------------------------------------------------------------------
// 5. A snapshot opens the position with its open time taken from the trade
//    log, subscribes valuation, and a zero quantity archives it again.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, SnapshotOpensAndArchives) {
  reconciler.onExecution(execution("r1", "BOT", 10, 100, 500), false);
  bus.publish(snapshot("AAPL", 10, 100, 111));

  auto pos = cache.findPosition(aapl);
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->open_time_ms, 500);
  EXPECT_EQ(venue.positionPnLSubscriptions().count(111), 1u);
  EXPECT_EQ(reconciler.valuationSubscriptions().count(111), 1u);

  bus.publish(snapshot("AAPL", 0, 0, 111));
  EXPECT_FALSE(cache.findPosition(aapl).has_value());
  EXPECT_FALSE(store.findOpenPosition(account, aapl).has_value());
  ASSERT_EQ(cache.snapshotHistory().size(), 1u);
  EXPECT_EQ(cache.snapshotHistory()[0].id, pos->id);
  EXPECT_TRUE(venue.positionPnLSubscriptions().empty());
  EXPECT_TRUE(reconciler.valuationSubscriptions().empty());
}

// -----------------------------------------------------------------------------
// 6. A stored position the venue no longer reports is archived.
// Why: A position closed while the service was down never gets a zero
//      quantity snapshot.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, VanishedPositionIsArchived) {
  const auto kept = snapshot("AAPL", 10, 100, 111);
  reconciler.onPositionSnapshot(kept);
  reconciler.onPositionSnapshot(snapshot("MSFT", 5, 300, 222));

  reconciler.reconcilePositions({kept});

  EXPECT_TRUE(cache.findPosition(aapl).has_value());
  EXPECT_FALSE(cache.findPosition({"MSFT", "NASDAQ", "USD"}).has_value());
  EXPECT_EQ(store.listOpenPositions(account).size(), 1u);
  EXPECT_TRUE(store.latestHistory(account, "MSFT", "USD").has_value());
}

// -----------------------------------------------------------------------------
// 7. A fill reported under an alternative venue label lands on the open
//    position of the primary listing.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, AlternativeVenueFillResolvesToPrimary) {
  bus.publish(execution("e1", "BOT", 10, 100, 1'000));
  bus.publish(execution("e2", "BOT", 5, 100, 2'000, "IBKRATS"));

  EXPECT_DOUBLE_EQ(cache.findPosition(aapl)->quantity, 15.0);
  EXPECT_FALSE(cache.findPosition({"AAPL", "IBKRATS", "USD"}).has_value());
  EXPECT_EQ(store.findTradeByExecId("e2")->key.exchange, "NASDAQ");
}

// -----------------------------------------------------------------------------
// 8. Malformed input is dropped without touching state.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, MalformedEventsAreDropped) {
  auto bad_position = snapshot("AAPL", 10, 100, 111);
  bad_position.quantity = std::numeric_limits<double>::quiet_NaN();
  bus.publish(bad_position);
  EXPECT_TRUE(cache.snapshotPositions().empty());

  bus.publish(execution("e1", "XYZ", 10, 100, 1'000));
  bus.publish(execution("", "BOT", 10, 100, 1'000));
  bus.publish(execution("e3", "BOT", 0, 100, 1'000));
  EXPECT_EQ(store.tradeCount(), 0u);

  bus.publish(pnlsync::AccountValuationEvent{"SIM0001", "NetLiquidation", "abc", "USD"});
  bus.publish(pnlsync::AccountValuationEvent{"SIM0001", "NetLiquidation", "12x", "USD"});
  bus.publish(pnlsync::AccountValuationEvent{"SIM0001", "NetLiquidation", "5", "EUR"});
  bus.publish(pnlsync::AccountValuationEvent{"SIM0001", "UnknownTag", "5", "USD"});
  EXPECT_FALSE(cache.snapshotAccountSummary().summary[AccountField::NetLiquidation].has_value());

  bus.publish(pnlsync::AccountValuationEvent{"SIM0001", "NetLiquidation", "1234.5", "BASE"});
  EXPECT_DOUBLE_EQ(
      cache.snapshotAccountSummary().summary[AccountField::NetLiquidation].value_or(0),
      1234.5);
}

// -----------------------------------------------------------------------------
// 9. Events for another account are ignored.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, ForeignAccountEventsSkipped) {
  auto foreign = execution("f1", "BOT", 10, 100, 1'000);
  foreign.account = "OTHER";
  bus.publish(foreign);

  auto foreign_position = snapshot("AAPL", 10, 100, 111);
  foreign_position.account = "OTHER";
  bus.publish(foreign_position);

  EXPECT_EQ(store.tradeCount(), 0u);
  EXPECT_TRUE(cache.snapshotPositions().empty());
}

// -----------------------------------------------------------------------------
// 10. Identical valuation updates are not re-queued; flush writes the rows
//     and the dirty summary fields, then nothing is left dirty.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, ValuationDedupAndFlush) {
  bus.publish(snapshot("AAPL", 10, 100, 111));

  pnlsync::PositionPnLEvent pnl;
  pnl.con_id = 111;
  pnl.unrealized_pnl = 5.0;
  pnl.daily_pnl = 1.0;
  bus.publish(pnl);
  EXPECT_EQ(reconciler.pendingValuationRows(), 1u);
  EXPECT_DOUBLE_EQ(cache.findPosition(aapl)->unrealized_pnl, 5.0);

  bus.publish(pnlsync::AccountValuationEvent{"SIM0001", "NetLiquidation", "1000", "USD"});
  reconciler.flush();
  EXPECT_EQ(reconciler.pendingValuationRows(), 0u);

  bus.publish(pnl);
  EXPECT_EQ(reconciler.pendingValuationRows(), 0u);

  EXPECT_DOUBLE_EQ(store.findOpenPosition(account, aapl)->unrealized_pnl, 5.0);
  const auto snap = store.loadSnapshot(account);
  EXPECT_DOUBLE_EQ(snap.summary[AccountField::NetLiquidation].value_or(0), 1000.0);
  EXPECT_TRUE(cache.collectDirty().empty());
}

// -----------------------------------------------------------------------------
// 11. Account PnL at 03:00 UTC on 5 March is still 4 March in New York.
// Why: The daily bucket follows the exchange calendar, not UTC.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, AccountPnLUsesNewYorkTradeDate) {
  clock.advance_time(pnlsync::epoch_ms_from_utc(2024, 3, 5, 3));

  pnlsync::AccountPnLEvent pnl;
  pnl.account = "SIM0001";
  pnl.daily_pnl = 12.0;
  pnl.unrealized_pnl = 3.0;
  pnl.realized_pnl = 4.0;
  bus.publish(pnl);

  pnlsync::AccountPnLEvent incomplete = pnl;
  incomplete.realized_pnl.reset();
  incomplete.daily_pnl = 99.0;
  bus.publish(incomplete);

  const auto series = cache.snapshotDailyPnL();
  ASSERT_EQ(series.size(), 1u);
  EXPECT_EQ(series[0].trade_date, "2024-03-04");
  EXPECT_DOUBLE_EQ(series[0].daily_pnl, 12.0);
}

// -----------------------------------------------------------------------------
// 12. A replayed fill older than the open time moves the open time back.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, EarlierFillMovesOpenTimeBack) {
  bus.publish(snapshot("AAPL", 10, 100, 111));
  const auto opened_at = cache.findPosition(aapl)->open_time_ms;

  reconciler.onExecution(execution("r0", "BOT", 10, 100, opened_at - 60'000), false);

  EXPECT_EQ(cache.findPosition(aapl)->open_time_ms, opened_at - 60'000);
  EXPECT_EQ(store.findOpenPosition(account, aapl)->open_time_ms, opened_at - 60'000);
}

// -----------------------------------------------------------------------------
// 13. A live fill opens the position under its own exchange label; the
//     venue's snapshot for the same contract under the listing exchange
//     updates that row instead of opening a second one.
// Why: One instrument must never show up as two open positions.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, SnapshotAdoptsPositionOpenedByFill) {
  const PositionKey island{"AAPL", "ISLAND", "USD"};
  bus.publish(execution("e1", "BOT", 10, 100, 1'000, "ISLAND"));
  const auto opened = cache.findPosition(island);
  ASSERT_TRUE(opened.has_value());

  bus.publish(snapshot("AAPL", 12, 100.5, 111));

  const auto rows = store.findOpenPositionsBySymbol(account, "AAPL", "USD");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].key, island);
  EXPECT_EQ(rows[0].id, opened->id);
  EXPECT_DOUBLE_EQ(rows[0].quantity, 12.0);
  ASSERT_EQ(cache.snapshotPositions().size(), 1u);
  EXPECT_DOUBLE_EQ(cache.findPosition(island)->avg_cost, 100.5);
  EXPECT_FALSE(cache.findPosition(aapl).has_value());

  // The reconnect sweep resolves the reported key the same way.
  reconciler.reconcilePositions({snapshot("AAPL", 12, 100.5, 111)});
  EXPECT_EQ(store.listOpenPositions(account).size(), 1u);
  EXPECT_FALSE(store.latestHistory(account, "AAPL", "USD").has_value());
}

// -----------------------------------------------------------------------------
// 14. A different contract under the same symbol keeps its own row.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, SnapshotForOtherContractKeepsOwnKey) {
  bus.publish(execution("e1", "BOT", 10, 100, 1'000, "ISLAND"));
  bus.publish(snapshot("AAPL", 3, 20, 999));

  EXPECT_EQ(store.findOpenPositionsBySymbol(account, "AAPL", "USD").size(), 2u);
  ASSERT_TRUE(cache.findPosition(aapl).has_value());
  EXPECT_DOUBLE_EQ(cache.findPosition(aapl)->quantity, 3.0);
}

// -----------------------------------------------------------------------------
// 15. A commission report that arrived first is part of the fill's cost.
// Why: total_cost = quantity * price + commission for an opening fill.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, BufferedCommissionEntersCostBasis) {
  bus.publish(report("e1", 1.0, 0.0));
  bus.publish(execution("e1", "BOT", 10, 100, 1'000));

  const auto pos = cache.findPosition(aapl);
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->total_cost, 1'001.0);
  EXPECT_DOUBLE_EQ(pos->avg_cost, 100.1);
  EXPECT_DOUBLE_EQ(store.findOpenPosition(account, aapl)->avg_cost, 100.1);
  EXPECT_DOUBLE_EQ(store.findTradeByExecId("e1")->commission, 1.0);
  EXPECT_EQ(reconciler.pendingCommissionReports(), 0u);

  // Closing at 110 realizes (110 - 100.1) * 10 = 99.
  bus.publish(execution("e2", "SLD", 10, 110, 2'000));
  EXPECT_NEAR(cache.realizedTotal(), 99.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 16. After a flip, the venue's correction to the closing execution's
//     realized figure lands on the position now open under the same key.
// -----------------------------------------------------------------------------
TEST_F(EventReconcilerTest, RealizedCorrectionAfterFlipHitsNewPosition) {
  bus.publish(execution("e1", "BOT", 10, 100, 1'000));
  bus.publish(execution("e2", "SLD", 15, 110, 2'000));
  ASSERT_DOUBLE_EQ(cache.findPosition(aapl)->quantity, -5.0);
  EXPECT_DOUBLE_EQ(cache.realizedTotal(), 100.0);

  bus.publish(report("e2", 1.5, 98.0));

  EXPECT_DOUBLE_EQ(cache.realizedTotal(), 98.0);
  EXPECT_DOUBLE_EQ(cache.findPosition(aapl)->realized_pnl, -2.0);
  EXPECT_DOUBLE_EQ(store.findTradeByExecId("e2-close")->commission, 1.0);
  EXPECT_DOUBLE_EQ(store.findTradeByExecId("e2-open")->commission, 0.5);
}
