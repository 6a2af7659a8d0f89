// =============================================================================
// trade_booker_test.cpp
// =============================================================================
// Unit tests for pnlsync::TradeBooker.
//
// Validates:
//   - Open / add / close lifecycle against store and cache together
//   - Full close archives with the position's original id
//   - Flip writes "-close" and "-open" legs and opens a fresh id
//   - Booking the same exec id twice changes nothing
//   - Invalid input writes nothing
//   - The archive hook sees the closed position
//
// Design: MemoryLedgerStore + PositionCache with a pinned clock; the booker
// is driven directly, without the reconciler or a venue.
// =============================================================================

#include "pnlsync/cache/position_cache.hpp"
#include "pnlsync/ledger/trade_booker.hpp"
#include "pnlsync/storage/memory_ledger_store.hpp"
#include "pnlsync/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using pnlsync::BookingRequest;
using pnlsync::LedgerEffect;
using pnlsync::domain::PositionKey;
using pnlsync::domain::Side;

class TradeBookerTest : public ::testing::Test {
 protected:
  pnlsync::SimulationTimeProvider clock{1'700'000'000'000};
  pnlsync::MemoryLedgerStore store;
  pnlsync::PositionCache cache{clock};
  pnlsync::TradeBooker booker{cache, store};

  const PositionKey key{"AAPL", "NASDAQ", "USD"};
  std::int64_t account{0};

  void SetUp() override {
    account = store.upsertAccount("DU100", "USD");
    cache.hydrate(store.loadSnapshot(account));
  }

  BookingRequest request(const std::string& exec_id, Side side, double qty,
                         double price, double commission,
                         std::int64_t time_ms) const {
    BookingRequest r;
    r.key = key;
    r.side = side;
    r.quantity = qty;
    r.price = price;
    r.commission = commission;
    r.trade_time_ms = time_ms;
    r.exec_id = exec_id;
    r.con_id = 265598;
    return r;
  }
};

// -----------------------------------------------------------------------------
// 1. Buy 10 @ 100 (commission 1), sell 10 @ 110 (commission 1).
//    Realized 98, the position is archived under its original id.
// Why: This is the basic round trip every downstream number depends on.
// -----------------------------------------------------------------------------
TEST_F(TradeBookerTest, OpenThenFullCloseArchives) {
  auto opened = booker.book(request("e1", Side::Buy, 10, 100, 1, 1'000));
  ASSERT_TRUE(opened.booked);
  EXPECT_EQ(opened.effect, LedgerEffect::Open);
  ASSERT_TRUE(opened.position.has_value());
  EXPECT_DOUBLE_EQ(opened.position->avg_cost, 100.1);
  const auto id = opened.position->id;
  EXPECT_NE(id, 0);

  auto closed = booker.book(request("e2", Side::Sell, 10, 110, 1, 5'000));
  ASSERT_TRUE(closed.booked);
  EXPECT_EQ(closed.effect, LedgerEffect::FullClose);
  EXPECT_NEAR(closed.realized_pnl, 98.0, 1e-9);
  EXPECT_FALSE(closed.position.has_value());

  ASSERT_TRUE(closed.archived.has_value());
  EXPECT_EQ(closed.archived->id, id);
  EXPECT_EQ(closed.archived->open_time_ms, 1'000);
  EXPECT_EQ(closed.archived->close_time_ms, 5'000);
  EXPECT_NEAR(closed.archived->realized_pnl, 98.0, 1e-9);

  EXPECT_FALSE(store.findOpenPosition(account, key).has_value());
  EXPECT_FALSE(cache.findPosition(key).has_value());
  EXPECT_NEAR(cache.findHistory(id)->realized_pnl, 98.0, 1e-9);
  EXPECT_NEAR(cache.realizedTotal(), 98.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 2. A partial close keeps the id and open time and accumulates realized on
//    the open position in both store and cache.
// -----------------------------------------------------------------------------
TEST_F(TradeBookerTest, PartialCloseAccumulatesRealized) {
  booker.book(request("e1", Side::Buy, 10, 100, 0, 1'000));
  auto partial = booker.book(request("e2", Side::Sell, 4, 105, 0, 2'000));

  ASSERT_TRUE(partial.position.has_value());
  EXPECT_EQ(partial.effect, LedgerEffect::PartialClose);
  EXPECT_DOUBLE_EQ(partial.position->quantity, 6.0);
  EXPECT_DOUBLE_EQ(partial.position->avg_cost, 100.0);
  EXPECT_EQ(partial.position->open_time_ms, 1'000);
  EXPECT_DOUBLE_EQ(partial.position->realized_pnl, 20.0);

  auto stored = store.findOpenPosition(account, key);
  ASSERT_TRUE(stored.has_value());
  EXPECT_DOUBLE_EQ(stored->realized_pnl, 20.0);
  EXPECT_EQ(stored->id, partial.position->id);
}

// -----------------------------------------------------------------------------
// 3. Flip: long 10 @ 100, sell 15 @ 110. The prior is archived, a short 5 is
//    opened under a new id, and two trade legs are logged.
// -----------------------------------------------------------------------------
TEST_F(TradeBookerTest, FlipArchivesAndOpensNewPosition) {
  auto opened = booker.book(request("e1", Side::Buy, 10, 100, 0, 1'000));
  auto flipped = booker.book(request("e2", Side::Sell, 15, 110, 0, 3'000));

  EXPECT_EQ(flipped.effect, LedgerEffect::Flip);
  ASSERT_EQ(flipped.trades.size(), 2u);
  EXPECT_EQ(flipped.trades[0].exec_id, "e2-close");
  EXPECT_DOUBLE_EQ(flipped.trades[0].quantity, 10.0);
  EXPECT_EQ(flipped.trades[1].exec_id, "e2-open");
  EXPECT_DOUBLE_EQ(flipped.trades[1].quantity, 5.0);

  ASSERT_TRUE(flipped.archived.has_value());
  EXPECT_EQ(flipped.archived->id, opened.position->id);
  EXPECT_NEAR(flipped.archived->realized_pnl, 100.0, 1e-9);

  ASSERT_TRUE(flipped.position.has_value());
  EXPECT_NE(flipped.position->id, opened.position->id);
  EXPECT_DOUBLE_EQ(flipped.position->quantity, -5.0);
  EXPECT_EQ(flipped.position->open_time_ms, 3'000);
  EXPECT_DOUBLE_EQ(flipped.position->realized_pnl, 0.0);

  // The original exec id still resolves, so a replay is recognised.
  EXPECT_TRUE(store.findTradeByExecId("e2").has_value());
}

// -----------------------------------------------------------------------------
// 4. The same exec id booked twice only counts once.
// Why: Replay after reconnect delivers every execution of the day again.
// -----------------------------------------------------------------------------
TEST_F(TradeBookerTest, DuplicateExecIdIsIgnored) {
  booker.book(request("e1", Side::Buy, 10, 100, 0, 1'000));
  auto dup = booker.book(request("e1", Side::Buy, 10, 100, 0, 1'000));

  EXPECT_FALSE(dup.booked);
  EXPECT_EQ(store.tradeCount(), 1u);
  EXPECT_DOUBLE_EQ(cache.findPosition(key)->quantity, 10.0);
}

// -----------------------------------------------------------------------------
// 5. Rejected input leaves store and cache untouched.
// -----------------------------------------------------------------------------
TEST_F(TradeBookerTest, InvalidInputWritesNothing) {
  EXPECT_THROW(booker.book(request("", Side::Buy, 10, 100, 0, 1'000)),
               std::invalid_argument);
  EXPECT_THROW(booker.book(request("e1", Side::Buy, 0, 100, 0, 1'000)),
               std::invalid_argument);
  EXPECT_THROW(booker.book(request("e2", Side::Buy, 10, -1, 0, 1'000)),
               std::invalid_argument);

  EXPECT_EQ(store.tradeCount(), 0u);
  EXPECT_TRUE(cache.snapshotPositions().empty());
}

// -----------------------------------------------------------------------------
// 6. Booking before the account is known is an error, not a silent drop.
// -----------------------------------------------------------------------------
TEST(TradeBookerNoAccountTest, RequiresAccount) {
  pnlsync::SimulationTimeProvider clock;
  pnlsync::MemoryLedgerStore store;
  pnlsync::PositionCache cache{clock};
  pnlsync::TradeBooker booker{cache, store};

  BookingRequest r;
  r.key = {"AAPL", "", "USD"};
  r.quantity = 1;
  r.price = 1;
  r.exec_id = "e1";
  EXPECT_THROW(booker.book(r), std::runtime_error);
}

// -----------------------------------------------------------------------------
// 7. The archive hook receives the closed position with its contract id.
// Why: The reconciler cancels the live-valuation subscription from it.
// -----------------------------------------------------------------------------
TEST_F(TradeBookerTest, ArchiveHookSeesClosedPosition) {
  std::vector<pnlsync::domain::OpenPosition> closed;
  booker.setArchiveHook(
      [&closed](const pnlsync::domain::OpenPosition& p) { closed.push_back(p); });

  booker.book(request("e1", Side::Buy, 10, 100, 0, 1'000));
  booker.book(request("e2", Side::Sell, 10, 101, 0, 2'000));

  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].key, key);
  EXPECT_EQ(closed[0].con_id.value_or(0), 265598);
}
