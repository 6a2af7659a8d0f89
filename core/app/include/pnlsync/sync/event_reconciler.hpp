#pragma once

#include "pnlsync/cache/position_cache.hpp"
#include "pnlsync/eventbus/event_bus.hpp"
#include "pnlsync/events/venue_events.hpp"
#include "pnlsync/ledger/trade_booker.hpp"
#include "pnlsync/storage/i_ledger_store.hpp"
#include "pnlsync/time/i_time_provider.hpp"
#include "pnlsync/venue/i_venue_client.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pnlsync {

// -----------------------------------------------------------------------------
// EventReconciler: venue events → ledger, cache and store
// -----------------------------------------------------------------------------
//
// @brief  One handler per venue event kind. Each handler is a complete
//         reconciliation step: it decides what the event means for the
//         ledger and applies it to the store and the cache.
//
// @details
// Subscribes to the EventBus in its constructor (streaming events are live
// by definition) and unsubscribes in its destructor. SyncEngine also calls
// the handlers directly for the connect-time replay.
//
// Handlers and the state they own:
//   onExecution          → TradeBooker (live) or trade log only (replay);
//                          commission reports buffered by exec id
//   onCommissionReport   → trade row, realized idempotency, history widening
//   onPositionSnapshot   → open position upsert / archive; valuation
//                          subscriptions (con_id → venue request id)
//   onPositionPnL        → dedup map and pending batched store rows
//   onAccountPnL         → daily bucket for the New York trading date
//   onAccountValuation   → account summary field (write-back via flush())
//
// Events for another account are skipped. A handler never lets malformed
// numeric input through: non-finite or unparseable values are dropped with
// a std::cerr line.
//
// Errors:
//   StoreError and VenueError propagate to the caller (SyncEngine tears the
//   session down). Invalid execution data is logged and dropped.
//
// Thread model:
//   Sync worker only. Not thread-safe; the cache it writes is.
//
// Ownership:
//   References to cache, store, venue, bus and clock; owns the TradeBooker.
// -----------------------------------------------------------------------------
class EventReconciler {
 public:
  EventReconciler(PositionCache& cache, ILedgerStore& store,
                  IVenueClient& venue, EventBus& bus,
                  const ITimeProvider& clock, std::string base_currency);
  ~EventReconciler();

  EventReconciler(const EventReconciler&) = delete;
  EventReconciler& operator=(const EventReconciler&) = delete;
  EventReconciler(EventReconciler&&) = delete;
  EventReconciler& operator=(EventReconciler&&) = delete;

  // -------------------------------------------------------------------------
  // bindAccount(venue_account, account_id)
  // -------------------------------------------------------------------------
  // @brief  Sets the account the handlers act for. Called on every connect
  //         before any replay.
  // -------------------------------------------------------------------------
  void bindAccount(const std::string& venue_account, std::int64_t account_id);

  // -------------------------------------------------------------------------
  // onExecution(event, live)
  // -------------------------------------------------------------------------
  // @brief  Records one execution.
  //
  // @details
  // The exchange label is resolved against the open rows for the same
  // symbol/currency (exact match, then the first primary listing, then the
  // first row), so an alternative-venue fill lands on the existing
  // position.
  //
  //   live = true   → booked through TradeBooker (quantity / cost change).
  //   live = false  → connect-time replay: only the trade row is written;
  //                   the position snapshot already reflects the fill.
  //
  // A live fill whose commission report is already buffered is booked with
  // that commission, so it enters total_cost and avg_cost.
  //
  // Afterwards: a buffered commission report for the exec id is applied,
  // the open time moves back if the fill predates it, and the latest
  // history entry widens if the fill is late for a closed position.
  // -------------------------------------------------------------------------
  void onExecution(const ExecutionEvent& event, bool live);

  // -------------------------------------------------------------------------
  // onCommissionReport(event)
  // -------------------------------------------------------------------------
  // @brief  Final commission and realized PnL for an execution.
  //
  // @details
  // Buffered until the trade row exists. Applied through
  // PositionCache::recordExecRealized(), so a repeated report is a no-op.
  // For a flip the commission is split across both legs by quantity.
  //
  // The venue's realized figure is applied under the trade's key. After a
  // flip that key already holds the new position, so the closing leg's
  // realized delta lands on the new position's realized PnL (and on the
  // account total), not on the archived one's history entry.
  // -------------------------------------------------------------------------
  void onCommissionReport(const CommissionReportEvent& event);

  // -------------------------------------------------------------------------
  // onPositionSnapshot(event)
  // -------------------------------------------------------------------------
  // @brief  Venue-reported holding for one key.
  //
  // @details
  // The key is the event's own, unless an open row for the same symbol and
  // currency already carries the contract under another exchange label (a
  // position a live fill opened); the snapshot then updates that row.
  //
  // Quantity 0 archives the open position. Otherwise the position is
  // upserted (venue quantity and average cost are authoritative) keeping
  // its open time; a new position's open time is the first trade after the
  // last close for the symbol, or now. Then the per-position valuation
  // subscription is started if missing.
  // -------------------------------------------------------------------------
  void onPositionSnapshot(const PositionSnapshotEvent& event);

  // Archives every stored open position absent from reported. Reported keys
  // are resolved the same way onPositionSnapshot() resolves them.
  void reconcilePositions(const std::vector<PositionSnapshotEvent>& reported);

  void onPositionPnL(const PositionPnLEvent& event);
  void onAccountPnL(const AccountPnLEvent& event);
  void onAccountValuation(const AccountValuationEvent& event);

  // -------------------------------------------------------------------------
  // flush()
  // -------------------------------------------------------------------------
  // @brief  Write-back: pending valuation rows, dirty summary fields and the
  //         staged daily point. Dirty state is cleared only for what was
  //         written.
  // -------------------------------------------------------------------------
  void flush();

  // Forgets valuation subscriptions without venue calls (session is gone).
  void clearSubscriptions();

  TradeBooker& booker() { return booker_; }

  // --- Diagnostics ------------------------------------------------------------------
  std::size_t pendingCommissionReports() const { return pending_commissions_.size(); }
  std::size_t pendingValuationRows() const { return pending_valuations_.size(); }
  const std::map<std::int64_t, std::int64_t>& valuationSubscriptions() const {
    return pnl_request_by_contract_;
  }

 private:
  bool isForeignAccount(const std::string& account) const;
  std::string resolveExchange(const std::string& symbol,
                              const std::string& currency,
                              const std::string& reported) const;
  domain::PositionKey snapshotKey(const PositionSnapshotEvent& event) const;
  void applyCommission(const domain::TradeRecord& trade,
                       const std::string& exec_id, double commission,
                       double realized);
  void moveOpenTimeBack(const std::string& symbol, const std::string& currency,
                        std::int64_t trade_time_ms);
  void widenHistory(const std::string& symbol, const std::string& currency,
                    std::int64_t trade_time_ms, double realized);
  void archiveOpenPosition(const domain::OpenPosition& row);
  void subscribeValuation(std::optional<std::int64_t> con_id);
  void unsubscribeValuation(std::optional<std::int64_t> con_id);

  PositionCache& cache_;
  ILedgerStore& store_;
  IVenueClient& venue_;
  EventBus& bus_;
  const ITimeProvider& clock_;
  std::string base_currency_;

  TradeBooker booker_;

  std::string venue_account_;
  std::optional<std::int64_t> account_id_;

  std::vector<EventBus::SubscriptionId> subscriptions_;

  std::unordered_map<std::string, CommissionReportEvent> pending_commissions_;
  std::map<std::int64_t, std::int64_t> pnl_request_by_contract_;

  struct LastValuation {
    std::optional<double> daily;
    double unrealized{0.0};
  };
  std::unordered_map<std::int64_t, LastValuation> last_valuation_;
  std::map<std::int64_t, PositionValuationRow> pending_valuations_;
};

}  // namespace pnlsync
