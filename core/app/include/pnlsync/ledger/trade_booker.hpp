#pragma once

#include "pnlsync/cache/position_cache.hpp"
#include "pnlsync/domain/position.hpp"
#include "pnlsync/domain/position_key.hpp"
#include "pnlsync/domain/trade_record.hpp"
#include "pnlsync/ledger/cost_basis_engine.hpp"
#include "pnlsync/storage/i_ledger_store.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pnlsync {

// -----------------------------------------------------------------------------
// BookingRequest: one fill to book against the ledger
// -----------------------------------------------------------------------------
// quantity is unsigned; side carries the direction. exec_id must be
// non-empty: it is the idempotency key of the trade log.
// -----------------------------------------------------------------------------
struct BookingRequest {
  domain::PositionKey key;
  domain::Side side{domain::Side::Buy};
  double quantity{0.0};
  double price{0.0};
  double commission{0.0};
  std::int64_t trade_time_ms{0};
  std::string exec_id;
  std::optional<std::int64_t> perm_id;
  std::optional<std::int64_t> con_id;
};

// -----------------------------------------------------------------------------
// BookingResult
// -----------------------------------------------------------------------------
//   booked       false when exec_id was already in the trade log; nothing
//                else in the result is meaningful then.
//   trades       The rows written (one, or two for a flip).
//   archived     History entry written when the prior position closed.
//   position     Open position after booking (std::nullopt after a full
//                close).
// -----------------------------------------------------------------------------
struct BookingResult {
  bool booked{false};
  LedgerEffect effect{LedgerEffect::Open};
  double realized_pnl{0.0};
  std::vector<domain::TradeRecord> trades;
  std::optional<domain::HistoryEntry> archived;
  std::optional<domain::OpenPosition> position;
};

// -----------------------------------------------------------------------------
// TradeBooker: applies CostBasisEngine outcomes to the store and the cache
// -----------------------------------------------------------------------------
//
// @brief  The one place a fill mutates quantity and cost basis.
//
// @details
// book() runs these steps in order:
//   1. Reject a duplicate exec id (store lookup, which also matches the
//      "-close" leg of an earlier flip).
//   2. Read the prior open position from the store and run
//      CostBasisEngine::apply(). Invalid input throws std::invalid_argument
//      before anything is written.
//   3. Insert the trade legs.
//   4. Route the realized contribution through
//      PositionCache::recordExecRealized() so a later commission report for
//      the same exec id only applies its delta.
//   5. Upsert the open position, or archive it (full close / flip) with its
//      id preserved and realized re-summed from the trade log over
//      [open time, trade time]. The archive hook fires after the cache no
//      longer holds the position.
//   6. On a flip, open the remainder as a new position with a new id and
//      open time = trade time.
//
// Not thread-safe on its own: called from the sync worker only (and from
// tests). The store and the cache are individually thread-safe.
//
// Ownership:
//   Holds references to a PositionCache and an ILedgerStore owned by the
//   caller; both must outlive the booker.
// -----------------------------------------------------------------------------
class TradeBooker {
 public:
  using ArchiveHook = std::function<void(const domain::OpenPosition& closed)>;

  TradeBooker(PositionCache& cache, ILedgerStore& store);

  TradeBooker(const TradeBooker&) = delete;
  TradeBooker& operator=(const TradeBooker&) = delete;

  // Called once per archived position. Replaces any previous hook.
  void setArchiveHook(ArchiveHook hook);

  // -------------------------------------------------------------------------
  // book(request)
  // -------------------------------------------------------------------------
  // @throws std::invalid_argument  empty exec id, or input the cost-basis
  //                                engine rejects.
  // @throws std::runtime_error     the cache has no account identity yet.
  // @throws StoreError             propagated from the store.
  // -------------------------------------------------------------------------
  BookingResult book(const BookingRequest& request);

 private:
  domain::HistoryEntry archive(std::int64_t account_id,
                               const domain::OpenPosition& prior,
                               std::int64_t close_time_ms);

  PositionCache& cache_;
  ILedgerStore& store_;
  ArchiveHook archive_hook_;
};

}  // namespace pnlsync
