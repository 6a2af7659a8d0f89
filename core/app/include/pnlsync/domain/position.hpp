#pragma once

#include "pnlsync/domain/position_key.hpp"

#include <cstdint>
#include <optional>

namespace pnlsync {
namespace domain {

// -----------------------------------------------------------------------------
// PositionId
// -----------------------------------------------------------------------------
// Numeric identity assigned by the ledger store when a position is first
// opened. Stable for the lifetime of the position AND of its history entry:
// an archived position stays addressable by the id it had while open.
// 0 is reserved as "not yet assigned".
// -----------------------------------------------------------------------------
using PositionId = std::int64_t;

// -----------------------------------------------------------------------------
// OpenPosition: an active holding
// -----------------------------------------------------------------------------
//
// @brief  Cost-basis and valuation state for one PositionKey with nonzero
//         quantity.
//
// @details
// Sign convention for quantity (same as the venue):
//   positive → long
//   negative → short
//
// total_cost is the signed cost basis including opening commissions, so
// avg_cost == total_cost / quantity for every state the ledger produces.
//
// realized_pnl accumulates closes since the position was opened.
// unrealized_pnl and daily_pnl come from live valuation events and are never
// derived locally.
//
// Invariant: total_pnl == realized_pnl + unrealized_pnl. Every writer calls
// recomputeTotal() after touching either input.
//
// con_id is the venue contract id the live-valuation subscription is keyed
// on. It is a lookup hint only; the position does not own the subscription.
// -----------------------------------------------------------------------------
struct OpenPosition {
  PositionId id{0};
  PositionKey key;
  double quantity{0.0};
  double avg_cost{0.0};
  double total_cost{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  std::optional<double> daily_pnl;
  double total_pnl{0.0};
  std::int64_t open_time_ms{0};
  std::optional<std::int64_t> con_id;

  void recomputeTotal() { total_pnl = realized_pnl + unrealized_pnl; }
};

// -----------------------------------------------------------------------------
// HistoryEntry: a closed position
// -----------------------------------------------------------------------------
//
// @brief  Archived record of a position whose quantity returned to zero.
//
// @details
// id is the id the position carried while open. Immutable after archive,
// except for one kind of amendment: a late execution or commission report
// for the same symbol/currency widens close_time_ms and re-sums
// realized_pnl over the widened window.
// -----------------------------------------------------------------------------
struct HistoryEntry {
  PositionId id{0};
  PositionKey key;
  std::int64_t open_time_ms{0};
  std::int64_t close_time_ms{0};
  double realized_pnl{0.0};
};

}  // namespace domain
}  // namespace pnlsync
