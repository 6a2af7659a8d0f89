#pragma once

#include <optional>
#include <vector>

namespace pnlsync {

// -----------------------------------------------------------------------------
// LedgerState: the cost-basis inputs of one open position
// -----------------------------------------------------------------------------
// quantity is signed (+long / -short). total_cost is the signed cost basis
// including opening commissions; avg_cost == total_cost / quantity.
// -----------------------------------------------------------------------------
struct LedgerState {
  double quantity{0.0};
  double avg_cost{0.0};
  double total_cost{0.0};
};

// -----------------------------------------------------------------------------
// TradeFill: one incoming trade as the ledger sees it
// -----------------------------------------------------------------------------
// signed_quantity is positive for buys and negative for sells. commission is
// the full commission of the trade, non-negative.
// -----------------------------------------------------------------------------
struct TradeFill {
  double signed_quantity{0.0};
  double price{0.0};
  double commission{0.0};
};

// What a trade did to the position it was applied to.
enum class LedgerEffect {
  Open,          // No prior position (or flat): a new position opens
  Add,           // Same direction: quantity grows, average cost re-weighted
  PartialClose,  // Opposite direction, smaller than the position
  FullClose,     // Opposite direction, exactly the position size
  Flip,          // Opposite direction, larger: close + open a new position
};

const char* ledgerEffectToString(LedgerEffect effect);

// -----------------------------------------------------------------------------
// TradeLeg: one trade-log row the outcome produces
// -----------------------------------------------------------------------------
// Every effect produces exactly one leg except Flip, which produces a closing
// leg and an opening leg. exec_suffix is appended to the execution id of the
// input trade ("" for single-leg outcomes, "-close" / "-open" for a flip).
// quantity is unsigned; the leg's side is the side of the input trade.
// -----------------------------------------------------------------------------
struct TradeLeg {
  double quantity{0.0};
  double commission{0.0};
  double realized_pnl{0.0};
  const char* exec_suffix{""};
};

// -----------------------------------------------------------------------------
// LedgerOutcome
// -----------------------------------------------------------------------------
//
// @brief  Everything a caller needs to apply one trade to cache and store.
//
// @details
//   position        Open state after the trade. std::nullopt after a full
//                   close. After a flip this is the NEW position (the prior
//                   one is archived).
//   realized_pnl    Realized contribution of this trade, net of the
//                   commission attributable to the closing quantity. Equals
//                   the sum of realized_pnl over legs.
//   archives_prior  The prior position must move to history (FullClose,
//                   Flip).
//   opens_new       A position with a new identity must be created (Open,
//                   Flip).
// -----------------------------------------------------------------------------
struct LedgerOutcome {
  LedgerEffect effect{LedgerEffect::Open};
  std::optional<LedgerState> position;
  double realized_pnl{0.0};
  bool archives_prior{false};
  bool opens_new{false};
  std::vector<TradeLeg> legs;
};

// -----------------------------------------------------------------------------
// CostBasisEngine: position-lifecycle accounting
// -----------------------------------------------------------------------------
//
// @brief  Pure function from (prior state, trade) to outcome. No I/O, no
//         locking, no state of its own.
//
// @details
// Math (q = signed trade quantity, p = price, c = commission):
//
//   Open (no prior, or prior quantity 0):
//     total_cost = q*p + c
//     avg_cost   = total_cost / q
//
//   Add (q has the sign of the position):
//     total_cost += q*p + c
//     quantity   += q
//     avg_cost    = total_cost / quantity
//
//   Close (q opposes the position):
//     close_qty        = min(|q|, |quantity|)
//     commission_close = c * (close_qty / |q|)
//     commission_open  = c - commission_close
//     realized         = (p - avg_cost) * close_qty   if long
//                        (avg_cost - p) * close_qty   if short
//                        minus commission_close
//     remaining        = quantity + q
//
//     remaining == 0           → FullClose.
//     remaining same sign      → PartialClose; avg_cost unchanged,
//                                total_cost = avg_cost * remaining.
//     remaining opposite sign  → Flip; the new position opens with
//                                total_cost = remaining*p + commission_open.
//
// Quantities are compared by sign only, never against a lot size. The
// commission split ratio is close_qty / |q| exactly.
//
// Thread model: Stateless; callable from any thread.
// -----------------------------------------------------------------------------
class CostBasisEngine {
 public:
  // -------------------------------------------------------------------------
  // apply(prior, trade)
  // -------------------------------------------------------------------------
  // @brief  Computes the outcome of applying trade to prior.
  //
  // @throws std::invalid_argument when the trade quantity is zero or not
  //         finite, the price is not a finite positive number, or the
  //         commission is negative or not finite.
  // -------------------------------------------------------------------------
  static LedgerOutcome apply(const std::optional<LedgerState>& prior,
                             const TradeFill& trade);

  // Sign of qty: +1, -1, or 0 when flat.
  static int direction(double qty);
};

}  // namespace pnlsync
