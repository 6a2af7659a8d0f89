#include "pnlsync/ledger/cost_basis_engine.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pnlsync {

namespace {

void validate(const TradeFill& trade) {
  if (!std::isfinite(trade.signed_quantity) || trade.signed_quantity == 0.0) {
    throw std::invalid_argument("trade quantity must be nonzero");
  }
  if (!std::isfinite(trade.price) || trade.price <= 0.0) {
    throw std::invalid_argument("trade price must be positive");
  }
  if (!std::isfinite(trade.commission) || trade.commission < 0.0) {
    throw std::invalid_argument("trade commission must be non-negative");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// ledgerEffectToString()
// -----------------------------------------------------------------------------
const char* ledgerEffectToString(LedgerEffect effect) {
  switch (effect) {
    case LedgerEffect::Open:         return "open";
    case LedgerEffect::Add:          return "add";
    case LedgerEffect::PartialClose: return "partial_close";
    case LedgerEffect::FullClose:    return "full_close";
    case LedgerEffect::Flip:         return "flip";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// direction()
// -----------------------------------------------------------------------------
int CostBasisEngine::direction(double qty) {
  if (qty > 0.0) {
    return 1;
  }
  if (qty < 0.0) {
    return -1;
  }
  return 0;
}

// -----------------------------------------------------------------------------
// apply(): open / add / partial close / full close / flip
// -----------------------------------------------------------------------------
LedgerOutcome CostBasisEngine::apply(const std::optional<LedgerState>& prior,
                                     const TradeFill& trade) {
  validate(trade);

  const double q = trade.signed_quantity;
  const double p = trade.price;
  const double c = trade.commission;

  LedgerOutcome out;

  // --- Open: nothing to net against ------------------------------------------
  if (!prior.has_value() || direction(prior->quantity) == 0) {
    LedgerState state;
    state.quantity = q;
    state.total_cost = q * p + c;
    state.avg_cost = state.total_cost / q;

    out.effect = LedgerEffect::Open;
    out.position = state;
    out.opens_new = true;
    out.legs.push_back(TradeLeg{std::abs(q), c, 0.0, ""});
    return out;
  }

  const double qty = prior->quantity;
  const double avg = prior->avg_cost;

  // --- Add: same direction ---------------------------------------------------
  if (direction(q) == direction(qty)) {
    LedgerState state;
    state.total_cost = prior->total_cost + q * p + c;
    state.quantity = qty + q;
    state.avg_cost = state.total_cost / state.quantity;

    out.effect = LedgerEffect::Add;
    out.position = state;
    out.legs.push_back(TradeLeg{std::abs(q), c, 0.0, ""});
    return out;
  }

  // --- Close: opposite direction ---------------------------------------------
  const double close_qty = std::min(std::abs(q), std::abs(qty));
  const double ratio = close_qty / std::abs(q);
  const double commission_close = c * ratio;
  const double commission_open = c - commission_close;

  const double gross = (qty > 0.0) ? (p - avg) * close_qty
                                   : (avg - p) * close_qty;
  const double realized = gross - commission_close;
  const double remaining = qty + q;

  out.realized_pnl = realized;

  if (direction(remaining) == 0) {
    out.effect = LedgerEffect::FullClose;
    out.archives_prior = true;
    out.legs.push_back(TradeLeg{close_qty, c, realized, ""});
    return out;
  }

  if (direction(remaining) == direction(qty)) {
    // Partial close: no cost-basis change per unit.
    LedgerState state;
    state.quantity = remaining;
    state.avg_cost = avg;
    state.total_cost = avg * remaining;

    out.effect = LedgerEffect::PartialClose;
    out.position = state;
    out.legs.push_back(TradeLeg{close_qty, c, realized, ""});
    return out;
  }

  // Flip: the close consumed exactly the prior quantity; the remainder opens
  // a fresh position at the trade price carrying the opening commission.
  LedgerState state;
  state.quantity = remaining;
  state.total_cost = remaining * p + commission_open;
  state.avg_cost = state.total_cost / remaining;

  out.effect = LedgerEffect::Flip;
  out.position = state;
  out.archives_prior = true;
  out.opens_new = true;
  out.legs.push_back(TradeLeg{close_qty, commission_close, realized, "-close"});
  out.legs.push_back(
      TradeLeg{std::abs(remaining), commission_open, 0.0, "-open"});
  return out;
}

}  // namespace pnlsync
