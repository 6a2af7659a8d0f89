#include "pnlsync/ledger/trade_booker.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace pnlsync {

TradeBooker::TradeBooker(PositionCache& cache, ILedgerStore& store)
    : cache_(cache), store_(store) {}

void TradeBooker::setArchiveHook(ArchiveHook hook) {
  archive_hook_ = std::move(hook);
}

// -----------------------------------------------------------------------------
// book()
// -----------------------------------------------------------------------------
BookingResult TradeBooker::book(const BookingRequest& request) {
  if (request.exec_id.empty()) {
    throw std::invalid_argument("booking requires an exec id");
  }
  const auto account = cache_.accountId();
  if (!account.has_value()) {
    throw std::runtime_error("cannot book a trade before the account is resolved");
  }
  const std::int64_t account_id = *account;

  BookingResult result;

  // --- 1. Idempotency --------------------------------------------------------
  if (store_.findTradeByExecId(request.exec_id).has_value()) {
    std::cout << "[TradeBooker] Duplicate exec " << request.exec_id
              << ", skipped\n";
    return result;
  }

  // --- 2. Ledger arithmetic (throws before any write) -----------------------
  const std::optional<domain::OpenPosition> prior =
      store_.findOpenPosition(account_id, request.key);
  std::optional<LedgerState> prior_state;
  if (prior.has_value()) {
    prior_state = LedgerState{prior->quantity, prior->avg_cost, prior->total_cost};
  }

  const TradeFill fill{domain::signedQuantity(request.side, request.quantity),
                       request.price, request.commission};
  const LedgerOutcome outcome = CostBasisEngine::apply(prior_state, fill);

  // --- 3. Trade log ------------------------------------------------------------
  for (const auto& leg : outcome.legs) {
    domain::TradeRecord trade;
    trade.account_id = account_id;
    trade.key = request.key;
    trade.side = request.side;
    trade.quantity = leg.quantity;
    trade.price = request.price;
    trade.commission = leg.commission;
    trade.realized_pnl = leg.realized_pnl;
    trade.trade_time_ms = request.trade_time_ms;
    trade.exec_id = request.exec_id + leg.exec_suffix;
    trade.perm_id = request.perm_id;

    if (!store_.insertTrade(trade)) {
      // Lost a race with another writer of the same exec id.
      std::cerr << "[TradeBooker] Exec " << trade.exec_id
                << " already logged, booking abandoned\n";
      return result;
    }
    result.trades.push_back(std::move(trade));
  }

  result.booked = true;
  result.effect = outcome.effect;
  result.realized_pnl = outcome.realized_pnl;

  // --- 4. Realized PnL through the idempotency map ----------------------------
  // The prior position is still open in the cache here, so a close's
  // realized lands on it before it is archived.
  cache_.recordExecRealized(request.exec_id, request.key, outcome.realized_pnl);

  // --- 5. Archive the prior position --------------------------------------------
  if (outcome.archives_prior && prior.has_value()) {
    result.archived = archive(account_id, *prior, request.trade_time_ms);
  }

  // --- 5/6. Upsert or open the resulting position --------------------------------
  if (outcome.position.has_value()) {
    const LedgerState& state = *outcome.position;
    const bool fresh = outcome.opens_new || !prior.has_value();

    domain::OpenPosition row;
    row.key = request.key;
    row.quantity = state.quantity;
    row.avg_cost = state.avg_cost;
    row.total_cost = state.total_cost;
    row.open_time_ms = fresh ? request.trade_time_ms : prior->open_time_ms;
    if (request.con_id.has_value()) {
      row.con_id = request.con_id;
    } else if (!fresh) {
      row.con_id = prior->con_id;
    }
    const domain::PositionId id = store_.upsertPosition(account_id, row);

    PositionUpdate update;
    update.id = id;
    update.quantity = state.quantity;
    update.avg_cost = state.avg_cost;
    update.total_cost = state.total_cost;
    update.open_time_ms = row.open_time_ms;
    update.con_id = row.con_id;
    update.realized_pnl = fresh ? 0.0 : prior->realized_pnl;
    cache_.upsertPosition(request.key, update);

    if (outcome.effect == LedgerEffect::PartialClose) {
      if (auto realized = cache_.positionRealized(request.key)) {
        store_.updatePositionRealized(account_id, request.key, *realized);
      }
    }
    result.position = cache_.findPosition(request.key);
  }

  std::cout << "[TradeBooker] " << request.key.toString() << " "
            << domain::sideToString(request.side) << " " << request.quantity
            << " @ " << request.price << " -> "
            << ledgerEffectToString(outcome.effect)
            << " realized=" << outcome.realized_pnl << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// archive(): history row with the preserved id, drop the open entry
// -----------------------------------------------------------------------------
domain::HistoryEntry TradeBooker::archive(std::int64_t account_id,
                                          const domain::OpenPosition& prior,
                                          std::int64_t close_time_ms) {
  domain::HistoryEntry entry;
  entry.id = prior.id;
  entry.key = prior.key;
  entry.open_time_ms = prior.open_time_ms;
  entry.close_time_ms = std::max(close_time_ms, prior.open_time_ms);
  entry.realized_pnl =
      store_.sumRealized(account_id, prior.key.symbol, prior.key.currency,
                         entry.open_time_ms, entry.close_time_ms);

  if (!store_.archivePosition(account_id, entry)) {
    std::cerr << "[TradeBooker] Open row " << prior.id << " for "
              << prior.key.toString() << " vanished before archive\n";
  }
  cache_.addHistory(entry);
  // The cache copy carries the live contract id even when the store row
  // predates it.
  const auto removed = cache_.removePosition(prior.key);
  if (archive_hook_) {
    archive_hook_(removed.has_value() ? *removed : prior);
  }
  return entry;
}

}  // namespace pnlsync
