#include "pnlsync/sync/event_reconciler.hpp"
#include "pnlsync/domain/account_summary.hpp"
#include "pnlsync/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace pnlsync {

namespace {

// Alternative-venue labels the venue reports fills under; never preferred
// over a primary listing when resolving a fill's exchange.
bool isNonPrimaryExchange(const std::string& exchange) {
  return exchange == "IBKRATS" || exchange == "OVERNIGHT";
}

// Whole-string numeric parse; std::nullopt for junk or non-finite values.
std::optional<double> parseFinite(const std::string& raw) {
  if (raw.empty()) {
    return std::nullopt;
  }
  std::size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(raw, &consumed);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  if (consumed != raw.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> finiteOrNone(const std::optional<double>& value) {
  if (!value.has_value() || !std::isfinite(*value)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor: bus subscriptions
// -----------------------------------------------------------------------------
EventReconciler::EventReconciler(PositionCache& cache, ILedgerStore& store,
                                 IVenueClient& venue, EventBus& bus,
                                 const ITimeProvider& clock,
                                 std::string base_currency)
    : cache_(cache),
      store_(store),
      venue_(venue),
      bus_(bus),
      clock_(clock),
      base_currency_(std::move(base_currency)),
      booker_(cache, store) {
  booker_.setArchiveHook([this](const domain::OpenPosition& closed) {
    unsubscribeValuation(closed.con_id);
  });

  subscriptions_.push_back(bus_.subscribe<ExecutionEvent>(
      [this](const ExecutionEvent& e) { onExecution(e, true); }));
  subscriptions_.push_back(bus_.subscribe<CommissionReportEvent>(
      [this](const CommissionReportEvent& e) { onCommissionReport(e); }));
  subscriptions_.push_back(bus_.subscribe<PositionSnapshotEvent>(
      [this](const PositionSnapshotEvent& e) { onPositionSnapshot(e); }));
  subscriptions_.push_back(bus_.subscribe<PositionPnLEvent>(
      [this](const PositionPnLEvent& e) { onPositionPnL(e); }));
  subscriptions_.push_back(bus_.subscribe<AccountPnLEvent>(
      [this](const AccountPnLEvent& e) { onAccountPnL(e); }));
  subscriptions_.push_back(bus_.subscribe<AccountValuationEvent>(
      [this](const AccountValuationEvent& e) { onAccountValuation(e); }));
}

EventReconciler::~EventReconciler() {
  for (auto id : subscriptions_) {
    bus_.unsubscribe(id);
  }
}

void EventReconciler::bindAccount(const std::string& venue_account,
                                  std::int64_t account_id) {
  venue_account_ = venue_account;
  account_id_ = account_id;
}

// -----------------------------------------------------------------------------
// onExecution()
// -----------------------------------------------------------------------------
void EventReconciler::onExecution(const ExecutionEvent& event, bool live) {
  if (!account_id_ || isForeignAccount(event.account)) {
    return;
  }
  const auto side = domain::parseSide(event.side);
  if (!side.has_value()) {
    std::cerr << "[EventReconciler] Exec " << event.exec_id
              << " has unknown side '" << event.side << "', dropped\n";
    return;
  }
  if (event.exec_id.empty()) {
    std::cerr << "[EventReconciler] Execution without exec id for "
              << event.symbol << ", dropped\n";
    return;
  }

  domain::PositionKey key{
      event.symbol, resolveExchange(event.symbol, event.currency, event.exchange),
      event.currency};

  auto pending = pending_commissions_.find(event.exec_id);

  double realized = 0.0;
  if (live) {
    BookingRequest request;
    if (pending != pending_commissions_.end()) {
      request.commission =
          std::max(0.0, finiteOrNone(pending->second.commission).value_or(0.0));
    }
    request.key = key;
    request.side = *side;
    request.quantity = event.shares;
    request.price = event.price;
    request.trade_time_ms = event.time_ms;
    request.exec_id = event.exec_id;
    request.perm_id = event.perm_id;
    request.con_id = event.con_id;

    BookingResult result;
    try {
      result = booker_.book(request);
    } catch (const std::invalid_argument& e) {
      std::cerr << "[EventReconciler] Exec " << event.exec_id
                << " rejected by ledger: " << e.what() << "\n";
      return;
    }
    if (!result.booked) {
      return;
    }
    realized = result.realized_pnl;
  } else {
    if (store_.findTradeByExecId(event.exec_id).has_value()) {
      return;
    }
    domain::TradeRecord trade;
    trade.account_id = *account_id_;
    trade.key = key;
    trade.side = *side;
    trade.quantity = event.shares;
    trade.price = event.price;
    trade.trade_time_ms = event.time_ms;
    trade.exec_id = event.exec_id;
    trade.perm_id = event.perm_id;
    if (!store_.insertTrade(trade)) {
      return;
    }
  }

  if (pending != pending_commissions_.end()) {
    CommissionReportEvent report = std::move(pending->second);
    pending_commissions_.erase(pending);
    onCommissionReport(report);
  }

  moveOpenTimeBack(key.symbol, key.currency, event.time_ms);
  widenHistory(key.symbol, key.currency, event.time_ms, realized);
}

// -----------------------------------------------------------------------------
// onCommissionReport()
// -----------------------------------------------------------------------------
void EventReconciler::onCommissionReport(const CommissionReportEvent& event) {
  if (!account_id_ || event.exec_id.empty()) {
    return;
  }
  if (event.commission.has_value() && !std::isfinite(*event.commission)) {
    std::cerr << "[EventReconciler] Non-finite commission for "
              << event.exec_id << ", treated as 0\n";
  }
  if (event.realized_pnl.has_value() && !std::isfinite(*event.realized_pnl)) {
    std::cerr << "[EventReconciler] Non-finite realized for " << event.exec_id
              << ", treated as 0\n";
  }
  const double commission = finiteOrNone(event.commission).value_or(0.0);
  const double realized = finiteOrNone(event.realized_pnl).value_or(0.0);

  const auto trade = store_.findTradeByExecId(event.exec_id);
  if (!trade.has_value()) {
    pending_commissions_[event.exec_id] = event;
    return;
  }
  applyCommission(*trade, event.exec_id, commission, realized);
}

void EventReconciler::applyCommission(const domain::TradeRecord& trade,
                                      const std::string& exec_id,
                                      double commission, double realized) {
  if (trade.exec_id == exec_id + "-close") {
    // Flip: split the commission across the close and open legs.
    const auto open_leg = store_.findTradeByExecId(exec_id + "-open");
    double close_share = commission;
    if (open_leg.has_value()) {
      const double total_qty = trade.quantity + open_leg->quantity;
      close_share = total_qty > 0.0 ? commission * trade.quantity / total_qty
                                    : commission;
      store_.updateTradeCommission(open_leg->id, commission - close_share, 0.0);
    }
    store_.updateTradeCommission(trade.id, close_share, realized);
  } else {
    store_.updateTradeCommission(trade.id, commission, realized);
  }

  cache_.recordExecRealized(exec_id, trade.key, realized, trade.realized_pnl);
  if (auto position_realized = cache_.positionRealized(trade.key)) {
    store_.updatePositionRealized(*account_id_, trade.key, *position_realized);
  }
  widenHistory(trade.key.symbol, trade.key.currency, trade.trade_time_ms,
               realized);
}

// -----------------------------------------------------------------------------
// onPositionSnapshot() / reconcilePositions()
// -----------------------------------------------------------------------------
void EventReconciler::onPositionSnapshot(const PositionSnapshotEvent& event) {
  if (!account_id_ || isForeignAccount(event.account)) {
    return;
  }
  if (!std::isfinite(event.quantity) || !std::isfinite(event.avg_cost)) {
    std::cerr << "[EventReconciler] Non-finite position for " << event.symbol
              << ", dropped\n";
    return;
  }

  const domain::PositionKey key = snapshotKey(event);
  const auto existing = store_.findOpenPosition(*account_id_, key);

  if (event.quantity == 0.0) {
    if (existing.has_value()) {
      archiveOpenPosition(*existing);
    }
    return;
  }

  std::int64_t open_time_ms = 0;
  if (existing.has_value() && existing->open_time_ms != 0) {
    open_time_ms = existing->open_time_ms;
  } else {
    std::optional<std::int64_t> last_close;
    if (auto latest = store_.latestHistory(*account_id_, key.symbol, key.currency)) {
      last_close = latest->close_time_ms;
    }
    open_time_ms = store_.firstTradeTime(*account_id_, key.symbol, key.currency,
                                         last_close)
                       .value_or(clock_.now_ms());
  }

  domain::OpenPosition row;
  row.key = key;
  row.quantity = event.quantity;
  row.avg_cost = event.avg_cost;
  row.total_cost = event.quantity * event.avg_cost;
  row.open_time_ms = open_time_ms;
  row.con_id = event.con_id;
  const domain::PositionId id = store_.upsertPosition(*account_id_, row);

  PositionUpdate update;
  update.id = id;
  update.quantity = row.quantity;
  update.avg_cost = row.avg_cost;
  update.total_cost = row.total_cost;
  update.open_time_ms = open_time_ms;
  update.con_id = event.con_id;
  update.realized_pnl = existing.has_value() ? existing->realized_pnl : 0.0;
  cache_.upsertPosition(key, update);

  subscribeValuation(event.con_id);
}

void EventReconciler::reconcilePositions(
    const std::vector<PositionSnapshotEvent>& reported) {
  if (!account_id_) {
    return;
  }
  std::set<domain::PositionKey> seen;
  for (const auto& p : reported) {
    if (!isForeignAccount(p.account)) {
      seen.insert(snapshotKey(p));
    }
  }
  for (const auto& row : store_.listOpenPositions(*account_id_)) {
    if (seen.count(row.key) == 0) {
      std::cout << "[EventReconciler] " << row.key.toString()
                << " no longer reported by venue, archiving\n";
      archiveOpenPosition(row);
    }
  }
}

// -----------------------------------------------------------------------------
// onPositionPnL(): dedup, cache, queue a batched store write
// -----------------------------------------------------------------------------
void EventReconciler::onPositionPnL(const PositionPnLEvent& event) {
  if (!account_id_ || event.con_id == 0) {
    return;
  }
  const auto unrealized = finiteOrNone(event.unrealized_pnl);
  if (!unrealized.has_value()) {
    return;
  }
  const auto daily = finiteOrNone(event.daily_pnl);

  auto last = last_valuation_.find(event.con_id);
  if (last != last_valuation_.end() && last->second.daily == daily &&
      last->second.unrealized == *unrealized) {
    return;
  }
  last_valuation_[event.con_id] = LastValuation{daily, *unrealized};
  pending_valuations_[event.con_id] =
      PositionValuationRow{event.con_id, *unrealized, daily};
  cache_.updatePositionValuationByContract(event.con_id, *unrealized, daily);
}

// -----------------------------------------------------------------------------
// onAccountPnL(): daily bucket for today's New York trading date
// -----------------------------------------------------------------------------
void EventReconciler::onAccountPnL(const AccountPnLEvent& event) {
  if (!account_id_ || isForeignAccount(event.account)) {
    return;
  }
  if (!finiteOrNone(event.realized_pnl) || !finiteOrNone(event.unrealized_pnl)) {
    std::cerr << "[EventReconciler] Account PnL without finite realized / "
                 "unrealized, dropped\n";
    return;
  }
  const double daily = finiteOrNone(event.daily_pnl).value_or(0.0);
  cache_.updateDailyPnL(trade_date_new_york(clock_.now_ms()), daily);
}

// -----------------------------------------------------------------------------
// onAccountValuation(): one summary field
// -----------------------------------------------------------------------------
void EventReconciler::onAccountValuation(const AccountValuationEvent& event) {
  if (!account_id_ || isForeignAccount(event.account)) {
    return;
  }
  if (!event.currency.empty() && event.currency != "BASE" &&
      event.currency != base_currency_) {
    return;
  }
  const auto field = domain::accountFieldFromVenueTag(event.tag);
  if (!field.has_value()) {
    return;
  }
  const auto value = parseFinite(event.value);
  if (!value.has_value()) {
    std::cerr << "[EventReconciler] Unparseable " << event.tag << " value '"
              << event.value << "', dropped\n";
    return;
  }
  cache_.updateAccountSummaryField(*field, *value);
}

// -----------------------------------------------------------------------------
// flush(): write-back
// -----------------------------------------------------------------------------
void EventReconciler::flush() {
  if (!account_id_) {
    return;
  }

  if (!pending_valuations_.empty()) {
    std::vector<PositionValuationRow> rows;
    rows.reserve(pending_valuations_.size());
    for (const auto& [con_id, row] : pending_valuations_) {
      rows.push_back(row);
    }
    store_.updatePositionValuations(*account_id_, rows);
    pending_valuations_.clear();
  }

  const FlushPayload payload = cache_.collectDirty();
  if (payload.empty()) {
    return;
  }
  if (!payload.summary_fields.empty()) {
    std::vector<AccountFieldValue> fields;
    fields.reserve(payload.summary_fields.size());
    for (const auto& f : payload.summary_fields) {
      fields.emplace_back(f.field, f.value);
    }
    store_.upsertAccountSummary(*account_id_, fields, clock_.now_ms());
  }
  std::optional<std::uint64_t> daily_stamp;
  if (payload.daily.has_value()) {
    store_.upsertDailyPnL(*account_id_, *payload.daily);
    daily_stamp = payload.daily_stamp;
  }
  cache_.clearDirty(payload.summary_fields, daily_stamp);
}

void EventReconciler::clearSubscriptions() {
  pnl_request_by_contract_.clear();
  last_valuation_.clear();
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
bool EventReconciler::isForeignAccount(const std::string& account) const {
  return !account.empty() && !venue_account_.empty() &&
         account != venue_account_;
}

std::string EventReconciler::resolveExchange(const std::string& symbol,
                                             const std::string& currency,
                                             const std::string& reported) const {
  const auto rows =
      store_.findOpenPositionsBySymbol(*account_id_, symbol, currency);
  if (rows.empty()) {
    return reported;
  }
  for (const auto& row : rows) {
    if (row.key.exchange == reported) {
      return reported;
    }
  }
  for (const auto& row : rows) {
    if (!row.key.exchange.empty() && !isNonPrimaryExchange(row.key.exchange)) {
      return row.key.exchange;
    }
  }
  return rows.front().key.exchange;
}

domain::PositionKey EventReconciler::snapshotKey(
    const PositionSnapshotEvent& event) const {
  domain::PositionKey key{event.symbol, event.exchange, event.currency};
  const auto rows =
      store_.findOpenPositionsBySymbol(*account_id_, event.symbol, event.currency);
  for (const auto& row : rows) {
    if (row.key == key) {
      return key;
    }
  }
  // A live fill may have opened the row under the fill's exchange label.
  for (const auto& row : rows) {
    if (!row.con_id.has_value() || !event.con_id.has_value() ||
        *row.con_id == *event.con_id) {
      return row.key;
    }
  }
  return key;
}

void EventReconciler::moveOpenTimeBack(const std::string& symbol,
                                       const std::string& currency,
                                       std::int64_t trade_time_ms) {
  for (const auto& row :
       store_.findOpenPositionsBySymbol(*account_id_, symbol, currency)) {
    if (row.open_time_ms != 0 && trade_time_ms < row.open_time_ms) {
      store_.updatePositionOpenTime(*account_id_, row.key, trade_time_ms);
      cache_.updateOpenTime(row.key, trade_time_ms);
    }
  }
}

void EventReconciler::widenHistory(const std::string& symbol,
                                   const std::string& currency,
                                   std::int64_t trade_time_ms,
                                   double realized) {
  if (realized == 0.0) {
    return;
  }
  if (!store_.findOpenPositionsBySymbol(*account_id_, symbol, currency).empty()) {
    return;
  }
  const auto latest = store_.latestHistory(*account_id_, symbol, currency);
  if (!latest.has_value()) {
    return;
  }
  const std::int64_t close_ms = std::max(trade_time_ms, latest->close_time_ms);
  const double total = store_.sumRealized(*account_id_, symbol, currency,
                                          latest->open_time_ms, close_ms);
  store_.updateHistory(*account_id_, latest->id, close_ms, total);
  cache_.updateHistoryRealized(latest->id, close_ms, total);
}

void EventReconciler::archiveOpenPosition(const domain::OpenPosition& row) {
  std::int64_t close_ms =
      store_.lastTradeTime(*account_id_, row.key.symbol, row.key.currency)
          .value_or(clock_.now_ms());
  close_ms = std::max(close_ms, row.open_time_ms);

  domain::HistoryEntry entry;
  entry.id = row.id;
  entry.key = row.key;
  entry.open_time_ms = row.open_time_ms;
  entry.close_time_ms = close_ms;
  entry.realized_pnl = store_.sumRealized(*account_id_, row.key.symbol,
                                          row.key.currency, row.open_time_ms,
                                          close_ms);

  if (!store_.archivePosition(*account_id_, entry)) {
    std::cerr << "[EventReconciler] Archive of " << row.key.toString()
              << " found no open row\n";
    return;
  }
  cache_.addHistory(entry);
  const auto removed = cache_.removePosition(row.key);
  unsubscribeValuation(removed.has_value() ? removed->con_id : row.con_id);
  std::cout << "[EventReconciler] Archived " << row.key.toString()
            << " id=" << row.id << " realized=" << entry.realized_pnl << "\n";
}

void EventReconciler::subscribeValuation(std::optional<std::int64_t> con_id) {
  if (!con_id.has_value() || *con_id == 0 ||
      pnl_request_by_contract_.count(*con_id) != 0) {
    return;
  }
  const std::int64_t request_id =
      venue_.subscribePositionPnL(venue_account_, *con_id);
  pnl_request_by_contract_[*con_id] = request_id;
}

void EventReconciler::unsubscribeValuation(std::optional<std::int64_t> con_id) {
  if (!con_id.has_value()) {
    return;
  }
  last_valuation_.erase(*con_id);
  auto it = pnl_request_by_contract_.find(*con_id);
  if (it == pnl_request_by_contract_.end()) {
    return;
  }
  const std::int64_t request_id = it->second;
  pnl_request_by_contract_.erase(it);
  if (venue_.isConnected()) {
    venue_.cancelPositionPnL(request_id);
  }
}

}  // namespace pnlsync
