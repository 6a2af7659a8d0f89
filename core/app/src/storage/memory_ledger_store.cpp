#include "pnlsync/storage/memory_ledger_store.hpp"

#include <algorithm>

namespace pnlsync {

namespace {

bool sameInstrument(const domain::PositionKey& key, const std::string& symbol,
                    const std::string& currency) {
  return key.symbol == symbol && key.currency == currency;
}

}  // namespace

// -----------------------------------------------------------------------------
// Accounts
// -----------------------------------------------------------------------------
std::int64_t MemoryLedgerStore::upsertAccount(const std::string& venue_account,
                                              const std::string& base_currency) {
  std::lock_guard lock(mutex_);
  for (auto& [id, row] : state_.accounts) {
    if (row.venue_account == venue_account) {
      row.base_currency = base_currency;
      onCommit(state_);
      return id;
    }
  }
  const std::int64_t id = state_.next_account_id++;
  state_.accounts[id] = AccountRow{id, venue_account, base_currency};
  onCommit(state_);
  return id;
}

// -----------------------------------------------------------------------------
// Trades
// -----------------------------------------------------------------------------
bool MemoryLedgerStore::insertTrade(const domain::TradeRecord& trade) {
  std::lock_guard lock(mutex_);
  if (!trade.exec_id.empty() &&
      trade_by_exec_id_.find(trade.exec_id) != trade_by_exec_id_.end()) {
    return false;
  }
  domain::TradeRecord row = trade;
  row.id = state_.next_trade_id++;
  if (!row.exec_id.empty()) {
    trade_by_exec_id_[row.exec_id] = state_.trades.size();
  }
  state_.trades.push_back(std::move(row));
  onCommit(state_);
  return true;
}

std::optional<domain::TradeRecord> MemoryLedgerStore::findTradeByExecId(
    const std::string& exec_id) const {
  std::lock_guard lock(mutex_);
  if (exec_id.empty()) {
    return std::nullopt;
  }
  auto it = trade_by_exec_id_.find(exec_id);
  if (it == trade_by_exec_id_.end()) {
    it = trade_by_exec_id_.find(exec_id + "-close");
  }
  if (it == trade_by_exec_id_.end()) {
    return std::nullopt;
  }
  return state_.trades[it->second];
}

bool MemoryLedgerStore::updateTradeCommission(std::int64_t trade_id,
                                              double commission,
                                              double realized_pnl) {
  std::lock_guard lock(mutex_);
  for (auto& trade : state_.trades) {
    if (trade.id == trade_id) {
      trade.commission = commission;
      trade.realized_pnl = realized_pnl;
      onCommit(state_);
      return true;
    }
  }
  return false;
}

double MemoryLedgerStore::sumRealized(std::int64_t account_id,
                                      const std::string& symbol,
                                      const std::string& currency,
                                      std::optional<std::int64_t> from_ms,
                                      std::optional<std::int64_t> to_ms) const {
  std::lock_guard lock(mutex_);
  double total = 0.0;
  for (const auto& trade : state_.trades) {
    if (trade.account_id != account_id ||
        !sameInstrument(trade.key, symbol, currency)) {
      continue;
    }
    if (from_ms && trade.trade_time_ms < *from_ms) continue;
    if (to_ms && trade.trade_time_ms > *to_ms) continue;
    total += trade.realized_pnl;
  }
  return total;
}

std::optional<std::int64_t> MemoryLedgerStore::firstTradeTime(
    std::int64_t account_id, const std::string& symbol,
    const std::string& currency, std::optional<std::int64_t> after_ms) const {
  std::lock_guard lock(mutex_);
  std::optional<std::int64_t> first;
  for (const auto& trade : state_.trades) {
    if (trade.account_id != account_id ||
        !sameInstrument(trade.key, symbol, currency)) {
      continue;
    }
    if (after_ms && trade.trade_time_ms <= *after_ms) continue;
    if (!first || trade.trade_time_ms < *first) {
      first = trade.trade_time_ms;
    }
  }
  return first;
}

std::optional<std::int64_t> MemoryLedgerStore::lastTradeTime(
    std::int64_t account_id, const std::string& symbol,
    const std::string& currency) const {
  std::lock_guard lock(mutex_);
  std::optional<std::int64_t> last;
  for (const auto& trade : state_.trades) {
    if (trade.account_id != account_id ||
        !sameInstrument(trade.key, symbol, currency)) {
      continue;
    }
    if (!last || trade.trade_time_ms > *last) {
      last = trade.trade_time_ms;
    }
  }
  return last;
}

std::vector<domain::TradeRecord> MemoryLedgerStore::listTrades(
    std::int64_t account_id, const std::optional<std::string>& symbol,
    const std::optional<std::string>& currency,
    std::optional<std::int64_t> from_ms,
    std::optional<std::int64_t> to_ms) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::TradeRecord> rows;
  for (const auto& trade : state_.trades) {
    if (trade.account_id != account_id) continue;
    if (symbol && trade.key.symbol != *symbol) continue;
    if (currency && trade.key.currency != *currency) continue;
    if (from_ms && trade.trade_time_ms < *from_ms) continue;
    if (to_ms && trade.trade_time_ms > *to_ms) continue;
    rows.push_back(trade);
  }
  std::stable_sort(rows.begin(), rows.end(),
                   [](const domain::TradeRecord& a, const domain::TradeRecord& b) {
                     if (a.trade_time_ms != b.trade_time_ms) {
                       return a.trade_time_ms < b.trade_time_ms;
                     }
                     return a.id < b.id;
                   });
  return rows;
}

// -----------------------------------------------------------------------------
// Open positions
// -----------------------------------------------------------------------------
std::optional<domain::OpenPosition> MemoryLedgerStore::findOpenPosition(
    std::int64_t account_id, const domain::PositionKey& key) const {
  std::lock_guard lock(mutex_);
  const PositionRow* row = findPositionRowLocked(account_id, key);
  if (row == nullptr) {
    return std::nullopt;
  }
  return row->position;
}

std::vector<domain::OpenPosition> MemoryLedgerStore::findOpenPositionsBySymbol(
    std::int64_t account_id, const std::string& symbol,
    const std::string& currency) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::OpenPosition> result;
  for (const auto& [id, row] : state_.positions) {
    if (row.account_id == account_id &&
        sameInstrument(row.position.key, symbol, currency)) {
      result.push_back(row.position);
    }
  }
  return result;
}

std::vector<domain::OpenPosition> MemoryLedgerStore::listOpenPositions(
    std::int64_t account_id) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::OpenPosition> result;
  for (const auto& [id, row] : state_.positions) {
    if (row.account_id == account_id) {
      result.push_back(row.position);
    }
  }
  return result;
}

domain::PositionId MemoryLedgerStore::upsertPosition(
    std::int64_t account_id, const domain::OpenPosition& position) {
  std::lock_guard lock(mutex_);
  if (PositionRow* row = findPositionRowLocked(account_id, position.key)) {
    domain::OpenPosition& stored = row->position;
    stored.quantity = position.quantity;
    stored.avg_cost = position.avg_cost;
    stored.total_cost = position.total_cost;
    if (position.con_id.has_value()) {
      stored.con_id = position.con_id;
    }
    if (stored.open_time_ms == 0) {
      stored.open_time_ms = position.open_time_ms;
    }
    onCommit(state_);
    return stored.id;
  }

  PositionRow row{account_id, position};
  row.position.id = state_.next_position_id++;
  row.position.recomputeTotal();
  const domain::PositionId id = row.position.id;
  state_.positions.emplace(id, std::move(row));
  onCommit(state_);
  return id;
}

bool MemoryLedgerStore::updatePositionRealized(std::int64_t account_id,
                                               const domain::PositionKey& key,
                                               double realized_pnl) {
  std::lock_guard lock(mutex_);
  PositionRow* row = findPositionRowLocked(account_id, key);
  if (row == nullptr) {
    return false;
  }
  row->position.realized_pnl = realized_pnl;
  row->position.recomputeTotal();
  onCommit(state_);
  return true;
}

bool MemoryLedgerStore::updatePositionOpenTime(std::int64_t account_id,
                                               const domain::PositionKey& key,
                                               std::int64_t open_time_ms) {
  std::lock_guard lock(mutex_);
  PositionRow* row = findPositionRowLocked(account_id, key);
  if (row == nullptr) {
    return false;
  }
  row->position.open_time_ms = open_time_ms;
  onCommit(state_);
  return true;
}

bool MemoryLedgerStore::archivePosition(std::int64_t account_id,
                                        const domain::HistoryEntry& entry) {
  std::lock_guard lock(mutex_);
  auto it = state_.positions.find(entry.id);
  if (it == state_.positions.end() || it->second.account_id != account_id) {
    return false;
  }
  state_.positions.erase(it);
  state_.history[entry.id] = HistoryRow{account_id, entry};
  onCommit(state_);
  return true;
}

// -----------------------------------------------------------------------------
// History
// -----------------------------------------------------------------------------
std::optional<domain::HistoryEntry> MemoryLedgerStore::latestHistory(
    std::int64_t account_id, const std::string& symbol,
    const std::string& currency) const {
  std::lock_guard lock(mutex_);
  const HistoryRow* latest = nullptr;
  for (const auto& [id, row] : state_.history) {
    if (row.account_id != account_id ||
        !sameInstrument(row.entry.key, symbol, currency)) {
      continue;
    }
    if (latest == nullptr ||
        row.entry.close_time_ms >= latest->entry.close_time_ms) {
      latest = &row;
    }
  }
  if (latest == nullptr) {
    return std::nullopt;
  }
  return latest->entry;
}

bool MemoryLedgerStore::updateHistory(std::int64_t account_id,
                                      domain::PositionId id,
                                      std::int64_t close_time_ms,
                                      double realized_pnl) {
  std::lock_guard lock(mutex_);
  auto it = state_.history.find(id);
  if (it == state_.history.end() || it->second.account_id != account_id) {
    return false;
  }
  it->second.entry.close_time_ms = close_time_ms;
  it->second.entry.realized_pnl = realized_pnl;
  onCommit(state_);
  return true;
}

// -----------------------------------------------------------------------------
// Valuation / account level
// -----------------------------------------------------------------------------
void MemoryLedgerStore::updatePositionValuations(
    std::int64_t account_id, const std::vector<PositionValuationRow>& rows) {
  if (rows.empty()) {
    return;
  }
  std::lock_guard lock(mutex_);
  for (const auto& update : rows) {
    for (auto& [id, row] : state_.positions) {
      if (row.account_id != account_id || row.position.con_id != update.con_id) {
        continue;
      }
      row.position.unrealized_pnl = update.unrealized_pnl;
      if (update.daily_pnl.has_value()) {
        row.position.daily_pnl = update.daily_pnl;
      }
      row.position.recomputeTotal();
    }
  }
  onCommit(state_);
}

void MemoryLedgerStore::upsertAccountSummary(
    std::int64_t account_id, const std::vector<AccountFieldValue>& fields,
    std::int64_t as_of_ms) {
  if (fields.empty()) {
    return;
  }
  std::lock_guard lock(mutex_);
  domain::AccountSummary& summary = state_.summaries[account_id];
  for (const auto& [field, value] : fields) {
    summary[field] = value;
  }
  summary.as_of_ms = as_of_ms;
  onCommit(state_);
}

void MemoryLedgerStore::upsertDailyPnL(std::int64_t account_id,
                                       const domain::DailyPnLPoint& point) {
  std::lock_guard lock(mutex_);
  state_.daily[account_id][point.trade_date] =
      domain::DailyPnLPoint{point.trade_date, point.daily_pnl, 0.0};
  rebuildCumulativeLocked(account_id);
  onCommit(state_);
}

// -----------------------------------------------------------------------------
// loadSnapshot()
// -----------------------------------------------------------------------------
CacheSnapshot MemoryLedgerStore::loadSnapshot(std::int64_t account_id) const {
  std::lock_guard lock(mutex_);
  auto account = state_.accounts.find(account_id);
  if (account == state_.accounts.end()) {
    throw StoreError("unknown account id " + std::to_string(account_id));
  }

  CacheSnapshot snapshot;
  snapshot.account_id = account_id;
  snapshot.base_currency = account->second.base_currency;

  for (const auto& [id, row] : state_.positions) {
    if (row.account_id == account_id) {
      snapshot.positions.push_back(row.position);
    }
  }
  for (const auto& [id, row] : state_.history) {
    if (row.account_id == account_id) {
      snapshot.history.push_back(row.entry);
    }
  }
  if (auto summary = state_.summaries.find(account_id);
      summary != state_.summaries.end()) {
    snapshot.summary = summary->second;
  }
  if (auto daily = state_.daily.find(account_id); daily != state_.daily.end()) {
    for (const auto& [date, point] : daily->second) {
      snapshot.daily.push_back(point);
    }
  }
  for (const auto& trade : state_.trades) {
    if (trade.account_id == account_id) {
      snapshot.realized_total += trade.realized_pnl;
    }
  }
  return snapshot;
}

std::size_t MemoryLedgerStore::tradeCount() const {
  std::lock_guard lock(mutex_);
  return state_.trades.size();
}

// -----------------------------------------------------------------------------
// Protected hooks
// -----------------------------------------------------------------------------
void MemoryLedgerStore::onCommit(const State& /*state*/) {}

void MemoryLedgerStore::replaceState(State state) {
  std::lock_guard lock(mutex_);
  state_ = std::move(state);
  trade_by_exec_id_.clear();
  for (std::size_t i = 0; i < state_.trades.size(); ++i) {
    if (!state_.trades[i].exec_id.empty()) {
      trade_by_exec_id_[state_.trades[i].exec_id] = i;
    }
  }
}

// -----------------------------------------------------------------------------
// Private helpers (caller holds mutex_)
// -----------------------------------------------------------------------------
MemoryLedgerStore::PositionRow* MemoryLedgerStore::findPositionRowLocked(
    std::int64_t account_id, const domain::PositionKey& key) {
  for (auto& [id, row] : state_.positions) {
    if (row.account_id == account_id && row.position.key == key) {
      return &row;
    }
  }
  return nullptr;
}

const MemoryLedgerStore::PositionRow* MemoryLedgerStore::findPositionRowLocked(
    std::int64_t account_id, const domain::PositionKey& key) const {
  for (const auto& [id, row] : state_.positions) {
    if (row.account_id == account_id && row.position.key == key) {
      return &row;
    }
  }
  return nullptr;
}

void MemoryLedgerStore::rebuildCumulativeLocked(std::int64_t account_id) {
  double cumulative = 0.0;
  for (auto& [date, point] : state_.daily[account_id]) {
    cumulative += point.daily_pnl;
    point.cumulative_pnl = cumulative;
  }
}

}  // namespace pnlsync
