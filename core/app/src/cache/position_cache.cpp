#include "pnlsync/cache/position_cache.hpp"

#include <algorithm>
#include <mutex>

namespace pnlsync {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PositionCache::PositionCache(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// Account identity
// -----------------------------------------------------------------------------
bool PositionCache::setAccount(std::int64_t account_id,
                               const std::string& base_currency) {
  std::unique_lock lock(mutex_);
  if (account_id_.has_value()) {
    return false;
  }
  account_id_ = account_id;
  base_currency_ = base_currency;
  touchLocked();
  return true;
}

std::optional<std::int64_t> PositionCache::accountId() const {
  std::shared_lock lock(mutex_);
  return account_id_;
}

std::string PositionCache::baseCurrency() const {
  std::shared_lock lock(mutex_);
  return base_currency_;
}

// -----------------------------------------------------------------------------
// hydrate(): atomic replace from the ledger store
// -----------------------------------------------------------------------------
void PositionCache::hydrate(const CacheSnapshot& snapshot) {
  std::unique_lock lock(mutex_);

  account_id_ = snapshot.account_id;
  base_currency_ = snapshot.base_currency;

  positions_.clear();
  key_by_contract_.clear();
  for (const auto& loaded : snapshot.positions) {
    domain::OpenPosition pos = loaded;
    pos.recomputeTotal();
    if (pos.con_id.has_value()) {
      key_by_contract_[*pos.con_id] = pos.key;
    }
    positions_[pos.key] = std::move(pos);
  }

  history_.clear();
  for (const auto& entry : snapshot.history) {
    history_[entry.id] = entry;
  }

  summary_ = snapshot.summary;
  dirty_stamps_.fill(0);

  daily_by_date_.clear();
  for (const auto& point : snapshot.daily) {
    daily_by_date_[point.trade_date] = point.daily_pnl;
  }
  rebuildDailySeriesLocked();
  if (daily_by_date_.empty()) {
    current_trade_date_.reset();
  } else {
    current_trade_date_ = daily_by_date_.rbegin()->first;
  }
  pending_daily_.reset();
  daily_stamp_ = 0;

  exec_realized_.clear();
  realized_total_ = snapshot.realized_total;

  ready_ = true;
  touchLocked();
}

bool PositionCache::isReady() const {
  std::shared_lock lock(mutex_);
  return ready_;
}

// -----------------------------------------------------------------------------
// upsertPosition(): identity / quantity / cost only
// -----------------------------------------------------------------------------
domain::PositionId PositionCache::upsertPosition(const domain::PositionKey& key,
                                                 const PositionUpdate& update) {
  std::unique_lock lock(mutex_);

  auto it = positions_.find(key);
  const bool created = (it == positions_.end());
  if (created) {
    domain::OpenPosition fresh;
    fresh.key = key;
    fresh.realized_pnl = update.realized_pnl.value_or(0.0);
    it = positions_.emplace(key, std::move(fresh)).first;
  }

  domain::OpenPosition& pos = it->second;
  if (update.id.has_value()) {
    pos.id = *update.id;
  }
  pos.quantity = update.quantity;
  pos.avg_cost = update.avg_cost;
  pos.total_cost = update.total_cost.value_or(update.quantity * update.avg_cost);
  if (pos.open_time_ms == 0 && update.open_time_ms.has_value()) {
    pos.open_time_ms = *update.open_time_ms;
  }
  if (update.con_id.has_value() && pos.con_id != update.con_id) {
    if (pos.con_id.has_value()) {
      key_by_contract_.erase(*pos.con_id);
    }
    pos.con_id = update.con_id;
    key_by_contract_[*update.con_id] = key;
  }
  pos.recomputeTotal();

  touchLocked();
  return pos.id;
}

// -----------------------------------------------------------------------------
// removePosition()
// -----------------------------------------------------------------------------
std::optional<domain::OpenPosition> PositionCache::removePosition(
    const domain::PositionKey& key) {
  std::unique_lock lock(mutex_);
  auto it = positions_.find(key);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  domain::OpenPosition removed = std::move(it->second);
  positions_.erase(it);
  if (removed.con_id.has_value()) {
    auto mapped = key_by_contract_.find(*removed.con_id);
    if (mapped != key_by_contract_.end() && mapped->second == key) {
      key_by_contract_.erase(mapped);
    }
  }
  touchLocked();
  return removed;
}

// -----------------------------------------------------------------------------
// History
// -----------------------------------------------------------------------------
void PositionCache::addHistory(const domain::HistoryEntry& entry) {
  std::unique_lock lock(mutex_);
  history_[entry.id] = entry;
  touchLocked();
}

bool PositionCache::updateHistoryRealized(domain::PositionId id,
                                          std::int64_t close_time_ms,
                                          double realized_pnl) {
  std::unique_lock lock(mutex_);
  auto it = history_.find(id);
  if (it == history_.end()) {
    return false;
  }
  it->second.close_time_ms = close_time_ms;
  it->second.realized_pnl = realized_pnl;
  touchLocked();
  return true;
}

bool PositionCache::updateOpenTime(const domain::PositionKey& key,
                                   std::int64_t open_time_ms) {
  std::unique_lock lock(mutex_);
  auto it = positions_.find(key);
  if (it == positions_.end()) {
    return false;
  }
  it->second.open_time_ms = open_time_ms;
  touchLocked();
  return true;
}

// -----------------------------------------------------------------------------
// Realized PnL
// -----------------------------------------------------------------------------
bool PositionCache::applyRealizedDelta(const domain::PositionKey& key,
                                       double delta) {
  std::unique_lock lock(mutex_);
  auto it = positions_.find(key);
  if (it == positions_.end()) {
    return false;
  }
  it->second.realized_pnl += delta;
  it->second.recomputeTotal();
  touchLocked();
  return true;
}

double PositionCache::recordExecRealized(const std::string& exec_id,
                                         const domain::PositionKey& key,
                                         double realized_value,
                                         double unseen_baseline) {
  std::unique_lock lock(mutex_);

  double delta = realized_value - unseen_baseline;
  auto found = exec_realized_.find(exec_id);
  if (found != exec_realized_.end()) {
    delta = realized_value - found->second.last_value;
  }
  exec_realized_[exec_id] = ExecRealized{key, realized_value};

  if (delta != 0.0) {
    realized_total_ += delta;
    auto it = positions_.find(key);
    if (it != positions_.end()) {
      it->second.realized_pnl += delta;
      it->second.recomputeTotal();
    }
    touchLocked();
  }
  return delta;
}

// -----------------------------------------------------------------------------
// updateDailyPnL(): upsert, recompute, stage yesterday on date change
// -----------------------------------------------------------------------------
void PositionCache::updateDailyPnL(const std::string& trade_date,
                                   double value) {
  std::unique_lock lock(mutex_);

  const std::optional<std::string> previous = current_trade_date_;
  daily_by_date_[trade_date] = value;
  rebuildDailySeriesLocked();

  if (previous.has_value() && *previous != trade_date) {
    if (auto point = dailyPointLocked(*previous)) {
      pending_daily_ = *point;
      daily_stamp_ = next_stamp_++;
    }
  }
  current_trade_date_ = trade_date;
  touchLocked();
}

// -----------------------------------------------------------------------------
// updateAccountSummaryField()
// -----------------------------------------------------------------------------
void PositionCache::updateAccountSummaryField(domain::AccountField field,
                                              double value) {
  std::unique_lock lock(mutex_);
  summary_[field] = value;
  dirty_stamps_[static_cast<std::size_t>(field)] = next_stamp_++;
  touchLocked();
  summary_.as_of_ms = last_update_ms_;
}

// -----------------------------------------------------------------------------
// updatePositionValuationByContract()
// -----------------------------------------------------------------------------
bool PositionCache::updatePositionValuationByContract(
    std::int64_t con_id, double unrealized_pnl,
    std::optional<double> daily_pnl) {
  std::unique_lock lock(mutex_);
  auto mapped = key_by_contract_.find(con_id);
  if (mapped == key_by_contract_.end()) {
    return false;
  }
  auto it = positions_.find(mapped->second);
  if (it == positions_.end()) {
    return false;
  }
  domain::OpenPosition& pos = it->second;
  pos.unrealized_pnl = unrealized_pnl;
  if (daily_pnl.has_value()) {
    pos.daily_pnl = daily_pnl;
  }
  pos.recomputeTotal();
  touchLocked();
  return true;
}

// -----------------------------------------------------------------------------
// collectDirty() / clearDirty(): clear what was flushed, not everything
// -----------------------------------------------------------------------------
FlushPayload PositionCache::collectDirty() const {
  std::shared_lock lock(mutex_);
  FlushPayload payload;
  payload.account_id = account_id_;
  for (auto field : domain::kAllAccountFields) {
    const auto stamp = dirty_stamps_[static_cast<std::size_t>(field)];
    const auto& value = summary_[field];
    if (stamp != 0 && value.has_value()) {
      payload.summary_fields.push_back(DirtyField{field, *value, stamp});
    }
  }
  if (daily_stamp_ != 0 && pending_daily_.has_value()) {
    payload.daily = pending_daily_;
    payload.daily_stamp = daily_stamp_;
  }
  return payload;
}

void PositionCache::clearDirty(const std::vector<DirtyField>& fields,
                               std::optional<std::uint64_t> daily_stamp) {
  std::unique_lock lock(mutex_);
  for (const auto& flushed : fields) {
    auto& stamp = dirty_stamps_[static_cast<std::size_t>(flushed.field)];
    if (stamp == flushed.stamp) {
      stamp = 0;
    }
  }
  if (daily_stamp.has_value() && *daily_stamp == daily_stamp_) {
    daily_stamp_ = 0;
    pending_daily_.reset();
  }
}

// -----------------------------------------------------------------------------
// Snapshots
// -----------------------------------------------------------------------------
std::vector<domain::OpenPosition> PositionCache::snapshotPositions() const {
  std::vector<domain::OpenPosition> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(positions_.size());
    for (const auto& [key, pos] : positions_) {
      result.push_back(pos);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::OpenPosition& a, const domain::OpenPosition& b) {
              return a.key < b.key;
            });
  return result;
}

std::vector<domain::HistoryEntry> PositionCache::snapshotHistory() const {
  std::vector<domain::HistoryEntry> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(history_.size());
    for (const auto& [id, entry] : history_) {
      result.push_back(entry);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::HistoryEntry& a, const domain::HistoryEntry& b) {
              if (a.close_time_ms != b.close_time_ms) {
                return a.close_time_ms > b.close_time_ms;
              }
              return a.id > b.id;
            });
  return result;
}

AccountPnLSnapshot PositionCache::snapshotAccountPnL() const {
  std::shared_lock lock(mutex_);
  AccountPnLSnapshot snap;
  snap.account_id = account_id_;
  snap.base_currency = base_currency_;
  snap.realized_pnl = realized_total_;
  for (const auto& [key, pos] : positions_) {
    snap.unrealized_pnl += pos.unrealized_pnl;
  }
  if (!daily_by_date_.empty()) {
    snap.daily_pnl = daily_by_date_.rbegin()->second;
  }
  snap.total_pnl = snap.realized_pnl + snap.unrealized_pnl;
  snap.as_of_ms = last_update_ms_ != 0 ? last_update_ms_ : clock_.now_ms();
  return snap;
}

AccountSummarySnapshot PositionCache::snapshotAccountSummary() const {
  std::shared_lock lock(mutex_);
  AccountSummarySnapshot snap;
  snap.account_id = account_id_;
  snap.base_currency = base_currency_;
  snap.summary = summary_;
  if (snap.summary.as_of_ms == 0) {
    snap.summary.as_of_ms = clock_.now_ms();
  }
  return snap;
}

std::vector<domain::DailyPnLPoint> PositionCache::snapshotDailyPnL() const {
  std::shared_lock lock(mutex_);
  return daily_series_;
}

// -----------------------------------------------------------------------------
// Point lookups
// -----------------------------------------------------------------------------
std::optional<domain::OpenPosition> PositionCache::findPosition(
    const domain::PositionKey& key) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(key);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::OpenPosition> PositionCache::findPositionsBySymbol(
    const std::string& symbol, const std::string& currency) const {
  std::vector<domain::OpenPosition> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [key, pos] : positions_) {
      if (key.symbol == symbol && key.currency == currency) {
        result.push_back(pos);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::OpenPosition& a, const domain::OpenPosition& b) {
              return a.key < b.key;
            });
  return result;
}

std::optional<double> PositionCache::positionRealized(
    const domain::PositionKey& key) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(key);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second.realized_pnl;
}

std::optional<std::int64_t> PositionCache::contractIdFor(
    const domain::PositionKey& key) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(key);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second.con_id;
}

std::optional<domain::HistoryEntry> PositionCache::findHistory(
    domain::PositionId id) const {
  std::shared_lock lock(mutex_);
  auto it = history_.find(id);
  if (it == history_.end()) {
    return std::nullopt;
  }
  return it->second;
}

double PositionCache::realizedTotal() const {
  std::shared_lock lock(mutex_);
  return realized_total_;
}

std::int64_t PositionCache::lastUpdateMs() const {
  std::shared_lock lock(mutex_);
  return last_update_ms_;
}

// -----------------------------------------------------------------------------
// Private helpers (caller holds the unique lock)
// -----------------------------------------------------------------------------
void PositionCache::touchLocked() { last_update_ms_ = clock_.now_ms(); }

void PositionCache::rebuildDailySeriesLocked() {
  // std::map iterates in key order; "YYYY-MM-DD" sorts chronologically.
  daily_series_.clear();
  daily_series_.reserve(daily_by_date_.size());
  double cumulative = 0.0;
  for (const auto& [date, value] : daily_by_date_) {
    cumulative += value;
    daily_series_.push_back(domain::DailyPnLPoint{date, value, cumulative});
  }
}

std::optional<domain::DailyPnLPoint> PositionCache::dailyPointLocked(
    const std::string& trade_date) const {
  for (const auto& point : daily_series_) {
    if (point.trade_date == trade_date) {
      return point;
    }
  }
  return std::nullopt;
}

}  // namespace pnlsync
