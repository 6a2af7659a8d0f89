#pragma once

#include "pnlsync/domain/account_summary.hpp"
#include "pnlsync/domain/daily_pnl.hpp"
#include "pnlsync/domain/position.hpp"
#include "pnlsync/domain/position_key.hpp"
#include "pnlsync/time/i_time_provider.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pnlsync {

// -----------------------------------------------------------------------------
// PositionUpdate: identity / quantity / cost fields of an upsert
// -----------------------------------------------------------------------------
// Only the fields an upsert is allowed to overwrite. Live valuation fields
// and accumulated realized PnL are deliberately absent: an upsert never
// zeroes what it does not carry.
//
//   id            Keeps the existing id when std::nullopt.
//   total_cost    Defaults to quantity * avg_cost.
//   open_time_ms  Used only if the position has no open time yet.
//   con_id        Replaces the contract mapping when present.
//   realized_pnl  Seed value for a NEWLY created entry only.
// -----------------------------------------------------------------------------
struct PositionUpdate {
  std::optional<domain::PositionId> id;
  double quantity{0.0};
  double avg_cost{0.0};
  std::optional<double> total_cost;
  std::optional<std::int64_t> open_time_ms;
  std::optional<std::int64_t> con_id;
  std::optional<double> realized_pnl;
};

// -----------------------------------------------------------------------------
// CacheSnapshot: bulk state loaded from the ledger store at startup
// -----------------------------------------------------------------------------
struct CacheSnapshot {
  std::int64_t account_id{0};
  std::string base_currency;
  std::vector<domain::OpenPosition> positions;
  std::vector<domain::HistoryEntry> history;
  domain::AccountSummary summary;
  std::vector<domain::DailyPnLPoint> daily;   // cumulative is recomputed
  double realized_total{0.0};                 // sum over the trade log
};

// -----------------------------------------------------------------------------
// Read-side snapshot types
// -----------------------------------------------------------------------------
struct AccountPnLSnapshot {
  std::optional<std::int64_t> account_id;
  std::string base_currency;
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double daily_pnl{0.0};
  double total_pnl{0.0};
  std::int64_t as_of_ms{0};
};

struct AccountSummarySnapshot {
  std::optional<std::int64_t> account_id;
  std::string base_currency;
  domain::AccountSummary summary;   // unset fields stay std::nullopt
};

// -----------------------------------------------------------------------------
// Write-back payload
// -----------------------------------------------------------------------------
// stamp identifies the mutation that made a field dirty. clearDirty() clears
// a field only if its current stamp still equals the flushed stamp, so a
// field that changed again after collectDirty() stays dirty.
// -----------------------------------------------------------------------------
struct DirtyField {
  domain::AccountField field{domain::AccountField::NetLiquidation};
  double value{0.0};
  std::uint64_t stamp{0};
};

struct FlushPayload {
  std::optional<std::int64_t> account_id;
  std::vector<DirtyField> summary_fields;
  std::optional<domain::DailyPnLPoint> daily;
  std::uint64_t daily_stamp{0};

  bool empty() const { return summary_fields.empty() && !daily.has_value(); }
};

// -----------------------------------------------------------------------------
// PositionCache: in-process read model over the ledger
// -----------------------------------------------------------------------------
//
// @brief  Thread-safe mirror of open positions, closed-position history,
//         account valuation fields, the daily PnL series and per-execution
//         realized bookkeeping. Source of truth for every external read.
//
// @details
// Reads never touch the ledger store once hydrate() has run. The sync
// worker is the only writer; any number of reader threads (IPC, tests) take
// snapshots concurrently.
//
// Locking: one std::shared_mutex. Every public method is one critical
// section; mutations take a unique_lock, reads a shared_lock. No method
// performs I/O or calls out while holding the lock.
//
// Write-back: account summary fields and the staged daily PnL point are the
// only state that reaches the store through dirty tracking. Positions,
// history and trades are written by the caller synchronously.
//
// Idempotent realized PnL: recordExecRealized() remembers the last realized
// value reported per execution id and applies only the delta, so a
// redelivered or corrected commission report is never double counted.
//
// Thread model:
//   All methods are safe to call from any thread.
//
// Ownership:
//   Owned by SyncEngine (or a test fixture) by value. Holds a const
//   reference to the ITimeProvider used for freshness stamps.
// -----------------------------------------------------------------------------
class PositionCache {
 public:
  explicit PositionCache(const ITimeProvider& clock);

  PositionCache(const PositionCache&) = delete;
  PositionCache& operator=(const PositionCache&) = delete;
  PositionCache(PositionCache&&) = delete;
  PositionCache& operator=(PositionCache&&) = delete;

  // -------------------------------------------------------------------------
  // setAccount(id, base_currency)
  // -------------------------------------------------------------------------
  // @brief  First-writer-wins account identity.
  //
  // @return true if this call set the identity, false if it was already set
  //         (the arguments are then ignored).
  // -------------------------------------------------------------------------
  bool setAccount(std::int64_t account_id, const std::string& base_currency);

  std::optional<std::int64_t> accountId() const;
  std::string baseCurrency() const;

  // -------------------------------------------------------------------------
  // hydrate(snapshot)
  // -------------------------------------------------------------------------
  // @brief  Replaces every in-memory structure with the snapshot in one
  //         critical section and marks the cache ready.
  //
  // @details
  // Dirty state, the staged daily payload and the execution realized map
  // are reset. The current trading date becomes the latest date in the
  // loaded series.
  //
  // Side-effects: Overwrites the account identity with the snapshot's.
  // -------------------------------------------------------------------------
  void hydrate(const CacheSnapshot& snapshot);

  // True once hydrate() has run.
  bool isReady() const;

  // -------------------------------------------------------------------------
  // upsertPosition(key, update)
  // -------------------------------------------------------------------------
  // @brief  Creates or replaces the open position for key.
  //
  // @details
  // Existing realized, unrealized and daily PnL survive. A changed con_id
  // moves the contract mapping. total_pnl is recomputed.
  //
  // @return The position's id after the upsert.
  // -------------------------------------------------------------------------
  domain::PositionId upsertPosition(const domain::PositionKey& key,
                                    const PositionUpdate& update);

  // -------------------------------------------------------------------------
  // removePosition(key)
  // -------------------------------------------------------------------------
  // @brief  Drops the open entry and its contract mapping. History is not
  //         touched.
  //
  // @return The removed position, or std::nullopt if key was not open.
  // -------------------------------------------------------------------------
  std::optional<domain::OpenPosition> removePosition(
      const domain::PositionKey& key);

  // Inserts or replaces a history entry by id.
  void addHistory(const domain::HistoryEntry& entry);

  // Amends close time and realized of an existing entry. Returns false if
  // the id is unknown.
  bool updateHistoryRealized(domain::PositionId id, std::int64_t close_time_ms,
                             double realized_pnl);

  // Sets the open time of an open position. Returns false if not open.
  bool updateOpenTime(const domain::PositionKey& key, std::int64_t open_time_ms);

  // -------------------------------------------------------------------------
  // applyRealizedDelta(key, delta)
  // -------------------------------------------------------------------------
  // @brief  Adds delta to the open position's realized PnL.
  //
  // @return false (and no effect) if key is not open. Late corrections for
  //         archived positions never resurrect them.
  // -------------------------------------------------------------------------
  bool applyRealizedDelta(const domain::PositionKey& key, double delta);

  // -------------------------------------------------------------------------
  // recordExecRealized(exec_id, key, realized_value)
  // -------------------------------------------------------------------------
  // @brief  Idempotency boundary for per-execution realized PnL.
  //
  // @details
  //   delta = realized_value - last value recorded for exec_id
  //           (realized_value - unseen_baseline the first time exec_id is
  //           seen in this process)
  // The new value is remembered; delta is added to the account-wide
  // realized total and to the open position for key (if any). Reporting the
  // same value twice therefore changes nothing the second time.
  //
  // unseen_baseline is the realized value already counted by hydrate() for
  // a trade that was stored before this process started (0 for a new
  // trade). Without it a commission report replayed after a restart would
  // be counted twice.
  //
  // @return The delta that was applied.
  // -------------------------------------------------------------------------
  double recordExecRealized(const std::string& exec_id,
                            const domain::PositionKey& key,
                            double realized_value,
                            double unseen_baseline = 0.0);

  // -------------------------------------------------------------------------
  // updateDailyPnL(trade_date, value)
  // -------------------------------------------------------------------------
  // @brief  Upserts one date and recomputes the whole cumulative series in
  //         date order.
  //
  // @details
  // If the previously current trading date differs from trade_date, the
  // previous date's point (with its recomputed cumulative) is staged for
  // write-back and the daily flag is marked dirty: yesterday's figure is
  // final once a new date starts reporting. trade_date then becomes current.
  // -------------------------------------------------------------------------
  void updateDailyPnL(const std::string& trade_date, double value);

  // Sets one summary field, stamps as_of and marks the field dirty.
  void updateAccountSummaryField(domain::AccountField field, double value);

  // -------------------------------------------------------------------------
  // updatePositionValuationByContract(con_id, unrealized, daily)
  // -------------------------------------------------------------------------
  // @brief  Live valuation for the open position mapped to con_id.
  //
  // @details
  // daily is applied only when present; a missing daily keeps the previous
  // value. total_pnl is recomputed.
  //
  // @return false if no open position is mapped to con_id.
  // -------------------------------------------------------------------------
  bool updatePositionValuationByContract(std::int64_t con_id,
                                         double unrealized_pnl,
                                         std::optional<double> daily_pnl);

  // -------------------------------------------------------------------------
  // collectDirty() / clearDirty(fields, daily_stamp)
  // -------------------------------------------------------------------------
  // @brief  Write-back contract.
  //
  // @details
  // collectDirty() copies the dirty summary fields (value + stamp) and the
  // staged daily point without clearing anything. After persisting, the
  // caller passes back exactly what it persisted: the fields it wrote, and
  // the daily stamp if it wrote the daily point (std::nullopt otherwise).
  // Anything mutated after the collect carries a newer stamp and stays
  // dirty.
  // -------------------------------------------------------------------------
  FlushPayload collectDirty() const;
  void clearDirty(const std::vector<DirtyField>& fields,
                  std::optional<std::uint64_t> daily_stamp);

  // -------------------------------------------------------------------------
  // Snapshots: independent copies, safe to use after the call returns
  // -------------------------------------------------------------------------
  // Positions sorted by key (symbol first).
  std::vector<domain::OpenPosition> snapshotPositions() const;
  // History sorted by close time, newest first.
  std::vector<domain::HistoryEntry> snapshotHistory() const;
  AccountPnLSnapshot snapshotAccountPnL() const;
  AccountSummarySnapshot snapshotAccountSummary() const;
  // Sorted by date ascending.
  std::vector<domain::DailyPnLPoint> snapshotDailyPnL() const;

  // --- Point lookups ----------------------------------------------------------
  std::optional<domain::OpenPosition> findPosition(
      const domain::PositionKey& key) const;
  std::vector<domain::OpenPosition> findPositionsBySymbol(
      const std::string& symbol, const std::string& currency) const;
  std::optional<double> positionRealized(const domain::PositionKey& key) const;
  // Contract id the open position for key is valued under, if any.
  std::optional<std::int64_t> contractIdFor(const domain::PositionKey& key) const;
  std::optional<domain::HistoryEntry> findHistory(domain::PositionId id) const;
  double realizedTotal() const;

  // Epoch ms of the last mutation (0 if never mutated).
  std::int64_t lastUpdateMs() const;

 private:
  struct ExecRealized {
    domain::PositionKey key;
    double last_value{0.0};
  };

  void touchLocked();
  void rebuildDailySeriesLocked();
  std::optional<domain::DailyPnLPoint> dailyPointLocked(
      const std::string& trade_date) const;

  const ITimeProvider& clock_;

  mutable std::shared_mutex mutex_;

  std::optional<std::int64_t> account_id_;
  std::string base_currency_;
  bool ready_{false};

  std::unordered_map<domain::PositionKey, domain::OpenPosition,
                     domain::PositionKeyHash>
      positions_;
  std::unordered_map<std::int64_t, domain::PositionKey> key_by_contract_;
  std::unordered_map<domain::PositionId, domain::HistoryEntry> history_;

  domain::AccountSummary summary_;
  // 0 = clean; otherwise the stamp of the mutation that dirtied the field.
  std::array<std::uint64_t, domain::kAccountFieldCount> dirty_stamps_{};

  std::map<std::string, double> daily_by_date_;
  std::vector<domain::DailyPnLPoint> daily_series_;
  std::optional<std::string> current_trade_date_;
  std::optional<domain::DailyPnLPoint> pending_daily_;
  std::uint64_t daily_stamp_{0};

  std::unordered_map<std::string, ExecRealized> exec_realized_;
  double realized_total_{0.0};

  std::uint64_t next_stamp_{1};
  std::int64_t last_update_ms_{0};
};

}  // namespace pnlsync
