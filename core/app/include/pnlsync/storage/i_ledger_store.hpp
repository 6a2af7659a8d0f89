#pragma once

#include "pnlsync/cache/position_cache.hpp"
#include "pnlsync/domain/account_summary.hpp"
#include "pnlsync/domain/daily_pnl.hpp"
#include "pnlsync/domain/position.hpp"
#include "pnlsync/domain/position_key.hpp"
#include "pnlsync/domain/trade_record.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pnlsync {

// -----------------------------------------------------------------------------
// StoreError
// -----------------------------------------------------------------------------
// Thrown by ledger store implementations when the backing medium fails
// (unreadable file, malformed document, write failure). Expected outcomes
// such as a duplicate execution id are reported through return values.
// -----------------------------------------------------------------------------
class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One row of a batched live-valuation write, keyed by venue contract id.
// daily_pnl == std::nullopt leaves the stored daily value untouched.
struct PositionValuationRow {
  std::int64_t con_id{0};
  double unrealized_pnl{0.0};
  std::optional<double> daily_pnl;
};

using AccountFieldValue = std::pair<domain::AccountField, double>;

// -----------------------------------------------------------------------------
// ILedgerStore: durable ledger collaborator
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface over the durable tables: accounts, trades,
//         open positions, position history, account summary and daily PnL.
//
// @details
// Every call is one committed unit of work. The sync worker is the only
// writer in the running service; implementations must still be safe for
// concurrent calls from test threads.
//
// Symbol-level queries (sumRealized, firstTradeTime, lastTradeTime,
// latestHistory) match on (symbol, currency) and ignore exchange: the same
// instrument may have been booked under more than one exchange label.
//
// Time windows are inclusive on both ends. firstTradeTime's lower bound is
// exclusive (the first trade strictly after a close).
//
// Position ids are drawn from one monotonically increasing sequence per
// store, so an archived history id is never reused by a later open.
// -----------------------------------------------------------------------------
class ILedgerStore {
 public:
  virtual ~ILedgerStore() = default;

  // --- Accounts ---------------------------------------------------------------
  // Creates the account on first sight, updates base currency otherwise.
  // Returns the numeric account id.
  virtual std::int64_t upsertAccount(const std::string& venue_account,
                                     const std::string& base_currency) = 0;

  // --- Trades -----------------------------------------------------------------
  // Returns false (and writes nothing) if trade.exec_id is already stored.
  // An empty exec_id never collides.
  virtual bool insertTrade(const domain::TradeRecord& trade) = 0;

  // Exact match first, then "<exec_id>-close" (the realized leg of a flip).
  virtual std::optional<domain::TradeRecord> findTradeByExecId(
      const std::string& exec_id) const = 0;

  virtual bool updateTradeCommission(std::int64_t trade_id, double commission,
                                     double realized_pnl) = 0;

  virtual double sumRealized(std::int64_t account_id, const std::string& symbol,
                             const std::string& currency,
                             std::optional<std::int64_t> from_ms,
                             std::optional<std::int64_t> to_ms) const = 0;

  virtual std::optional<std::int64_t> firstTradeTime(
      std::int64_t account_id, const std::string& symbol,
      const std::string& currency,
      std::optional<std::int64_t> after_ms) const = 0;

  virtual std::optional<std::int64_t> lastTradeTime(
      std::int64_t account_id, const std::string& symbol,
      const std::string& currency) const = 0;

  // -------------------------------------------------------------------------
  // listTrades(account_id, symbol, currency, from_ms, to_ms)
  // -------------------------------------------------------------------------
  // @brief  Trade log rows of the account, oldest first (ties by id).
  //
  // @details
  // symbol and currency filter only when set; exchange is never compared.
  // The [from_ms, to_ms] window is inclusive and each bound is optional.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::TradeRecord> listTrades(
      std::int64_t account_id, const std::optional<std::string>& symbol,
      const std::optional<std::string>& currency,
      std::optional<std::int64_t> from_ms,
      std::optional<std::int64_t> to_ms) const = 0;

  // --- Open positions ---------------------------------------------------------
  virtual std::optional<domain::OpenPosition> findOpenPosition(
      std::int64_t account_id, const domain::PositionKey& key) const = 0;

  // All open rows for (symbol, currency) regardless of exchange, ordered by
  // id (oldest first).
  virtual std::vector<domain::OpenPosition> findOpenPositionsBySymbol(
      std::int64_t account_id, const std::string& symbol,
      const std::string& currency) const = 0;

  virtual std::vector<domain::OpenPosition> listOpenPositions(
      std::int64_t account_id) const = 0;

  // -------------------------------------------------------------------------
  // upsertPosition(account_id, position)
  // -------------------------------------------------------------------------
  // @brief  Insert, or update on key conflict.
  //
  // @details
  // On conflict only quantity, avg_cost, total_cost and con_id (when set)
  // change; id, realized, valuation and a non-zero open time are kept.
  // On insert a new id is assigned (position.id is ignored) and every
  // field is taken from position.
  //
  // @return The stored row's id.
  // -------------------------------------------------------------------------
  virtual domain::PositionId upsertPosition(
      std::int64_t account_id, const domain::OpenPosition& position) = 0;

  virtual bool updatePositionRealized(std::int64_t account_id,
                                      const domain::PositionKey& key,
                                      double realized_pnl) = 0;

  virtual bool updatePositionOpenTime(std::int64_t account_id,
                                      const domain::PositionKey& key,
                                      std::int64_t open_time_ms) = 0;

  // -------------------------------------------------------------------------
  // archivePosition(account_id, entry)
  // -------------------------------------------------------------------------
  // @brief  Atomically inserts entry into history (keeping entry.id) and
  //         deletes the open row carrying that id.
  //
  // @return false if no open row with entry.id exists; nothing is written.
  // -------------------------------------------------------------------------
  virtual bool archivePosition(std::int64_t account_id,
                               const domain::HistoryEntry& entry) = 0;

  // --- History ----------------------------------------------------------------
  // Entry with the latest close time for (symbol, currency).
  virtual std::optional<domain::HistoryEntry> latestHistory(
      std::int64_t account_id, const std::string& symbol,
      const std::string& currency) const = 0;

  virtual bool updateHistory(std::int64_t account_id, domain::PositionId id,
                             std::int64_t close_time_ms,
                             double realized_pnl) = 0;

  // --- Valuation / account level ------------------------------------------------
  virtual void updatePositionValuations(
      std::int64_t account_id, const std::vector<PositionValuationRow>& rows) = 0;

  // Partial upsert: fields absent from the list keep their stored value.
  virtual void upsertAccountSummary(std::int64_t account_id,
                                    const std::vector<AccountFieldValue>& fields,
                                    std::int64_t as_of_ms) = 0;

  // Upserts one date. Stored cumulative values are recomputed across every
  // row of the account in date order.
  virtual void upsertDailyPnL(std::int64_t account_id,
                              const domain::DailyPnLPoint& point) = 0;

  // -------------------------------------------------------------------------
  // loadSnapshot(account_id)
  // -------------------------------------------------------------------------
  // @brief  Bulk read for PositionCache::hydrate().
  //
  // @details
  // realized_total is the sum of realized PnL over the account's whole
  // trade log. Throws StoreError if the account is unknown.
  // -------------------------------------------------------------------------
  virtual CacheSnapshot loadSnapshot(std::int64_t account_id) const = 0;
};

}  // namespace pnlsync
