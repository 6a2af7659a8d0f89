#pragma once

#include "pnlsync/storage/i_ledger_store.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pnlsync {

// -----------------------------------------------------------------------------
// MemoryLedgerStore: mutex-guarded in-process ledger store
// -----------------------------------------------------------------------------
//
// @brief  Complete ILedgerStore over plain containers. Used directly by the
//         tests and as the base of FileLedgerStore.
//
// @details
// Every public method takes mutex_ for its whole duration, so each call is
// one atomic unit of work. After a successful mutation onCommit() runs
// under the same lock with the new state; subclasses persist from there.
//
// Ordered containers keep iteration deterministic (positions and history by
// id, daily points by date), which the file format and the tests rely on.
// -----------------------------------------------------------------------------
class MemoryLedgerStore : public ILedgerStore {
 public:
  MemoryLedgerStore() = default;
  ~MemoryLedgerStore() override = default;

  MemoryLedgerStore(const MemoryLedgerStore&) = delete;
  MemoryLedgerStore& operator=(const MemoryLedgerStore&) = delete;

  std::int64_t upsertAccount(const std::string& venue_account,
                             const std::string& base_currency) override;

  bool insertTrade(const domain::TradeRecord& trade) override;
  std::optional<domain::TradeRecord> findTradeByExecId(
      const std::string& exec_id) const override;
  bool updateTradeCommission(std::int64_t trade_id, double commission,
                             double realized_pnl) override;
  double sumRealized(std::int64_t account_id, const std::string& symbol,
                     const std::string& currency,
                     std::optional<std::int64_t> from_ms,
                     std::optional<std::int64_t> to_ms) const override;
  std::optional<std::int64_t> firstTradeTime(
      std::int64_t account_id, const std::string& symbol,
      const std::string& currency,
      std::optional<std::int64_t> after_ms) const override;
  std::optional<std::int64_t> lastTradeTime(
      std::int64_t account_id, const std::string& symbol,
      const std::string& currency) const override;
  std::vector<domain::TradeRecord> listTrades(
      std::int64_t account_id, const std::optional<std::string>& symbol,
      const std::optional<std::string>& currency,
      std::optional<std::int64_t> from_ms,
      std::optional<std::int64_t> to_ms) const override;

  std::optional<domain::OpenPosition> findOpenPosition(
      std::int64_t account_id, const domain::PositionKey& key) const override;
  std::vector<domain::OpenPosition> findOpenPositionsBySymbol(
      std::int64_t account_id, const std::string& symbol,
      const std::string& currency) const override;
  std::vector<domain::OpenPosition> listOpenPositions(
      std::int64_t account_id) const override;
  domain::PositionId upsertPosition(std::int64_t account_id,
                                    const domain::OpenPosition& position) override;
  bool updatePositionRealized(std::int64_t account_id,
                              const domain::PositionKey& key,
                              double realized_pnl) override;
  bool updatePositionOpenTime(std::int64_t account_id,
                              const domain::PositionKey& key,
                              std::int64_t open_time_ms) override;
  bool archivePosition(std::int64_t account_id,
                       const domain::HistoryEntry& entry) override;

  std::optional<domain::HistoryEntry> latestHistory(
      std::int64_t account_id, const std::string& symbol,
      const std::string& currency) const override;
  bool updateHistory(std::int64_t account_id, domain::PositionId id,
                     std::int64_t close_time_ms, double realized_pnl) override;

  void updatePositionValuations(
      std::int64_t account_id,
      const std::vector<PositionValuationRow>& rows) override;
  void upsertAccountSummary(std::int64_t account_id,
                            const std::vector<AccountFieldValue>& fields,
                            std::int64_t as_of_ms) override;
  void upsertDailyPnL(std::int64_t account_id,
                      const domain::DailyPnLPoint& point) override;

  CacheSnapshot loadSnapshot(std::int64_t account_id) const override;

  // Number of stored trade rows (all accounts). Diagnostics and tests.
  std::size_t tradeCount() const;

 protected:
  struct AccountRow {
    std::int64_t id{0};
    std::string venue_account;
    std::string base_currency;
  };

  struct PositionRow {
    std::int64_t account_id{0};
    domain::OpenPosition position;
  };

  struct HistoryRow {
    std::int64_t account_id{0};
    domain::HistoryEntry entry;
  };

  // The whole persistent state. FileLedgerStore serializes exactly this.
  struct State {
    std::map<std::int64_t, AccountRow> accounts;
    std::vector<domain::TradeRecord> trades;
    std::map<domain::PositionId, PositionRow> positions;
    std::map<domain::PositionId, HistoryRow> history;
    std::map<std::int64_t, domain::AccountSummary> summaries;
    std::map<std::int64_t, std::map<std::string, domain::DailyPnLPoint>> daily;
    std::int64_t next_account_id{1};
    std::int64_t next_trade_id{1};
    domain::PositionId next_position_id{1};
  };

  // Called under the lock after every successful mutation.
  virtual void onCommit(const State& state);

  // Replaces the whole state (used when loading from disk). Rebuilds the
  // exec id index.
  void replaceState(State state);

 private:
  PositionRow* findPositionRowLocked(std::int64_t account_id,
                                     const domain::PositionKey& key);
  const PositionRow* findPositionRowLocked(
      std::int64_t account_id, const domain::PositionKey& key) const;
  void rebuildCumulativeLocked(std::int64_t account_id);

  mutable std::mutex mutex_;
  State state_;
  std::unordered_map<std::string, std::size_t> trade_by_exec_id_;
};

}  // namespace pnlsync
