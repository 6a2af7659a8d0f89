#pragma once

#include "pnlsync/storage/memory_ledger_store.hpp"

#include <string>

namespace pnlsync {

// -----------------------------------------------------------------------------
// FileLedgerStore: MemoryLedgerStore persisted as one JSON document
// -----------------------------------------------------------------------------
//
// @brief  Durable store for single-process deployments.
//
// @details
// The constructor loads path if it exists (a missing file is an empty
// ledger). After every committed mutation the full state is written to
// "<path>.tmp" and renamed over path, so a crash mid-write leaves the
// previous document intact.
//
// Errors:
//   StoreError on an unreadable / malformed document at construction, or
//   when the write or rename fails. The in-memory state has already been
//   mutated when a write fails.
// -----------------------------------------------------------------------------
class FileLedgerStore final : public MemoryLedgerStore {
 public:
  explicit FileLedgerStore(std::string path);

  const std::string& path() const { return path_; }

 protected:
  void onCommit(const State& state) override;

 private:
  void load();

  std::string path_;
};

}  // namespace pnlsync
