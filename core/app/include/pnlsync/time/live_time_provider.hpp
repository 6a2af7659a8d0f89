#pragma once

#include "pnlsync/time/i_time_provider.hpp"

namespace pnlsync {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// Thread model:
//   Stateless; safe to call from any thread.
//
// Ownership:
//   Created in main() and passed by const reference to SyncEngine, which
//   hands it on to the cache, reconciler and order router.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace pnlsync
