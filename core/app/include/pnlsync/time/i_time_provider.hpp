#pragma once

#include <cstdint>

namespace pnlsync {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Several decisions in the sync service depend on "now":
//   - the open time of a position first seen in a venue snapshot,
//   - the close time of a position archived without any recorded trade,
//   - which trading date an account-level daily PnL update belongs to,
//   - the freshness stamps on the cache and the account summary,
//   - the keepalive / flush cadence of the sync loop.
//
// If components read std::chrono::system_clock::now() directly, none of
// that is testable without sleeping across real day boundaries. Components
// receive `const ITimeProvider&` instead:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set explicitly by tests.
//
// Why int64_t milliseconds instead of std::chrono::time_point:
//   - The ledger store and the venue bridge carry integer epoch timestamps.
//   - Integers compare, serialize to JSON and sum without chrono
//     conversion boilerplate.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch
  //         (1970-01-01 00:00:00 UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace pnlsync
