#pragma once

#include "pnlsync/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace pnlsync {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set
//         explicitly rather than read from the system clock.
//
// @details
// Tests use it to pin the clock to a known instant (for example one minute
// before midnight in New York) and then advance it across a trading-date
// boundary, without sleeping.
//
// Internal storage is a std::atomic<int64_t>: the test thread writes while
// the sync worker and reader threads call now_ms() concurrently.
//
// Thread model:
//   advance_time() and now_ms() are both atomic; no other synchronization
//   is needed.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at 0 unless an initial time is given.
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t initial_ms)
      : current_time_ms_(initial_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given epoch milliseconds.
  //
  // @details
  // Monotonicity is not enforced; tests occasionally step the clock
  // backward to simulate out-of-order replay.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Convenience: move the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace pnlsync
