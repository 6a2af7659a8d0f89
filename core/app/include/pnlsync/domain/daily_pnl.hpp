#pragma once

#include <string>

namespace pnlsync {
namespace domain {

// -----------------------------------------------------------------------------
// DailyPnLPoint
// -----------------------------------------------------------------------------
// One trading date of the account-wide daily PnL series.
//
// trade_date is "YYYY-MM-DD" in the trading-calendar timezone
// (America/New_York), so lexicographic order is chronological order.
// cumulative_pnl is the running sum of daily_pnl over the date-ordered
// series and is recomputed in full whenever any point changes.
// -----------------------------------------------------------------------------
struct DailyPnLPoint {
  std::string trade_date;
  double daily_pnl{0.0};
  double cumulative_pnl{0.0};
};

}  // namespace domain
}  // namespace pnlsync
