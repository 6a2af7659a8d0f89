#pragma once

#include <cstdint>
#include <string>

namespace pnlsync {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions over int64_t epoch milliseconds, the time
//         representation used throughout the service.
//
// @details
// The trading calendar is pinned to America/New_York regardless of the host
// timezone or any display timezone: an account-level daily PnL update is
// always bucketed under the New York date on which it arrived. The
// conversion is done arithmetically with the US daylight-saving rule in
// force since 2007 (DST from 02:00 local on the second Sunday of March to
// 02:00 local on the first Sunday of November), so it does not depend on a
// tz database being installed or on the process-wide TZ setting.
//
// Thread-safety: stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

// "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string format_iso8601_utc(std::int64_t epoch_ms);

// "YYYY-MM-DD" of the given instant in UTC.
std::string utc_date(std::int64_t epoch_ms);

// UTC offset of America/New_York at the given instant, in seconds
// (-14400 during daylight time, -18000 otherwise).
std::int64_t new_york_utc_offset_seconds(std::int64_t epoch_ms);

// "YYYY-MM-DD" trading date of the given instant in America/New_York.
std::string trade_date_new_york(std::int64_t epoch_ms);

// Epoch milliseconds of the given UTC civil date and time, without timegm().
std::int64_t epoch_ms_from_utc(int year, unsigned month, unsigned day,
                               unsigned hour = 0, unsigned minute = 0,
                               unsigned second = 0);

}  // namespace pnlsync
