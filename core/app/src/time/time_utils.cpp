#include "pnlsync/time/time_utils.hpp"

#include <cstdio>

namespace pnlsync {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

// Days since 1970-01-01 for a proleptic Gregorian date (Hinnant's
// days_from_civil).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = floor_div(y, 400);
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

// Inverse of days_from_civil.
CivilDate civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = floor_div(z, 146097);
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0),
                   m, d};
}

// 0 = Sunday. 1970-01-01 was a Thursday.
unsigned weekday_from_days(std::int64_t z) {
  return static_cast<unsigned>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

// Day number of the n-th Sunday (n >= 1) of the given month.
std::int64_t nth_sunday(std::int64_t year, unsigned month, unsigned n) {
  const std::int64_t first = days_from_civil(year, month, 1);
  const unsigned wd = weekday_from_days(first);
  return first + (7 - wd) % 7 + 7 * (n - 1);
}

std::string format_date(const CivilDate& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                static_cast<long long>(date.year), date.month, date.day);
  return buf;
}

}  // namespace

// -----------------------------------------------------------------------------
// format_iso8601_utc
// -----------------------------------------------------------------------------
std::string format_iso8601_utc(std::int64_t epoch_ms) {
  const std::int64_t secs = floor_div(epoch_ms, 1000);
  const std::int64_t millis = epoch_ms - secs * 1000;
  const std::int64_t days = floor_div(secs, kSecondsPerDay);
  const std::int64_t sod = secs - days * kSecondsPerDay;
  const CivilDate date = civil_from_days(days);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                static_cast<long long>(date.year), date.month, date.day,
                static_cast<long long>(sod / 3600),
                static_cast<long long>((sod % 3600) / 60),
                static_cast<long long>(sod % 60),
                static_cast<long long>(millis));
  return buf;
}

// -----------------------------------------------------------------------------
// utc_date
// -----------------------------------------------------------------------------
std::string utc_date(std::int64_t epoch_ms) {
  const std::int64_t secs = floor_div(epoch_ms, 1000);
  return format_date(civil_from_days(floor_div(secs, kSecondsPerDay)));
}

// -----------------------------------------------------------------------------
// new_york_utc_offset_seconds
// -----------------------------------------------------------------------------
std::int64_t new_york_utc_offset_seconds(std::int64_t epoch_ms) {
  constexpr std::int64_t kEst = -5 * 3600;
  constexpr std::int64_t kEdt = -4 * 3600;

  const std::int64_t secs = floor_div(epoch_ms, 1000);

  // Year as seen on the standard-time wall clock. DST never spans a year
  // boundary, so this is the right year to evaluate the rule in.
  const std::int64_t year =
      civil_from_days(floor_div(secs + kEst, kSecondsPerDay)).year;

  // 02:00 EST on the second Sunday of March is 07:00 UTC.
  const std::int64_t dst_start =
      nth_sunday(year, 3, 2) * kSecondsPerDay + 7 * 3600;
  // 02:00 EDT on the first Sunday of November is 06:00 UTC.
  const std::int64_t dst_end =
      nth_sunday(year, 11, 1) * kSecondsPerDay + 6 * 3600;

  return (secs >= dst_start && secs < dst_end) ? kEdt : kEst;
}

// -----------------------------------------------------------------------------
// trade_date_new_york
// -----------------------------------------------------------------------------
std::string trade_date_new_york(std::int64_t epoch_ms) {
  const std::int64_t local_secs =
      floor_div(epoch_ms, 1000) + new_york_utc_offset_seconds(epoch_ms);
  return format_date(civil_from_days(floor_div(local_secs, kSecondsPerDay)));
}

// -----------------------------------------------------------------------------
// epoch_ms_from_utc
// -----------------------------------------------------------------------------
std::int64_t epoch_ms_from_utc(int year, unsigned month, unsigned day,
                               unsigned hour, unsigned minute,
                               unsigned second) {
  const std::int64_t days = days_from_civil(year, month, day);
  return (days * kSecondsPerDay + hour * 3600 + minute * 60 + second) * 1000;
}

}  // namespace pnlsync
