#pragma once

#include "tradeledger/domain/order.hpp"

#include <chrono>
#include <cstdint>

namespace tradeledger {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// ITimeProvider speaks epoch milliseconds; domain records carry Timestamp
// (system_clock::time_point). These bridge the two.
//
// day_index() buckets a Timestamp into UTC trading days. PositionBook uses it
// to reset the per-day realized P&L that feeds the daily-loss check.
// utc_year() is the calendar year tax summaries filter on.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Days since the epoch (UTC), floor division so pre-epoch times stay
// monotonic.
inline std::int64_t day_index(Timestamp tp) {
  std::int64_t ms = timestamp_to_ms(tp);
  std::int64_t day = ms / kMillisPerDay;
  if (ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

// Proleptic Gregorian year of the UTC date containing tp (days-to-civil
// conversion over 400-year eras).
inline int utc_year(Timestamp tp) {
  const std::int64_t z = day_index(tp) + 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe =
      (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  const std::int64_t month = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t year = yoe + era * 400;
  return static_cast<int>(month <= 2 ? year + 1 : year);
}

}  // namespace tradeledger
