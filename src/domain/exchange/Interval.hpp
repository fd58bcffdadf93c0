#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "domain/Types.h"

namespace domain {

// Interval literals the klines endpoint accepts, shortest first.
const std::vector<std::string>& supported_intervals();

bool is_supported_interval(std::string_view literal) noexcept;

// Throws std::invalid_argument listing the accepted literals.
Interval interval_from_string(const std::string& literal);
std::string to_string(Interval interval);

namespace detail {

constexpr TimestampMs interval_ms(std::string_view literal) {
  if (literal.size() < 2) {
    return 0;
  }
  TimestampMs count = 0;
  for (std::size_t i = 0; i + 1 < literal.size(); ++i) {
    const char ch = literal[i];
    if (ch < '0' || ch > '9') {
      return 0;
    }
    count = count * 10 + (ch - '0');
  }
  switch (literal.back()) {
    case 'm':
      return (count == 1 || count == 3 || count == 5 || count == 15 || count == 30) ? count * kMillisPerMinute : 0;
    case 'h':
      return (count == 1 || count == 2 || count == 4 || count == 6 || count == 8 || count == 12)
                 ? count * kMillisPerHour
                 : 0;
    case 'd':
      return count == 1 ? kMillisPerDay : 0;
    case 'w':
      return count == 1 ? 7 * kMillisPerDay : 0;
    default:
      return 0;
  }
}

}  // namespace detail

static_assert(detail::interval_ms("30m") == 1'800'000);
static_assert(detail::interval_ms("1w") == 604'800'000);
static_assert(detail::interval_ms("1M") == 0);
static_assert(detail::interval_ms("7m") == 0);

}  // namespace domain
