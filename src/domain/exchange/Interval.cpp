#include "domain/exchange/Interval.hpp"

#include <algorithm>
#include <stdexcept>

namespace domain {

const std::vector<std::string>& supported_intervals() {
  static const std::vector<std::string> kIntervals{"1m", "3m", "5m", "15m", "30m", "1h", "2h",
                                                   "4h", "6h", "8h", "12h", "1d", "1w"};
  return kIntervals;
}

bool is_supported_interval(std::string_view literal) noexcept {
  return detail::interval_ms(literal) > 0;
}

Interval interval_from_string(const std::string& literal) {
  const auto ms = detail::interval_ms(literal);
  if (ms <= 0) {
    std::string accepted;
    for (const auto& value : supported_intervals()) {
      accepted.append(accepted.empty() ? "" : ", ").append(value);
    }
    throw std::invalid_argument("Unsupported interval '" + literal + "', expected one of: " + accepted);
  }
  return Interval{ms};
}

std::string to_string(Interval interval) {
  const auto& literals = supported_intervals();
  const auto it = std::find_if(literals.begin(), literals.end(), [&](const std::string& literal) {
    return detail::interval_ms(literal) == interval.ms;
  });
  if (it == literals.end()) {
    throw std::invalid_argument("Interval of " + std::to_string(interval.ms) + " ms has no literal");
  }
  return *it;
}

}  // namespace domain
