#include "money.hpp"

#include <cmath>
#include <limits>

namespace keyshop::util {

std::optional<int64_t> ParseMinorUnits(std::string_view decimal) {
  if (decimal.empty()) return std::nullopt;

  bool negative = false;
  if (decimal.front() == '-') {
    negative = true;
    decimal.remove_prefix(1);
  }

  const auto dot          = decimal.find('.');
  std::string_view whole  = decimal.substr(0, dot);
  std::string_view frac   = dot == std::string_view::npos ? std::string_view{} : decimal.substr(dot + 1);

  if (whole.empty()) return std::nullopt;
  if (dot != std::string_view::npos && (frac.empty() || frac.size() > 2)) return std::nullopt;

  constexpr int64_t kMaxWhole = std::numeric_limits<int64_t>::max() / 100 - 1;

  int64_t units = 0;
  for (char c : whole) {
    if (c < '0' || c > '9') return std::nullopt;
    units = units * 10 + (c - '0');
    if (units > kMaxWhole) return std::nullopt;
  }

  int64_t cents = 0;
  for (std::size_t i = 0; i < 2; ++i) {
    cents *= 10;
    if (i < frac.size()) {
      const char c = frac[i];
      if (c < '0' || c > '9') return std::nullopt;
      cents += c - '0';
    }
  }

  const int64_t minor = units * 100 + cents;
  return negative ? -minor : minor;
}

std::string FormatMinorUnits(int64_t minor) {
  const bool negative = minor < 0;
  // avoid overflow on INT64_MIN
  const uint64_t abs_value = negative ? static_cast<uint64_t>(-(minor + 1)) + 1 : static_cast<uint64_t>(minor);

  std::string cents = std::to_string(abs_value % 100);
  if (cents.size() < 2) cents.insert(0, "0");

  return (negative ? "-" : "") + std::to_string(abs_value / 100) + "." + cents;
}

int64_t PercentOf(int64_t minor, double percent) {
  return static_cast<int64_t>(std::llround(static_cast<double>(minor) * percent / 100.0));
}

} // namespace keyshop::util
