#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace keyshop::util {

/*
  Money is carried as integer minor units (cents/kopecks).
  Decimal strings ("300", "300.5", "300.00") are the wire and config form.
*/

// Accepts an optional leading '-', digits, and at most two fractional digits.
std::optional<int64_t> ParseMinorUnits(std::string_view decimal);

// 30050 -> "300.50"
std::string FormatMinorUnits(int64_t minor);

// Percentage of an amount, rounded to the nearest minor unit.
int64_t PercentOf(int64_t minor, double percent);

} // namespace keyshop::util
