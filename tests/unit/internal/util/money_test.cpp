#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>

namespace {

using keyshop::util::FormatIso8601;
using keyshop::util::FormatMinorUnits;
using keyshop::util::ParseIso8601;
using keyshop::util::ParseMinorUnits;
using keyshop::util::PercentOf;

void TestParseAcceptsWholeAndFractionalAmounts() {
  assert(ParseMinorUnits("300") == 30000);
  assert(ParseMinorUnits("300.5") == 30050);
  assert(ParseMinorUnits("300.05") == 30005);
  assert(ParseMinorUnits("0.01") == 1);
  assert(ParseMinorUnits("-1.50") == -150);
}

void TestParseRejectsMalformedAmounts() {
  assert(!ParseMinorUnits(""));
  assert(!ParseMinorUnits("-"));
  assert(!ParseMinorUnits("1."));
  assert(!ParseMinorUnits(".5"));
  assert(!ParseMinorUnits("1.234"));
  assert(!ParseMinorUnits("12a"));
  assert(!ParseMinorUnits("1e3"));
  assert(!ParseMinorUnits("1,50"));
  assert(!ParseMinorUnits("99999999999999999999"));
}

void TestFormatPadsCents() {
  assert(FormatMinorUnits(30050) == "300.50");
  assert(FormatMinorUnits(5) == "0.05");
  assert(FormatMinorUnits(0) == "0.00");
  assert(FormatMinorUnits(-150) == "-1.50");
}

void TestPercentRoundsToNearestMinorUnit() {
  assert(PercentOf(30000, 10.0) == 3000);
  assert(PercentOf(333, 50.0) == 167);
  assert(PercentOf(30000, 0.0) == 0);
}

void TestIso8601() {
  assert(FormatIso8601(0) == "1970-01-01T00:00:00.000Z");
  assert(FormatIso8601(1792281600123LL) == "2026-10-18T00:00:00.123Z");

  assert(ParseIso8601("2026-10-18T00:00:00Z") == 1792281600000LL);
  assert(ParseIso8601("2026-10-18T00:00:00.5Z") == 1792281600500LL);
  assert(ParseIso8601("2026-10-18T00:00:00.123456Z") == 1792281600123LL);
  assert(!ParseIso8601("2026-10-18"));
  assert(!ParseIso8601("2026-10-18T00:00:00+03:00"));
}

} // namespace

int main() {
  TestParseAcceptsWholeAndFractionalAmounts();
  TestParseRejectsMalformedAmounts();
  TestFormatPadsCents();
  TestPercentRoundsToNearestMinorUnit();
  TestIso8601();

  std::cout << "keyshop_unit_money: pass\n";
  return 0;
}
