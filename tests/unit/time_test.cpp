#include <cassert>
#include <iostream>

#include "internal/util/time.hpp"

namespace {

using namespace booking::util;

void TestParseAndFormatRoundTrip() {
  auto tp = ParseDateTime("2025-01-20T14:00");
  assert(tp);
  assert(FormatDateTime(*tp) == "2025-01-20T14:00:00");
  assert(FormatClock(*tp) == "14:00");

  auto with_space = ParseDateTime("2025-01-20 14:00:30");
  assert(with_space && *with_space == *tp + std::chrono::seconds(30));

  auto date = ParseDate("2025-01-20");
  assert(date && FormatDate(*date) == "2025-01-20");
  assert(TimePoint(*date) + std::chrono::hours(14) == *tp);

  assert(FromUnixSeconds(ToUnixSeconds(*tp)) == *tp);
}

void TestRejectsMalformedInput() {
  assert(!ParseDateTime("2025-01-20"));
  assert(!ParseDateTime("2025-01-20X14:00"));
  assert(!ParseDateTime("2025-02-30T10:00"));
  assert(!ParseDateTime("2025-01-20T24:00"));
  assert(!ParseDate("20-01-2025"));
  assert(!ParseClock("9:00"));
  assert(!ParseClock("09:60"));
  assert(ParseClock("09:30") == std::chrono::minutes(570));
}

} // namespace

int main() {
  TestParseAndFormatRoundTrip();
  TestRejectsMalformedInput();

  std::cout << "booking_engine_unit_time: pass\n";
  return 0;
}
