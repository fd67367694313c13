#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/availability_engine.hpp"
#include "internal/core/booking_manager.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using booking::core::AvailabilityEngine;
using booking::core::BookingManager;
using booking::core::CalendarOptions;
using booking::core::SpaceLockTable;
using booking::model::IntervalState;
using booking::testing::At;
using booking::testing::Day;
using booking::testing::Throws;
namespace util = booking::util;

struct Fixture {
  std::shared_ptr<booking::db::Repository> repo = booking::testing::SeededMemoryRepository();
  BookingManager                           bookings{repo, std::make_shared<SpaceLockTable>()};
  AvailabilityEngine                       availability{repo, CalendarOptions{}};
};

bool AvailableIn(const std::vector<booking::core::SpaceAvailability>& rows, int64_t space_id) {
  for (const auto& row : rows) {
    if (row.space.id == space_id) return row.available;
  }
  assert(false && "space missing from availability listing");
  return false;
}

void TestCheckListsActiveSpaces() {
  Fixture f;
  f.bookings.Create(1, 2, At("2025-01-20T14:00"), At("2025-01-20T16:00"), "");

  const auto rows = f.availability.CheckAvailability(Day("2025-01-20"), util::ParseClock("15:00"), 1, std::nullopt);
  assert(rows.size() == 3); // space 3 is inactive
  assert(rows[0].space.id == 1);
  assert(!AvailableIn(rows, 1));
  assert(AvailableIn(rows, 2));
  assert(AvailableIn(rows, 5));

  // Touching the end of the booking is free.
  const auto later = f.availability.CheckAvailability(Day("2025-01-20"), util::ParseClock("16:00"), 2, std::nullopt);
  assert(AvailableIn(later, 1));
}

void TestCheckDefaultsAndFilter() {
  Fixture f;
  f.bookings.Create(2, 2, At("2025-01-20T08:00"), At("2025-01-20T09:00"), "");
  f.bookings.Create(1, 2, At("2025-01-20T09:00"), At("2025-01-20T10:00"), "");

  // Default start is the opening hour, default duration one hour.
  const auto rows = f.availability.CheckAvailability(Day("2025-01-20"), std::nullopt, std::nullopt, std::nullopt);
  assert(AvailableIn(rows, 1));
  assert(!AvailableIn(rows, 2));

  const auto longer = f.availability.CheckAvailability(Day("2025-01-20"), std::nullopt, 2, std::nullopt);
  assert(!AvailableIn(longer, 1));

  const auto labs =
      f.availability.CheckAvailability(Day("2025-01-20"), std::nullopt, std::nullopt, std::string("laboratorio"));
  assert(labs.size() == 1);
  assert(labs[0].space.id == 2);

  assert(f.availability.CheckAvailability(Day("2025-01-20"), std::nullopt, 1, std::string("piscina")).empty());

  assert(Throws<util::InvalidRange>(
      [&] { f.availability.CheckAvailability(Day("2025-01-20"), std::nullopt, 0, std::nullopt); }));
  assert(Throws<util::InvalidRange>(
      [&] { f.availability.CheckAvailability(Day("2025-01-20"), std::nullopt, -3, std::nullopt); }));
}

void TestCalendarSlots() {
  Fixture f;
  auto    approved = f.bookings.Create(1, 2, At("2025-01-20T10:00"), At("2025-01-20T12:00"), "Clase");
  f.bookings.Decide(approved.id, IntervalState::kApproved, 1);
  // Starts mid-slot: the 13:00 slot start is not covered, the 14:00 one is.
  auto partial = f.bookings.Create(1, 3, At("2025-01-20T13:30"), At("2025-01-20T14:30"), "Tutoria");
  auto gone    = f.bookings.Create(1, 3, At("2025-01-20T18:00"), At("2025-01-20T19:00"), "");
  f.bookings.Cancel(gone.id, 3);

  const auto calendar = f.availability.Calendar(1, Day("2025-01-20"));
  assert(calendar.space.name == "Sala A-101");
  assert(calendar.slots.size() == 14);
  assert(calendar.slots.front().start == At("2025-01-20T08:00"));
  assert(calendar.slots.back().start == At("2025-01-20T21:00"));

  auto slot = [&](int hour) { return calendar.slots[static_cast<size_t>(hour - 8)]; };
  assert(slot(9).available);
  assert(!slot(10).available);
  assert(slot(10).occupant->id == approved.id);
  assert(!slot(11).available);
  assert(slot(12).available);
  assert(slot(13).available);
  assert(!slot(14).available);
  assert(slot(14).occupant->id == partial.id);
  assert(slot(18).available);
  assert(!slot(18).occupant.has_value());

  assert(f.availability.Calendar(1, Day("2025-01-21")).slots.front().available);
}

void TestCalendarHonorsOptions() {
  auto               repo = booking::testing::SeededMemoryRepository();
  AvailabilityEngine availability(repo, CalendarOptions{7, 9, 1});

  const auto calendar = availability.Calendar(5, Day("2025-03-01"));
  assert(calendar.slots.size() == 2);
  assert(calendar.slots[0].start == At("2025-03-01T07:00"));
}

void TestCalendarUnknownSpace() {
  Fixture f;
  assert(Throws<util::NotFound>([&] { f.availability.Calendar(3, Day("2025-01-20")); }));
  assert(Throws<util::NotFound>([&] { f.availability.Calendar(77, Day("2025-01-20")); }));
}

} // namespace

int main() {
  TestCheckListsActiveSpaces();
  TestCheckDefaultsAndFilter();
  TestCalendarSlots();
  TestCalendarHonorsOptions();
  TestCalendarUnknownSpace();

  std::cout << "booking_engine_unit_availability_engine: pass\n";
  return 0;
}
