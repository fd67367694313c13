#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/booking_manager.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using booking::core::BookingManager;
using booking::core::SpaceLockTable;
using booking::model::IntervalKind;
using booking::model::IntervalState;
using booking::testing::At;
using booking::testing::Throws;
namespace util = booking::util;

struct Fixture {
  std::shared_ptr<booking::db::Repository> repo  = booking::testing::SeededMemoryRepository();
  std::shared_ptr<SpaceLockTable>          locks = std::make_shared<SpaceLockTable>();
  BookingManager                           bookings{repo, locks};
};

void TestCreateStartsPending() {
  Fixture f;
  auto    created = f.bookings.Create(1, 2, At("2025-01-20T14:00"), At("2025-01-20T16:00"), "Estudio");

  assert(created.id > 0);
  assert(created.state == IntervalState::kPending);
  assert(created.kind == IntervalKind::kNormal);
  assert(created.owner_user_id == 2);
  assert(created.reason == "Estudio");

  auto tx     = f.repo->BeginReadOnly();
  auto stored = f.repo->GetInterval(*tx, created.id);
  assert(stored);
  assert(stored->start == At("2025-01-20T14:00"));
  assert(stored->end == At("2025-01-20T16:00"));
}

void TestAdjacentAllowedOverlapRejected() {
  Fixture f;
  f.bookings.Create(1, 2, At("2025-01-20T14:00"), At("2025-01-20T16:00"), "A");
  f.bookings.Create(1, 3, At("2025-01-20T16:00"), At("2025-01-20T18:00"), "B");

  assert(Throws<util::SlotUnavailable>(
      [&] { f.bookings.Create(1, 3, At("2025-01-20T15:00"), At("2025-01-20T17:00"), "C"); }));

  // Same range on another space is fine.
  f.bookings.Create(2, 3, At("2025-01-20T15:00"), At("2025-01-20T17:00"), "D");
}

void TestRejectsBadRangeAndUnknownParties() {
  Fixture f;
  assert(Throws<util::InvalidRange>(
      [&] { f.bookings.Create(1, 2, At("2025-01-20T16:00"), At("2025-01-20T16:00"), ""); }));
  assert(Throws<util::InvalidRange>(
      [&] { f.bookings.Create(1, 2, At("2025-01-20T17:00"), At("2025-01-20T16:00"), ""); }));

  assert(Throws<util::NotFound>([&] { f.bookings.Create(1, 4, At("2025-01-20T10:00"), At("2025-01-20T11:00"), ""); }));
  assert(Throws<util::NotFound>([&] { f.bookings.Create(1, 99, At("2025-01-20T10:00"), At("2025-01-20T11:00"), ""); }));
  assert(Throws<util::NotFound>([&] { f.bookings.Create(3, 2, At("2025-01-20T10:00"), At("2025-01-20T11:00"), ""); }));
  assert(Throws<util::NotFound>([&] { f.bookings.Create(42, 2, At("2025-01-20T10:00"), At("2025-01-20T11:00"), ""); }));
}

void TestDecisionLifecycle() {
  Fixture f;
  auto    a = f.bookings.Create(1, 2, At("2025-01-20T10:00"), At("2025-01-20T11:00"), "");
  auto    b = f.bookings.Create(1, 2, At("2025-01-20T11:00"), At("2025-01-20T12:00"), "");

  auto approved = f.bookings.Decide(a.id, IntervalState::kApproved, 1);
  assert(approved.state == IntervalState::kApproved);
  assert(approved.decided_by == 1);
  assert(approved.decided_at.has_value());

  // Decisions only apply to pending bookings.
  assert(Throws<util::InvalidState>([&] { f.bookings.Decide(a.id, IntervalState::kRejected, 1); }));

  auto rejected = f.bookings.Decide(b.id, IntervalState::kRejected, 1);
  assert(rejected.state == IntervalState::kRejected);
  assert(Throws<util::InvalidState>([&] { f.bookings.Cancel(b.id, 2); }));

  // A rejected booking frees its slot.
  f.bookings.Create(1, 3, At("2025-01-20T11:00"), At("2025-01-20T12:00"), "");

  assert(Throws<util::InvalidState>([&] { f.bookings.Decide(a.id, IntervalState::kCancelled, 1); }));
  assert(Throws<util::NotFound>([&] { f.bookings.Decide(999, IntervalState::kApproved, 1); }));
}

void TestCancelApprovedAndPending() {
  Fixture f;
  auto    a = f.bookings.Create(1, 2, At("2025-01-21T10:00"), At("2025-01-21T11:00"), "");
  auto    b = f.bookings.Create(1, 2, At("2025-01-21T12:00"), At("2025-01-21T13:00"), "");
  f.bookings.Decide(a.id, IntervalState::kApproved, 1);

  auto cancelled = f.bookings.Cancel(a.id, 2);
  assert(cancelled.state == IntervalState::kCancelled);
  assert(cancelled.cancelled_by == 2);
  f.bookings.Cancel(b.id, 2);

  assert(Throws<util::InvalidState>([&] { f.bookings.Cancel(a.id, 2); }));
  assert(Throws<util::NotFound>([&] { f.bookings.Cancel(12345, 2); }));

  f.bookings.Create(1, 3, At("2025-01-21T10:00"), At("2025-01-21T13:00"), "");
}

void TestCancelOwnerOrAdminOnly() {
  Fixture f;
  auto    mine   = f.bookings.Create(1, 2, At("2025-01-23T10:00"), At("2025-01-23T11:00"), "");
  auto    theirs = f.bookings.Create(1, 3, At("2025-01-23T11:00"), At("2025-01-23T12:00"), "");

  // Another student cannot cancel, and learns nothing about the booking.
  assert(Throws<util::NotFound>([&] { f.bookings.Cancel(mine.id, 3); }));
  assert(Throws<util::NotFound>([&] { f.bookings.Cancel(mine.id, 99); }));
  {
    auto tx = f.repo->BeginReadOnly();
    assert(f.repo->GetInterval(*tx, mine.id)->state == IntervalState::kPending);
  }

  auto by_owner = f.bookings.Cancel(mine.id, 2);
  assert(by_owner.state == IntervalState::kCancelled);
  assert(by_owner.cancelled_by == 2);

  auto by_admin = f.bookings.Cancel(theirs.id, 1);
  assert(by_admin.state == IntervalState::kCancelled);
  assert(by_admin.cancelled_by == 1);
}

void TestUnknownSpacesStayOutOfLockTable() {
  Fixture f;
  for (int64_t space_id = 1000; space_id < 1100; ++space_id) {
    assert(Throws<util::NotFound>(
        [&] { f.bookings.Create(space_id, 2, At("2025-01-24T10:00"), At("2025-01-24T11:00"), ""); }));
  }
  // Inactive space.
  assert(Throws<util::NotFound>([&] { f.bookings.Create(3, 2, At("2025-01-24T10:00"), At("2025-01-24T11:00"), ""); }));
  assert(f.locks->Size() == 0);

  f.bookings.Create(1, 2, At("2025-01-24T10:00"), At("2025-01-24T11:00"), "");
  f.bookings.Create(1, 3, At("2025-01-24T11:00"), At("2025-01-24T12:00"), "");
  assert(f.locks->Size() == 1);
}

void TestBlocksAreNotBookings() {
  Fixture f;
  int64_t block_id = 0;
  {
    auto                                tx = f.repo->Begin();
    booking::db::model::IntervalRecord block;
    block.space_id = 1;
    block.start    = At("2025-01-22T08:00");
    block.end      = At("2025-01-22T10:00");
    block.state    = IntervalState::kBlock;
    block.kind     = IntervalKind::kBlock;
    assert(f.repo->InsertInterval(*tx, block));
    tx->Commit();
    block_id = block.id;
  }

  assert(Throws<util::NotFound>([&] { f.bookings.Cancel(block_id, 1); }));
  assert(Throws<util::NotFound>([&] { f.bookings.Decide(block_id, IntervalState::kApproved, 1); }));
  assert(Throws<util::SlotUnavailable>(
      [&] { f.bookings.Create(1, 2, At("2025-01-22T09:00"), At("2025-01-22T11:00"), ""); }));
}

void TestListByUser() {
  Fixture f;
  auto    first  = f.bookings.Create(1, 2, At("2025-01-20T10:00"), At("2025-01-20T11:00"), "uno");
  auto    second = f.bookings.Create(2, 2, At("2025-01-20T10:00"), At("2025-01-20T11:00"), "dos");
  f.bookings.Create(1, 3, At("2025-01-20T12:00"), At("2025-01-20T13:00"), "otro");
  f.bookings.Cancel(first.id, 2);

  auto mine = f.bookings.ListByUser(2);
  assert(mine.size() == 2);
  assert(mine[0].interval.id == second.id);
  assert(mine[0].space_name == "Laboratorio L-2");
  assert(mine[1].interval.id == first.id);
  assert(mine[1].interval.state == IntervalState::kCancelled);
  assert(mine[1].space_name == "Sala A-101");

  assert(f.bookings.ListByUser(1).empty());
}

} // namespace

int main() {
  TestCreateStartsPending();
  TestAdjacentAllowedOverlapRejected();
  TestRejectsBadRangeAndUnknownParties();
  TestDecisionLifecycle();
  TestCancelApprovedAndPending();
  TestCancelOwnerOrAdminOnly();
  TestUnknownSpacesStayOutOfLockTable();
  TestBlocksAreNotBookings();
  TestListByUser();

  std::cout << "booking_engine_unit_booking_manager: pass\n";
  return 0;
}
