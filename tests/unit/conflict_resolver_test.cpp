#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/conflict_resolver.hpp"
#include "tests/support/test_support.hpp"

namespace {

using booking::core::ConflictResolver;
using booking::db::model::IntervalRecord;
using booking::model::IntervalKind;
using booking::model::IntervalState;
using booking::testing::At;

int64_t Insert(booking::db::Repository& repo, int64_t space_id, const char* start, const char* end, IntervalState state,
               IntervalKind kind = IntervalKind::kNormal) {
  auto           tx = repo.Begin();
  IntervalRecord record;
  record.space_id = space_id;
  if (kind == IntervalKind::kNormal) record.owner_user_id = 2;
  record.start = At(start);
  record.end   = At(end);
  record.state = state;
  record.kind  = kind;
  auto result  = repo.InsertInterval(*tx, record);
  assert(result);
  tx->Commit();
  return record.id;
}

void TestHalfOpenBoundaries() {
  auto             repo = booking::testing::SeededMemoryRepository();
  ConflictResolver resolver(repo);
  Insert(*repo, 1, "2025-01-20T14:00", "2025-01-20T16:00", IntervalState::kPending);

  auto tx = repo->BeginReadOnly();
  assert(!resolver.HasConflict(*tx, 1, At("2025-01-20T16:00"), At("2025-01-20T18:00")));
  assert(!resolver.HasConflict(*tx, 1, At("2025-01-20T12:00"), At("2025-01-20T14:00")));
  assert(resolver.HasConflict(*tx, 1, At("2025-01-20T15:00"), At("2025-01-20T17:00")));
  assert(resolver.HasConflict(*tx, 1, At("2025-01-20T13:00"), At("2025-01-20T17:00")));
  assert(resolver.HasConflict(*tx, 1, At("2025-01-20T14:30"), At("2025-01-20T15:00")));
  // Another space is independent.
  assert(!resolver.HasConflict(*tx, 2, At("2025-01-20T15:00"), At("2025-01-20T17:00")));
}

void TestOnlyOccupyingStatesConflict() {
  auto             repo = booking::testing::SeededMemoryRepository();
  ConflictResolver resolver(repo);
  Insert(*repo, 1, "2025-01-20T08:00", "2025-01-20T09:00", IntervalState::kRejected);
  Insert(*repo, 1, "2025-01-20T09:00", "2025-01-20T10:00", IntervalState::kCancelled);
  Insert(*repo, 1, "2025-01-20T10:00", "2025-01-20T11:00", IntervalState::kApproved);
  Insert(*repo, 1, "2025-01-20T11:00", "2025-01-20T12:00", IntervalState::kBlock, IntervalKind::kBlock);

  auto tx = repo->BeginReadOnly();
  assert(!resolver.HasConflict(*tx, 1, At("2025-01-20T08:00"), At("2025-01-20T10:00")));
  assert(resolver.HasConflict(*tx, 1, At("2025-01-20T09:30"), At("2025-01-20T10:30")));
  assert(resolver.HasConflict(*tx, 1, At("2025-01-20T11:30"), At("2025-01-20T12:30")));

  const auto conflicts = resolver.FindConflicts(*tx, 1, At("2025-01-20T07:00"), At("2025-01-20T13:00"));
  assert(conflicts.size() == 2);
  assert(conflicts[0].state == IntervalState::kApproved);
  assert(conflicts[1].kind == IntervalKind::kBlock);
}

void TestExcludedIntervalIsIgnored() {
  auto             repo = booking::testing::SeededMemoryRepository();
  ConflictResolver resolver(repo);
  const auto       id = Insert(*repo, 1, "2025-01-20T14:00", "2025-01-20T16:00", IntervalState::kApproved);

  auto tx = repo->BeginReadOnly();
  assert(resolver.HasConflict(*tx, 1, At("2025-01-20T14:00"), At("2025-01-20T16:00")));
  assert(!resolver.HasConflict(*tx, 1, At("2025-01-20T14:00"), At("2025-01-20T16:00"), id));
}

void TestEmptyCandidateNeverConflicts() {
  auto             repo = booking::testing::SeededMemoryRepository();
  ConflictResolver resolver(repo);
  Insert(*repo, 1, "2025-01-20T14:00", "2025-01-20T16:00", IntervalState::kApproved);

  auto tx = repo->BeginReadOnly();
  assert(!resolver.HasConflict(*tx, 1, At("2025-01-20T15:00"), At("2025-01-20T15:00")));
}

} // namespace

int main() {
  TestHalfOpenBoundaries();
  TestOnlyOccupyingStatesConflict();
  TestExcludedIntervalIsIgnored();
  TestEmptyCandidateNeverConflicts();

  std::cout << "booking_engine_unit_conflict_resolver: pass\n";
  return 0;
}
