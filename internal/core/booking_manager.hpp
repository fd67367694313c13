#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/conflict_resolver.hpp"
#include "internal/core/space_lock_table.hpp"
#include "internal/db/api/repository.hpp"

namespace booking::core {

struct BookingSummary {
  db::model::IntervalRecord interval;
  std::string               space_name;
};

/*
  Booking lifecycle for intervals of kind normal.

  Create serializes per space through the lock table and a single
  transaction covering directory checks, conflict scan and insert.
  Decide and Cancel only need the row's state compare-and-set.
*/
class BookingManager {
 public:
  BookingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<SpaceLockTable> locks);

  // Throws InvalidRange, NotFound (user or space absent/inactive), SlotUnavailable.
  db::model::IntervalRecord Create(int64_t space_id, int64_t owner_user_id, util::TimePoint start, util::TimePoint end,
                                   const std::string& reason);

  // outcome is kApproved or kRejected. Throws NotFound, InvalidState.
  db::model::IntervalRecord Decide(int64_t interval_id, model::IntervalState outcome, int64_t decided_by);

  // Owner or an admin only; anyone else gets NotFound. Throws InvalidState
  // when already cancelled or rejected.
  db::model::IntervalRecord Cancel(int64_t interval_id, int64_t requested_by);

  // Newest request first.
  std::vector<BookingSummary> ListByUser(int64_t user_id);

 private:
  db::model::IntervalRecord Transition(int64_t interval_id, model::IntervalState target, int64_t actor);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<SpaceLockTable> locks_;
  ConflictResolver                resolver_;
};

} // namespace booking::core
