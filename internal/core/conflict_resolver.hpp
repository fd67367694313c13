#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace booking::core {

/*
  Overlap test of a candidate [start, end) against the occupying intervals
  (pending, approved, block) of one space.

  The answer is only as fresh as the transaction it runs in. Callers that
  act on "no conflict" hold the space lock from SpaceLockTable across the
  check and their write.
*/
class ConflictResolver {
 public:
  explicit ConflictResolver(std::shared_ptr<db::Repository> repository);

  bool HasConflict(db::Transaction& tx, int64_t space_id, util::TimePoint start, util::TimePoint end,
                   std::optional<int64_t> exclude_interval_id = std::nullopt) const;

  // Every occupying interval overlapping the candidate, ordered by start.
  std::vector<db::model::IntervalRecord> FindConflicts(db::Transaction& tx, int64_t space_id, util::TimePoint start,
                                                       util::TimePoint end,
                                                       std::optional<int64_t> exclude_interval_id = std::nullopt) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace booking::core
