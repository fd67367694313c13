#include "conflict_resolver.hpp"

#include "internal/model/interval.hpp"

namespace booking::core {

ConflictResolver::ConflictResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<db::model::IntervalRecord> ConflictResolver::FindConflicts(db::Transaction& tx, int64_t space_id,
                                                                       util::TimePoint start, util::TimePoint end,
                                                                       std::optional<int64_t> exclude_interval_id) const {
  std::vector<db::model::IntervalRecord> conflicts;
  if (end <= start) {
    return conflicts;
  }

  // The repository narrows by range; the overlap test is re-applied here so
  // that every backend honours the same half-open rule.
  for (auto& interval : repository_->ListOccupying(tx, space_id, start, end)) {
    if (exclude_interval_id && interval.id == *exclude_interval_id) continue;
    if (!model::IsOccupying(interval.state)) continue;
    if (!model::Overlaps(interval.start, interval.end, start, end)) continue;
    conflicts.push_back(std::move(interval));
  }
  return conflicts;
}

bool ConflictResolver::HasConflict(db::Transaction& tx, int64_t space_id, util::TimePoint start, util::TimePoint end,
                                   std::optional<int64_t> exclude_interval_id) const {
  return !FindConflicts(tx, space_id, start, end, exclude_interval_id).empty();
}

} // namespace booking::core
