#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/conflict_resolver.hpp"
#include "internal/core/space_lock_table.hpp"
#include "internal/db/api/repository.hpp"

namespace booking::core {

struct IncidentSummary {
  db::model::IncidentRecord incident;
  std::string               space_name;
};

struct BlockOutcome {
  db::model::IncidentRecord              incident;
  db::model::IntervalRecord              block;
  std::vector<db::model::IntervalRecord> cancelled; // bookings as they were before the cascade
};

struct ResolveOutcome {
  db::model::IncidentRecord incident;
  bool                      released = false;
};

/*
  Incident reporting and the block cascade.

  ApplyBlock cancels every pending or approved booking overlapping the
  block, inserts the block and links it to the incident, all in one unit
  under the space lock. Resolve hard-deletes the incident's blocks and may
  be repeated: later calls report released = false.
*/
class IncidentHandler {
 public:
  IncidentHandler(std::shared_ptr<db::Repository> repository, std::shared_ptr<SpaceLockTable> locks);

  // Throws NotFound for an absent or inactive space.
  db::model::IncidentRecord Report(int64_t space_id, const std::string& type, const std::string& description,
                                   std::optional<int64_t> reported_by);

  std::vector<IncidentSummary> List(const db::IncidentFilter& filter);

  // Throws InvalidRange, NotFound, InvalidState (resolved, or a block is
  // already applied) and SlotUnavailable (range overlaps another block).
  BlockOutcome ApplyBlock(int64_t incident_id, util::TimePoint start, util::TimePoint end);

  // Throws NotFound for an unknown incident.
  ResolveOutcome Resolve(int64_t incident_id, const std::string& solution);

 private:
  int64_t SpaceOf(int64_t incident_id);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<SpaceLockTable> locks_;
  ConflictResolver                resolver_;
};

} // namespace booking::core
