#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/directory_record.hpp"
#include "internal/db/model/incident_record.hpp"
#include "internal/db/model/interval_record.hpp"

namespace booking::db {

struct IncidentFilter {
  std::optional<booking::model::IncidentStatus> status;
  std::optional<int64_t>                        space_id;
};

/*
  Repository abstraction (the Interval Store).

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - A unit of work either commits entirely or leaves no trace
  - TransitionInterval is a compare-and-set on the row's state

  Cross-row serialization of check-then-insert for one space is NOT a
  repository guarantee; callers hold the space lock for that.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginReadOnly() = 0;

  // ---------------------------------------------------------------------
  // Intervals
  // ---------------------------------------------------------------------

  // Assigns record.id, record.version.
  virtual Result InsertInterval(Transaction&, model::IntervalRecord& record) = 0;

  virtual std::optional<model::IntervalRecord> GetInterval(Transaction&, int64_t id) = 0;

  // Writes `record` only if the stored row is still in `expected`.
  // NotFound if the row is missing, Conflict if its state moved on.
  virtual Result TransitionInterval(Transaction&, const model::IntervalRecord& record,
                                    booking::model::IntervalState expected) = 0;

  virtual Result DeleteInterval(Transaction&, int64_t id) = 0;

  // Occupying rows (pending, approved, block) of the space overlapping [start, end).
  virtual std::vector<model::IntervalRecord> ListOccupying(Transaction&, int64_t space_id, util::TimePoint start,
                                                           util::TimePoint end) = 0;

  // Normal bookings of one owner, newest request first.
  virtual std::vector<model::IntervalRecord> ListByOwner(Transaction&, int64_t owner_user_id) = 0;

  virtual std::vector<model::IntervalRecord> ListBlocksByIncident(Transaction&, int64_t incident_id) = 0;

  // ---------------------------------------------------------------------
  // Incidents
  // ---------------------------------------------------------------------

  virtual Result InsertIncident(Transaction&, model::IncidentRecord& record) = 0;

  virtual std::optional<model::IncidentRecord> GetIncident(Transaction&, int64_t id) = 0;

  virtual Result UpdateIncident(Transaction&, const model::IncidentRecord& record) = 0;

  // Newest report first.
  virtual std::vector<model::IncidentRecord> ListIncidents(Transaction&, const IncidentFilter& filter) = 0;

  // ---------------------------------------------------------------------
  // Directory (read-only collaborators; upserts are for seeding)
  // ---------------------------------------------------------------------

  virtual Result UpsertSpace(Transaction&, const model::SpaceRecord& record) = 0;

  virtual std::optional<model::SpaceRecord> GetSpace(Transaction&, int64_t id) = 0;

  // Active spaces ordered by id, optionally filtered by type.
  virtual std::vector<model::SpaceRecord> ListActiveSpaces(Transaction&, const std::optional<std::string>& type) = 0;

  virtual Result UpsertUser(Transaction&, const model::UserRecord& record) = 0;

  virtual std::optional<model::UserRecord> GetUser(Transaction&, int64_t id) = 0;
};

} // namespace booking::db
