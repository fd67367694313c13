#pragma once

#include <atomic>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace booking::db::memory {

class MemoryTransaction;

/*
  In-process Interval Store.

  Every transaction works on a private snapshot. Commit validates the
  version of each row the transaction touched against the committed state,
  so writers on different rows (and therefore different spaces) never
  conflict with each other.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginReadOnly() override;

  Result InsertInterval(Transaction&, model::IntervalRecord&) override;
  std::optional<model::IntervalRecord> GetInterval(Transaction&, int64_t) override;
  Result TransitionInterval(Transaction&, const model::IntervalRecord&, booking::model::IntervalState) override;
  Result DeleteInterval(Transaction&, int64_t) override;
  std::vector<model::IntervalRecord> ListOccupying(Transaction&, int64_t space_id, util::TimePoint start,
                                                   util::TimePoint end) override;
  std::vector<model::IntervalRecord> ListByOwner(Transaction&, int64_t owner_user_id) override;
  std::vector<model::IntervalRecord> ListBlocksByIncident(Transaction&, int64_t incident_id) override;

  Result InsertIncident(Transaction&, model::IncidentRecord&) override;
  std::optional<model::IncidentRecord> GetIncident(Transaction&, int64_t) override;
  Result UpdateIncident(Transaction&, const model::IncidentRecord&) override;
  std::vector<model::IncidentRecord> ListIncidents(Transaction&, const IncidentFilter&) override;

  Result UpsertSpace(Transaction&, const model::SpaceRecord&) override;
  std::optional<model::SpaceRecord> GetSpace(Transaction&, int64_t) override;
  std::vector<model::SpaceRecord> ListActiveSpaces(Transaction&, const std::optional<std::string>&) override;
  Result UpsertUser(Transaction&, const model::UserRecord&) override;
  std::optional<model::UserRecord> GetUser(Transaction&, int64_t) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::IntervalRecord> intervals;
    std::map<int64_t, model::IncidentRecord> incidents;
    std::map<int64_t, model::SpaceRecord>    spaces;
    std::map<int64_t, model::UserRecord>     users;
  };

  std::mutex mutex_;
  State committed_;

  std::atomic<int64_t> next_interval_id_{1};
  std::atomic<int64_t> next_incident_id_{1};
};

}
