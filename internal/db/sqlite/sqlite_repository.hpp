#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace booking::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqlitePool> pool_;
};

}
