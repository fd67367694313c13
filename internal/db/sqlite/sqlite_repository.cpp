#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace booking::db::sqlite {

using booking::db::ErrorCode;
using booking::db::Result;
using booking::model::IncidentStatus;
using booking::model::IntervalKind;
using booking::model::IntervalState;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    throw util::StoreUnavailable(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindI64(st, idx, util::ToUnixSeconds(tp));
}

void BindOptTime(sqlite3_stmt* st, int idx, const std::optional<util::TimePoint>& tp) {
  if (tp) {
    BindTime(st, idx, *tp);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::FromUnixSeconds(ColI64(st, col));
}

std::optional<util::TimePoint> ColOptTime(sqlite3_stmt* st, int col) {
  auto v = ColOptI64(st, col);
  if (!v) return std::nullopt;
  return util::FromUnixSeconds(*v);
}

// Steps a query to completion, collecting one value per row.
template <typename Row, typename Fn>
std::vector<Row> Collect(sqlite3* db, sqlite3_stmt* st, Fn&& read_row) {
  std::vector<Row> out;
  for (;;) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) {
      throw util::StoreUnavailable(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    out.push_back(read_row(st));
  }
  return out;
}

constexpr const char* kIntervalColumns =
    "id,space_id,owner_user_id,start_s,end_s,state,kind,reason,created_at,decided_by,decided_at,cancelled_by,incident_id,version";

model::IntervalRecord ReadInterval(sqlite3_stmt* st) {
  model::IntervalRecord r;
  r.id            = ColI64(st, 0);
  r.space_id      = ColI64(st, 1);
  r.owner_user_id = ColOptI64(st, 2);
  r.start         = ColTime(st, 3);
  r.end           = ColTime(st, 4);
  r.state         = static_cast<IntervalState>(sqlite3_column_int(st, 5));
  r.kind          = static_cast<IntervalKind>(sqlite3_column_int(st, 6));
  r.reason        = ColText(st, 7);
  r.created_at    = ColTime(st, 8);
  r.decided_by    = ColOptI64(st, 9);
  r.decided_at    = ColOptTime(st, 10);
  r.cancelled_by  = ColOptI64(st, 11);
  r.incident_id   = ColOptI64(st, 12);
  r.version       = static_cast<uint64_t>(ColI64(st, 13));
  return r;
}

constexpr const char* kIncidentColumns =
    "id,space_id,type,description,status,reported_by,reported_at,resolved_at,solution,block_interval_id,version";

model::IncidentRecord ReadIncident(sqlite3_stmt* st) {
  model::IncidentRecord r;
  r.id                = ColI64(st, 0);
  r.space_id          = ColI64(st, 1);
  r.type              = ColText(st, 2);
  r.description       = ColText(st, 3);
  r.status            = static_cast<IncidentStatus>(sqlite3_column_int(st, 4));
  r.reported_by       = ColOptI64(st, 5);
  r.reported_at       = ColTime(st, 6);
  r.resolved_at       = ColOptTime(st, 7);
  r.solution          = ColText(st, 8);
  r.block_interval_id = ColOptI64(st, 9);
  r.version           = static_cast<uint64_t>(ColI64(st, 10));
  return r;
}

model::SpaceRecord ReadSpace(sqlite3_stmt* st) {
  model::SpaceRecord r;
  r.id       = ColI64(st, 0);
  r.name     = ColText(st, 1);
  r.type     = ColText(st, 2);
  r.capacity = sqlite3_column_int(st, 3);
  r.location = ColText(st, 4);
  r.active   = sqlite3_column_int(st, 5) != 0;
  return r;
}

Result ReadOnlyError() {
  return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool)
    : pool_(std::move(pool)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(pool_, false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginReadOnly() {
  return std::make_unique<SqliteTransaction>(pool_, true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Intervals
// ------------------------------------------------------------------

Result SqliteRepository::InsertInterval(Transaction& t, model::IntervalRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  auto* db = tx.Handle();

  auto st = Prepare(db,
                    "INSERT INTO intervals(space_id,owner_user_id,start_s,end_s,state,kind,reason,created_at,"
                    "decided_by,decided_at,cancelled_by,incident_id,version) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,1);");

  BindI64(st.get(), 1, r.space_id);
  BindOptI64(st.get(), 2, r.owner_user_id);
  BindTime(st.get(), 3, r.start);
  BindTime(st.get(), 4, r.end);
  BindI64(st.get(), 5, static_cast<int>(r.state));
  BindI64(st.get(), 6, static_cast<int>(r.kind));
  BindText(st.get(), 7, r.reason);
  BindTime(st.get(), 8, r.created_at);
  BindOptI64(st.get(), 9, r.decided_by);
  BindOptTime(st.get(), 10, r.decided_at);
  BindOptI64(st.get(), 11, r.cancelled_by);
  BindOptI64(st.get(), 12, r.incident_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id      = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  r.version = 1;
  return Result::Ok();
}

std::optional<model::IntervalRecord> SqliteRepository::GetInterval(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kIntervalColumns + " FROM intervals WHERE id=?;");
  BindI64(st.get(), 1, id);

  auto rows = Collect<model::IntervalRecord>(db, st.get(), ReadInterval);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqliteRepository::TransitionInterval(Transaction& t, const model::IntervalRecord& r, IntervalState expected) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  auto* db = tx.Handle();

  auto st = Prepare(db,
                    "UPDATE intervals SET state=?,reason=?,decided_by=?,decided_at=?,cancelled_by=?,version=version+1 "
                    "WHERE id=? AND state=?;");

  BindI64(st.get(), 1, static_cast<int>(r.state));
  BindText(st.get(), 2, r.reason);
  BindOptI64(st.get(), 3, r.decided_by);
  BindOptTime(st.get(), 4, r.decided_at);
  BindOptI64(st.get(), 5, r.cancelled_by);
  BindI64(st.get(), 6, r.id);
  BindI64(st.get(), 7, static_cast<int>(expected));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) > 0) return Result::Ok();

  // Distinguish a missing row from a lost compare-and-set.
  if (!GetInterval(t, r.id)) return Result::Err(ErrorCode::NotFound);
  return Result::Err(ErrorCode::Conflict, "interval state changed");
}

Result SqliteRepository::DeleteInterval(Transaction& t, int64_t id) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  auto* db = tx.Handle();

  auto st = Prepare(db, "DELETE FROM intervals WHERE id=?;");
  BindI64(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::IntervalRecord> SqliteRepository::ListOccupying(Transaction& t, int64_t space_id, util::TimePoint start,
                                                                   util::TimePoint end) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kIntervalColumns +
                             " FROM intervals WHERE space_id=? AND state IN (?,?,?) AND start_s < ? AND end_s > ? "
                             "ORDER BY start_s;");

  BindI64(st.get(), 1, space_id);
  BindI64(st.get(), 2, static_cast<int>(IntervalState::kPending));
  BindI64(st.get(), 3, static_cast<int>(IntervalState::kApproved));
  BindI64(st.get(), 4, static_cast<int>(IntervalState::kBlock));
  BindTime(st.get(), 5, end);
  BindTime(st.get(), 6, start);

  return Collect<model::IntervalRecord>(db, st.get(), ReadInterval);
}

std::vector<model::IntervalRecord> SqliteRepository::ListByOwner(Transaction& t, int64_t owner_user_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kIntervalColumns +
                             " FROM intervals WHERE kind=? AND owner_user_id=? ORDER BY created_at DESC, id DESC;");

  BindI64(st.get(), 1, static_cast<int>(IntervalKind::kNormal));
  BindI64(st.get(), 2, owner_user_id);

  return Collect<model::IntervalRecord>(db, st.get(), ReadInterval);
}

std::vector<model::IntervalRecord> SqliteRepository::ListBlocksByIncident(Transaction& t, int64_t incident_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kIntervalColumns + " FROM intervals WHERE kind=? AND incident_id=?;");

  BindI64(st.get(), 1, static_cast<int>(IntervalKind::kBlock));
  BindI64(st.get(), 2, incident_id);

  return Collect<model::IntervalRecord>(db, st.get(), ReadInterval);
}

// ------------------------------------------------------------------
// Incidents
// ------------------------------------------------------------------

Result SqliteRepository::InsertIncident(Transaction& t, model::IncidentRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  auto* db = tx.Handle();

  auto st = Prepare(db,
                    "INSERT INTO incidents(space_id,type,description,status,reported_by,reported_at,resolved_at,"
                    "solution,block_interval_id,version) VALUES(?,?,?,?,?,?,?,?,?,1);");

  BindI64(st.get(), 1, r.space_id);
  BindText(st.get(), 2, r.type);
  BindText(st.get(), 3, r.description);
  BindI64(st.get(), 4, static_cast<int>(r.status));
  BindOptI64(st.get(), 5, r.reported_by);
  BindTime(st.get(), 6, r.reported_at);
  BindOptTime(st.get(), 7, r.resolved_at);
  BindText(st.get(), 8, r.solution);
  BindOptI64(st.get(), 9, r.block_interval_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id      = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  r.version = 1;
  return Result::Ok();
}

std::optional<model::IncidentRecord> SqliteRepository::GetIncident(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kIncidentColumns + " FROM incidents WHERE id=?;");
  BindI64(st.get(), 1, id);

  auto rows = Collect<model::IncidentRecord>(db, st.get(), ReadIncident);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqliteRepository::UpdateIncident(Transaction& t, const model::IncidentRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  auto* db = tx.Handle();

  auto st = Prepare(db,
                    "UPDATE incidents SET status=?,resolved_at=?,solution=?,block_interval_id=?,version=version+1 "
                    "WHERE id=?;");

  BindI64(st.get(), 1, static_cast<int>(r.status));
  BindOptTime(st.get(), 2, r.resolved_at);
  BindText(st.get(), 3, r.solution);
  BindOptI64(st.get(), 4, r.block_interval_id);
  BindI64(st.get(), 5, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::IncidentRecord> SqliteRepository::ListIncidents(Transaction& t, const IncidentFilter& filter) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kIncidentColumns + " FROM incidents WHERE 1=1";
  if (filter.status) sql += " AND status=?";
  if (filter.space_id) sql += " AND space_id=?";
  sql += " ORDER BY reported_at DESC, id DESC;";

  auto st  = Prepare(db, sql);
  int  idx = 1;
  if (filter.status) BindI64(st.get(), idx++, static_cast<int>(*filter.status));
  if (filter.space_id) BindI64(st.get(), idx++, *filter.space_id);

  return Collect<model::IncidentRecord>(db, st.get(), ReadIncident);
}

// ------------------------------------------------------------------
// Directory
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSpace(Transaction& t, const model::SpaceRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  auto* db = tx.Handle();

  auto st = Prepare(db,
                    "INSERT INTO spaces(id,name,type,capacity,location,active) VALUES(?,?,?,?,?,?) "
                    "ON CONFLICT(id) DO UPDATE SET name=excluded.name, type=excluded.type, capacity=excluded.capacity, "
                    "location=excluded.location, active=excluded.active;");

  BindI64(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.type);
  BindI64(st.get(), 4, r.capacity);
  BindText(st.get(), 5, r.location);
  BindI64(st.get(), 6, r.active ? 1 : 0);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SpaceRecord> SqliteRepository::GetSpace(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,name,type,capacity,location,active FROM spaces WHERE id=?;");
  BindI64(st.get(), 1, id);

  auto rows = Collect<model::SpaceRecord>(db, st.get(), ReadSpace);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::SpaceRecord> SqliteRepository::ListActiveSpaces(Transaction& t, const std::optional<std::string>& type) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT id,name,type,capacity,location,active FROM spaces WHERE active=1");
  if (type) sql += " AND type=?";
  sql += " ORDER BY id;";

  auto st = Prepare(db, sql);
  if (type) BindText(st.get(), 1, *type);

  return Collect<model::SpaceRecord>(db, st.get(), ReadSpace);
}

Result SqliteRepository::UpsertUser(Transaction& t, const model::UserRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  auto* db = tx.Handle();

  auto st = Prepare(db,
                    "INSERT INTO users(id,name,role,active) VALUES(?,?,?,?) "
                    "ON CONFLICT(id) DO UPDATE SET name=excluded.name, role=excluded.role, active=excluded.active;");

  BindI64(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.role);
  BindI64(st.get(), 4, r.active ? 1 : 0);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::UserRecord> SqliteRepository::GetUser(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,name,role,active FROM users WHERE id=?;");
  BindI64(st.get(), 1, id);

  auto rows = Collect<model::UserRecord>(db, st.get(), [](sqlite3_stmt* row) {
    model::UserRecord r;
    r.id     = ColI64(row, 0);
    r.name   = ColText(row, 1);
    r.role   = ColText(row, 2);
    r.active = sqlite3_column_int(row, 3) != 0;
    return r;
  });
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

} // namespace booking::db::sqlite
