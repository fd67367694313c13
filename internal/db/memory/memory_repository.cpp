#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace booking::db::memory {

using booking::model::IntervalKind;
using booking::model::IntervalState;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginReadOnly() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static Result ReadOnlyError() {
  return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
}

// ------------------------------------------------------------------
// Intervals
// ------------------------------------------------------------------

Result MemoryRepository::InsertInterval(Transaction& t, model::IntervalRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  r.id      = next_interval_id_.fetch_add(1);
  r.version = 1;
  tx.TouchInterval(r.id).intervals[r.id] = r;
  return Result::Ok();
}

std::optional<model::IntervalRecord> MemoryRepository::GetInterval(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.intervals.find(id);
  if (it == s.intervals.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::TransitionInterval(Transaction& t, const model::IntervalRecord& r, IntervalState expected) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto& s  = tx.TouchInterval(r.id);
  auto  it = s.intervals.find(r.id);
  if (it == s.intervals.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.state != expected) return Result::Err(ErrorCode::Conflict, "interval state changed");

  const auto version = it->second.version;
  it->second         = r;
  it->second.version = version + 1;
  return Result::Ok();
}

Result MemoryRepository::DeleteInterval(Transaction& t, int64_t id) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  tx.TouchInterval(id).intervals.erase(id);
  return Result::Ok();
}

std::vector<model::IntervalRecord> MemoryRepository::ListOccupying(Transaction& t, int64_t space_id, util::TimePoint start,
                                                                   util::TimePoint end) {
  std::vector<model::IntervalRecord> out;
  for (const auto& [_, r] : TX(t).View().intervals) {
    if (r.space_id == space_id && booking::model::IsOccupying(r.state) &&
        booking::model::Overlaps(r.start, r.end, start, end)) {
      out.push_back(r);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.start < b.start; });
  return out;
}

std::vector<model::IntervalRecord> MemoryRepository::ListByOwner(Transaction& t, int64_t owner_user_id) {
  std::vector<model::IntervalRecord> out;
  for (const auto& [_, r] : TX(t).View().intervals) {
    if (r.kind == IntervalKind::kNormal && r.owner_user_id == owner_user_id) {
      out.push_back(r);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id > b.id;
  });
  return out;
}

std::vector<model::IntervalRecord> MemoryRepository::ListBlocksByIncident(Transaction& t, int64_t incident_id) {
  std::vector<model::IntervalRecord> out;
  for (const auto& [_, r] : TX(t).View().intervals) {
    if (r.kind == IntervalKind::kBlock && r.incident_id == incident_id) {
      out.push_back(r);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Incidents
// ------------------------------------------------------------------

Result MemoryRepository::InsertIncident(Transaction& t, model::IncidentRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  r.id      = next_incident_id_.fetch_add(1);
  r.version = 1;
  tx.TouchIncident(r.id).incidents[r.id] = r;
  return Result::Ok();
}

std::optional<model::IncidentRecord> MemoryRepository::GetIncident(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.incidents.find(id);
  if (it == s.incidents.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateIncident(Transaction& t, const model::IncidentRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto& s  = tx.TouchIncident(r.id);
  auto  it = s.incidents.find(r.id);
  if (it == s.incidents.end()) return Result::Err(ErrorCode::NotFound);

  const auto version = it->second.version;
  it->second         = r;
  it->second.version = version + 1;
  return Result::Ok();
}

std::vector<model::IncidentRecord> MemoryRepository::ListIncidents(Transaction& t, const IncidentFilter& filter) {
  std::vector<model::IncidentRecord> out;
  for (const auto& [_, r] : TX(t).View().incidents) {
    if (filter.status && r.status != *filter.status) continue;
    if (filter.space_id && r.space_id != *filter.space_id) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.reported_at != b.reported_at) return a.reported_at > b.reported_at;
    return a.id > b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// Directory
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSpace(Transaction& t, const model::SpaceRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  tx.TouchSpace(r.id).spaces[r.id] = r;
  return Result::Ok();
}

std::optional<model::SpaceRecord> MemoryRepository::GetSpace(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.spaces.find(id);
  if (it == s.spaces.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SpaceRecord> MemoryRepository::ListActiveSpaces(Transaction& t, const std::optional<std::string>& type) {
  std::vector<model::SpaceRecord> out;
  for (const auto& [_, r] : TX(t).View().spaces) {
    if (!r.active) continue;
    if (type && r.type != *type) continue;
    out.push_back(r);
  }
  return out;
}

Result MemoryRepository::UpsertUser(Transaction& t, const model::UserRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  tx.TouchUser(r.id).users[r.id] = r;
  return Result::Ok();
}

std::optional<model::UserRecord> MemoryRepository::GetUser(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.users.find(id);
  if (it == s.users.end()) return std::nullopt;
  return it->second;
}

} // namespace booking::db::memory
