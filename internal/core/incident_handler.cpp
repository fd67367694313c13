#include "incident_handler.hpp"

#include <map>
#include <mutex>

#include "internal/core/unit_of_work.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace booking::core {

using booking::model::IncidentStatus;
using booking::model::IntervalKind;
using booking::model::IntervalState;

namespace {

std::string Describe(int64_t id) {
  return "incident " + std::to_string(id);
}

} // namespace

IncidentHandler::IncidentHandler(std::shared_ptr<db::Repository> repository, std::shared_ptr<SpaceLockTable> locks)
    : repository_(std::move(repository)), locks_(std::move(locks)), resolver_(repository_) {
}

db::model::IncidentRecord IncidentHandler::Report(int64_t space_id, const std::string& type,
                                                  const std::string& description, std::optional<int64_t> reported_by) {
  auto incident = RunUnit(*repository_, false, [&](db::Transaction& tx) {
    const auto space = repository_->GetSpace(tx, space_id);
    if (!space || !space->active) {
      throw util::NotFound("space " + std::to_string(space_id) + " not found");
    }

    db::model::IncidentRecord record;
    record.space_id    = space_id;
    record.type        = type;
    record.description = description;
    record.status      = IncidentStatus::kOpen;
    record.reported_by = reported_by;
    record.reported_at = util::Now();

    ThrowIfDbError(repository_->InsertIncident(tx, record), "insert incident");
    return record;
  });

  BOOKING_LOG_INFO("incident reported", {observability::IntField("incident_id", incident.id),
                                         observability::IntField("space_id", space_id),
                                         observability::StringField("type", type)});
  return incident;
}

std::vector<IncidentSummary> IncidentHandler::List(const db::IncidentFilter& filter) {
  return RunUnit(*repository_, true, [&](db::Transaction& tx) {
    std::vector<IncidentSummary>   out;
    std::map<int64_t, std::string> names;

    for (auto& incident : repository_->ListIncidents(tx, filter)) {
      auto it = names.find(incident.space_id);
      if (it == names.end()) {
        const auto space = repository_->GetSpace(tx, incident.space_id);
        it              = names.emplace(incident.space_id, space ? space->name : std::string()).first;
      }
      out.push_back({std::move(incident), it->second});
    }
    return out;
  });
}

int64_t IncidentHandler::SpaceOf(int64_t incident_id) {
  return RunUnit(*repository_, true, [&](db::Transaction& tx) {
    const auto incident = repository_->GetIncident(tx, incident_id);
    if (!incident) {
      throw util::NotFound(Describe(incident_id) + " not found");
    }
    return incident->space_id;
  });
}

BlockOutcome IncidentHandler::ApplyBlock(int64_t incident_id, util::TimePoint start, util::TimePoint end) {
  if (end <= start) {
    throw util::InvalidRange("end must be after start");
  }

  // An incident never changes space, so the space read outside the lock is stable.
  const auto                  space_id    = SpaceOf(incident_id);
  auto                        space_mutex = locks_->Get(space_id);
  std::lock_guard<std::mutex> space_lock(*space_mutex);

  auto outcome = RunUnit(*repository_, false, [&](db::Transaction& tx) {
    auto incident = repository_->GetIncident(tx, incident_id);
    if (!incident) {
      throw util::NotFound(Describe(incident_id) + " not found");
    }
    if (incident->status == IncidentStatus::kResolved) {
      throw util::InvalidState(Describe(incident_id) + " is already resolved");
    }
    if (incident->block_interval_id) {
      throw util::InvalidState(Describe(incident_id) + " already blocks its space");
    }

    BlockOutcome out;
    auto         overlapping = resolver_.FindConflicts(tx, space_id, start, end);
    for (const auto& interval : overlapping) {
      if (interval.kind == IntervalKind::kBlock) {
        throw util::SlotUnavailable("space " + std::to_string(space_id) + " is already blocked in that range");
      }
    }

    for (auto& interval : overlapping) {
      auto cancelled  = interval;
      cancelled.state = IntervalState::kCancelled;
      ThrowIfDbError(repository_->TransitionInterval(tx, cancelled, interval.state),
                     "cascade cancel of booking " + std::to_string(interval.id));
      out.cancelled.push_back(std::move(interval));
    }

    db::model::IntervalRecord block;
    block.space_id    = space_id;
    block.start       = start;
    block.end         = end;
    block.state       = IntervalState::kBlock;
    block.kind        = IntervalKind::kBlock;
    block.reason      = incident->type + ": " + incident->description;
    block.created_at  = util::Now();
    block.incident_id = incident_id;
    ThrowIfDbError(repository_->InsertInterval(tx, block), "insert block");

    incident->block_interval_id = block.id;
    ThrowIfDbError(repository_->UpdateIncident(tx, *incident), Describe(incident_id));

    out.incident = std::move(*incident);
    out.block    = std::move(block);
    return out;
  });

  BOOKING_LOG_INFO("block applied", {observability::IntField("incident_id", incident_id),
                                     observability::IntField("space_id", space_id),
                                     observability::IntField("block_id", outcome.block.id),
                                     observability::IntField("cancelled", static_cast<int64_t>(outcome.cancelled.size()))});
  for (const auto& booking : outcome.cancelled) {
    BOOKING_LOG_INFO("booking cancelled by incident",
                     {observability::IntField("booking_id", booking.id),
                      observability::IntField("user_id", booking.owner_user_id.value_or(0)),
                      observability::IntField("incident_id", incident_id),
                      observability::StringField("start", util::FormatDateTime(booking.start))});
  }
  return outcome;
}

ResolveOutcome IncidentHandler::Resolve(int64_t incident_id, const std::string& solution) {
  const auto                  space_id    = SpaceOf(incident_id);
  auto                        space_mutex = locks_->Get(space_id);
  std::lock_guard<std::mutex> space_lock(*space_mutex);

  auto outcome = RunUnit(*repository_, false, [&](db::Transaction& tx) {
    auto incident = repository_->GetIncident(tx, incident_id);
    if (!incident) {
      throw util::NotFound(Describe(incident_id) + " not found");
    }

    const auto blocks = repository_->ListBlocksByIncident(tx, incident_id);
    for (const auto& block : blocks) {
      ThrowIfDbError(repository_->DeleteInterval(tx, block.id), "delete block " + std::to_string(block.id));
    }

    const bool first_resolution = incident->status == IncidentStatus::kOpen;
    if (first_resolution || incident->block_interval_id) {
      if (first_resolution) {
        incident->status      = IncidentStatus::kResolved;
        incident->resolved_at = util::Now();
        incident->solution    = solution;
      }
      incident->block_interval_id.reset();
      ThrowIfDbError(repository_->UpdateIncident(tx, *incident), Describe(incident_id));
    }

    ResolveOutcome out;
    out.incident = std::move(*incident);
    out.released = !blocks.empty();
    return out;
  });

  BOOKING_LOG_INFO("incident resolved", {observability::IntField("incident_id", incident_id),
                                         observability::IntField("space_id", space_id),
                                         observability::BoolField("released", outcome.released)});
  return outcome;
}

} // namespace booking::core
