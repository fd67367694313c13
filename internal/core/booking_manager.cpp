#include "booking_manager.hpp"

#include <map>
#include <mutex>

#include "internal/core/unit_of_work.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace booking::core {

using booking::model::IntervalKind;
using booking::model::IntervalState;

namespace {

constexpr const char* kAdminRole = "admin";

std::string Describe(int64_t id) {
  return "booking " + std::to_string(id);
}

} // namespace

BookingManager::BookingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<SpaceLockTable> locks)
    : repository_(std::move(repository)), locks_(std::move(locks)), resolver_(repository_) {
}

db::model::IntervalRecord BookingManager::Create(int64_t space_id, int64_t owner_user_id, util::TimePoint start,
                                                 util::TimePoint end, const std::string& reason) {
  if (end <= start) {
    throw util::InvalidRange("end must be after start");
  }

  // Unknown spaces never reach the lock table.
  RunUnit(*repository_, true, [&](db::Transaction& tx) {
    const auto space = repository_->GetSpace(tx, space_id);
    if (!space || !space->active) {
      throw util::NotFound("space " + std::to_string(space_id) + " not found");
    }
  });

  auto                        space_mutex = locks_->Get(space_id);
  std::lock_guard<std::mutex> space_lock(*space_mutex);

  auto created = RunUnit(*repository_, false, [&](db::Transaction& tx) {
    const auto user = repository_->GetUser(tx, owner_user_id);
    if (!user || !user->active) {
      throw util::NotFound("user " + std::to_string(owner_user_id) + " not found");
    }
    const auto space = repository_->GetSpace(tx, space_id);
    if (!space || !space->active) {
      throw util::NotFound("space " + std::to_string(space_id) + " not found");
    }

    if (resolver_.HasConflict(tx, space_id, start, end)) {
      throw util::SlotUnavailable("space " + std::to_string(space_id) + " is already taken in that range");
    }

    db::model::IntervalRecord record;
    record.space_id      = space_id;
    record.owner_user_id = owner_user_id;
    record.start         = start;
    record.end           = end;
    record.state         = IntervalState::kPending;
    record.kind          = IntervalKind::kNormal;
    record.reason        = reason;
    record.created_at    = util::Now();

    ThrowIfDbError(repository_->InsertInterval(tx, record), "insert booking");
    return record;
  });

  BOOKING_LOG_INFO("booking created", {observability::IntField("booking_id", created.id),
                                       observability::IntField("space_id", space_id),
                                       observability::IntField("user_id", owner_user_id),
                                       observability::StringField("start", util::FormatDateTime(start)),
                                       observability::StringField("end", util::FormatDateTime(end))});
  return created;
}

db::model::IntervalRecord BookingManager::Decide(int64_t interval_id, IntervalState outcome, int64_t decided_by) {
  if (outcome != IntervalState::kApproved && outcome != IntervalState::kRejected) {
    throw util::InvalidState("a decision is either approved or rejected");
  }

  auto decided = Transition(interval_id, outcome, decided_by);

  BOOKING_LOG_INFO("booking decided", {observability::IntField("booking_id", interval_id),
                                       observability::StringField("state", model::ToWire(outcome)),
                                       observability::IntField("admin_id", decided_by)});
  return decided;
}

db::model::IntervalRecord BookingManager::Cancel(int64_t interval_id, int64_t requested_by) {
  auto cancelled = Transition(interval_id, IntervalState::kCancelled, requested_by);

  BOOKING_LOG_INFO("booking cancelled", {observability::IntField("booking_id", interval_id),
                                         observability::IntField("requested_by", requested_by)});
  return cancelled;
}

db::model::IntervalRecord BookingManager::Transition(int64_t interval_id, IntervalState target, int64_t actor) {
  return RunUnit(*repository_, false, [&](db::Transaction& tx) {
    auto current = repository_->GetInterval(tx, interval_id);
    if (!current || current->kind != IntervalKind::kNormal) {
      throw util::NotFound(Describe(interval_id) + " not found");
    }
    if (target == IntervalState::kCancelled && current->owner_user_id != actor) {
      const auto user = repository_->GetUser(tx, actor);
      if (!user || !user->active || user->role != kAdminRole) {
        throw util::NotFound(Describe(interval_id) + " not found or not owned by user " + std::to_string(actor));
      }
    }
    if (!model::CanTransition(current->state, target)) {
      throw util::InvalidState(Describe(interval_id) + " is " + std::string(model::ToWire(current->state)) +
                               ", cannot become " + std::string(model::ToWire(target)));
    }

    auto updated  = *current;
    updated.state = target;
    if (target == IntervalState::kCancelled) {
      updated.cancelled_by = actor;
    } else {
      updated.decided_by = actor;
      updated.decided_at = util::Now();
    }

    ThrowIfDbError(repository_->TransitionInterval(tx, updated, current->state), Describe(interval_id));
    return updated;
  });
}

std::vector<BookingSummary> BookingManager::ListByUser(int64_t user_id) {
  return RunUnit(*repository_, true, [&](db::Transaction& tx) {
    std::vector<BookingSummary>    out;
    std::map<int64_t, std::string> names;

    for (auto& interval : repository_->ListByOwner(tx, user_id)) {
      auto it = names.find(interval.space_id);
      if (it == names.end()) {
        const auto space = repository_->GetSpace(tx, interval.space_id);
        it              = names.emplace(interval.space_id, space ? space->name : std::string()).first;
      }
      out.push_back({std::move(interval), it->second});
    }
    return out;
  });
}

} // namespace booking::core
