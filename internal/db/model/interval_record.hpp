#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/interval.hpp"
#include "internal/util/time.hpp"

namespace booking::db::model {

/*
  Persistent reservation interval row.

  IMPORTANT:
  - For one space_id, rows in an occupying state (pending, approved, block)
    never overlap.
  - Blocks carry the incident that owns them and no owner user.
  - Version is bumped by every write and validated at commit by backends
    that use optimistic concurrency.
*/

struct IntervalRecord {
  int64_t id       = 0; // assigned by the repository on insert
  int64_t space_id = 0;

  std::optional<int64_t> owner_user_id;

  util::TimePoint start{};
  util::TimePoint end{};

  booking::model::IntervalState state = booking::model::IntervalState::kPending;
  booking::model::IntervalKind  kind  = booking::model::IntervalKind::kNormal;

  std::string     reason;
  util::TimePoint created_at{};

  std::optional<int64_t>         decided_by;
  std::optional<util::TimePoint> decided_at;
  std::optional<int64_t>         cancelled_by;
  std::optional<int64_t>         incident_id;

  uint64_t version = 0;
};

} // namespace booking::db::model
