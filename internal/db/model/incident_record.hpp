#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/interval.hpp"
#include "internal/util/time.hpp"

namespace booking::db::model {

/*
  Reported problem with a space.

  block_interval_id references the block row while one is applied; the row
  itself belongs to the interval table.
*/

struct IncidentRecord {
  int64_t id       = 0;
  int64_t space_id = 0;

  std::string type;
  std::string description;

  booking::model::IncidentStatus status = booking::model::IncidentStatus::kOpen;

  std::optional<int64_t>         reported_by;
  util::TimePoint                reported_at{};
  std::optional<util::TimePoint> resolved_at;
  std::string                    solution;

  std::optional<int64_t> block_interval_id;

  uint64_t version = 0;
};

} // namespace booking::db::model
