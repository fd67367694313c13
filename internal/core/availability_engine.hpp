#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/conflict_resolver.hpp"
#include "internal/db/api/repository.hpp"

namespace booking::core {

struct CalendarOptions {
  int open_hour              = 8;
  int close_hour             = 22;
  int default_duration_hours = 1;
};

struct SpaceAvailability {
  db::model::SpaceRecord space;
  bool                   available = false;
};

struct CalendarSlot {
  util::TimePoint                          start{};
  bool                                     available = true;
  std::optional<db::model::IntervalRecord> occupant;
};

struct DayCalendar {
  db::model::SpaceRecord    space;
  util::Date                date{};
  std::vector<CalendarSlot> slots;
};

/*
  Read-only answers to "what is free".

  Every query runs in one read-only transaction and never writes.
*/
class AvailabilityEngine {
 public:
  AvailabilityEngine(std::shared_ptr<db::Repository> repository, CalendarOptions options);

  // Candidate is [date + time, + duration). time defaults to the opening hour,
  // duration to the configured default. Throws InvalidRange for a
  // non-positive duration.
  std::vector<SpaceAvailability> CheckAvailability(util::Date date, std::optional<std::chrono::minutes> time,
                                                   std::optional<int> duration_hours,
                                                   const std::optional<std::string>& space_type);

  // One slot per opening hour. A slot is taken when an occupying interval
  // covers its start instant. Throws NotFound for an absent or inactive space.
  DayCalendar Calendar(int64_t space_id, util::Date date);

  const CalendarOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  ConflictResolver                resolver_;
  CalendarOptions                 options_;
};

} // namespace booking::core
