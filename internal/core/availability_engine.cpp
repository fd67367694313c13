#include "availability_engine.hpp"

#include "internal/core/unit_of_work.hpp"
#include "internal/util/errors.hpp"

namespace booking::core {

AvailabilityEngine::AvailabilityEngine(std::shared_ptr<db::Repository> repository, CalendarOptions options)
    : repository_(std::move(repository)), resolver_(repository_), options_(options) {
}

std::vector<SpaceAvailability> AvailabilityEngine::CheckAvailability(util::Date date,
                                                                     std::optional<std::chrono::minutes> time,
                                                                     std::optional<int> duration_hours,
                                                                     const std::optional<std::string>& space_type) {
  const int hours = duration_hours.value_or(options_.default_duration_hours);
  if (hours <= 0) {
    throw util::InvalidRange("duration must be at least one hour");
  }

  const auto offset = time.value_or(std::chrono::hours(options_.open_hour));
  const auto start  = util::TimePoint(date) + offset;
  const auto end    = start + std::chrono::hours(hours);

  return RunUnit(*repository_, true, [&](db::Transaction& tx) {
    std::vector<SpaceAvailability> out;
    for (auto& space : repository_->ListActiveSpaces(tx, space_type)) {
      const bool available = !resolver_.HasConflict(tx, space.id, start, end);
      out.push_back({std::move(space), available});
    }
    return out;
  });
}

DayCalendar AvailabilityEngine::Calendar(int64_t space_id, util::Date date) {
  const auto day_open  = util::TimePoint(date) + std::chrono::hours(options_.open_hour);
  const auto day_close = util::TimePoint(date) + std::chrono::hours(options_.close_hour);

  return RunUnit(*repository_, true, [&](db::Transaction& tx) {
    auto space = repository_->GetSpace(tx, space_id);
    if (!space || !space->active) {
      throw util::NotFound("space " + std::to_string(space_id) + " not found");
    }

    DayCalendar calendar;
    calendar.space = std::move(*space);
    calendar.date  = date;

    const auto occupying = resolver_.FindConflicts(tx, space_id, day_open, day_close);
    for (auto slot_start = day_open; slot_start < day_close; slot_start += std::chrono::hours(1)) {
      CalendarSlot slot;
      slot.start = slot_start;
      for (const auto& interval : occupying) {
        if (interval.start <= slot_start && slot_start < interval.end) {
          slot.available = false;
          slot.occupant  = interval;
          break;
        }
      }
      calendar.slots.push_back(std::move(slot));
    }
    return calendar;
  });
}

} // namespace booking::core
