#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/util/time.hpp"

namespace booking::model {

enum class IntervalState : std::uint8_t {
  kPending   = 1,
  kApproved  = 2,
  kRejected  = 3,
  kCancelled = 4,
  kBlock     = 5,
};

enum class IntervalKind : std::uint8_t {
  kNormal = 1,
  kBlock  = 2,
};

enum class IncidentStatus : std::uint8_t {
  kOpen     = 1,
  kResolved = 2,
};

// States that hold a space: at most one such interval may cover any instant.
constexpr bool IsOccupying(IntervalState state) {
  return state == IntervalState::kPending || state == IntervalState::kApproved || state == IntervalState::kBlock;
}

// Half-open [start, end): touching boundaries do not overlap.
constexpr bool Overlaps(util::TimePoint a_start, util::TimePoint a_end, util::TimePoint b_start, util::TimePoint b_end) {
  return a_start < b_end && b_start < a_end;
}

// Wire vocabulary.
std::string_view              ToWire(IntervalState state);
std::optional<IntervalState>  IntervalStateFromWire(std::string_view text);
std::string_view              ToWire(IncidentStatus status);
std::optional<IncidentStatus> IncidentStatusFromWire(std::string_view text);

} // namespace booking::model
