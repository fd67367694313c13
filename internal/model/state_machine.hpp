#pragma once

#include "internal/model/interval.hpp"

namespace booking::model {

/*
  Booking lifecycle for intervals of kind normal:

    pending  -> approved | rejected | cancelled
    approved -> cancelled

  Blocks never transition; they are inserted and hard-deleted.
*/

constexpr bool IsTerminal(IntervalState state) {
  return state == IntervalState::kRejected || state == IntervalState::kCancelled;
}

constexpr bool CanTransition(IntervalState from, IntervalState to) {
  if (from == IntervalState::kBlock || to == IntervalState::kBlock) {
    return false;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (from == IntervalState::kPending) {
    return to == IntervalState::kApproved || to == IntervalState::kRejected || to == IntervalState::kCancelled;
  }
  // approved
  return to == IntervalState::kCancelled;
}

} // namespace booking::model
