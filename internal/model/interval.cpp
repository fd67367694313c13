#include "interval.hpp"

namespace booking::model {

std::string_view ToWire(IntervalState state) {
  switch (state) {
    case IntervalState::kPending:
      return "pendiente";
    case IntervalState::kApproved:
      return "aprobada";
    case IntervalState::kRejected:
      return "rechazada";
    case IntervalState::kCancelled:
      return "cancelada";
    case IntervalState::kBlock:
      return "bloqueo";
  }
  return "desconocido";
}

std::optional<IntervalState> IntervalStateFromWire(std::string_view text) {
  if (text == "pendiente") return IntervalState::kPending;
  if (text == "aprobada") return IntervalState::kApproved;
  if (text == "rechazada") return IntervalState::kRejected;
  if (text == "cancelada") return IntervalState::kCancelled;
  if (text == "bloqueo") return IntervalState::kBlock;
  return std::nullopt;
}

std::string_view ToWire(IncidentStatus status) {
  return status == IncidentStatus::kResolved ? "resuelta" : "abierta";
}

std::optional<IncidentStatus> IncidentStatusFromWire(std::string_view text) {
  if (text == "abierta") return IncidentStatus::kOpen;
  if (text == "resuelta") return IncidentStatus::kResolved;
  return std::nullopt;
}

} // namespace booking::model
