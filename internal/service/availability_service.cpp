#include "availability_service.hpp"

#include "internal/core/availability_engine.hpp"
#include "internal/wire/payload.hpp"

namespace booking::service {

AvailabilityService::AvailabilityService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

google::protobuf::Value AvailabilityService::Check(const wire::CheckAvailability& req) {
  auto resp = wire::List();
  for (const auto& entry : ctx_.availability->CheckAvailability(req.date, req.time, req.duration_hours, req.space_type)) {
    auto item = wire::Object();
    wire::Set(item, "id", entry.space.id);
    wire::Set(item, "nombre", entry.space.name);
    wire::Set(item, "tipo", entry.space.type);
    wire::Set(item, "capacidad", static_cast<int64_t>(entry.space.capacity));
    wire::Set(item, "disponible", entry.available);
    wire::Append(resp, std::move(item));
  }
  return resp;
}

google::protobuf::Value AvailabilityService::Calendar(const wire::GetCalendar& req) {
  const auto calendar = ctx_.availability->Calendar(req.space_id, req.date);

  auto slots = wire::List();
  for (const auto& slot : calendar.slots) {
    auto item = wire::Object();
    wire::Set(item, "hora", util::FormatClock(slot.start));
    wire::Set(item, "disponible", slot.available);
    if (slot.occupant) {
      wire::Set(item, "reserva_id", slot.occupant->id);
      wire::Set(item, "estado", model::ToWire(slot.occupant->state));
      wire::Set(item, "motivo", slot.occupant->reason);
    } else {
      wire::SetNull(item, "reserva_id");
      wire::SetNull(item, "estado");
      wire::SetNull(item, "motivo");
    }
    wire::Append(slots, std::move(item));
  }

  auto resp = wire::Object();
  wire::Set(resp, "espacio", calendar.space.name);
  wire::Set(resp, "fecha", util::FormatDate(calendar.date));
  wire::Set(resp, "horarios", std::move(slots));
  return resp;
}

} // namespace booking::service
