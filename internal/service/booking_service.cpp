#include "booking_service.hpp"

#include "internal/core/booking_manager.hpp"
#include "internal/wire/payload.hpp"

namespace booking::service {

BookingService::BookingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

google::protobuf::Value BookingService::Create(const wire::CreateBooking& req) {
  const auto created = ctx_.bookings->Create(req.space_id, req.user_id, req.start, req.end, req.reason);

  auto resp = wire::Object();
  wire::Set(resp, "id", created.id);
  wire::Set(resp, "estado", model::ToWire(created.state));
  return resp;
}

google::protobuf::Value BookingService::Decide(const wire::DecideBooking& req) {
  const auto decided = ctx_.bookings->Decide(req.booking_id, req.outcome, req.admin_id);

  auto resp = wire::Object();
  wire::Set(resp, "updated", true);
  wire::Set(resp, "id", decided.id);
  wire::Set(resp, "estado", model::ToWire(decided.state));
  return resp;
}

google::protobuf::Value BookingService::Cancel(const wire::CancelBooking& req) {
  const auto cancelled = ctx_.bookings->Cancel(req.booking_id, req.user_id);

  auto resp = wire::Object();
  wire::Set(resp, "cancelled", true);
  wire::Set(resp, "id", cancelled.id);
  return resp;
}

google::protobuf::Value BookingService::ListByUser(const wire::ListUserBookings& req) {
  auto resp = wire::List();
  for (const auto& summary : ctx_.bookings->ListByUser(req.user_id)) {
    const auto& interval = summary.interval;

    auto entry = wire::Object();
    wire::Set(entry, "id", interval.id);
    wire::Set(entry, "espacio", summary.space_name);
    wire::Set(entry, "fecha_inicio", util::FormatDateTime(interval.start));
    wire::Set(entry, "fecha_fin", util::FormatDateTime(interval.end));
    wire::Set(entry, "estado", model::ToWire(interval.state));
    wire::Set(entry, "motivo", interval.reason);
    wire::Set(entry, "fecha_solicitud", util::FormatDateTime(interval.created_at));
    wire::Append(resp, std::move(entry));
  }
  return resp;
}

} // namespace booking::service
