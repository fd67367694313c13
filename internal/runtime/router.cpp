#include "router.hpp"

#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/wire/payload.hpp"
#include "internal/wire/request.hpp"
#include "internal/wire/wire_error.hpp"

namespace booking::runtime {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void LogFailure(std::string_view route, const std::exception& e, wire::ErrorKind kind) {
  const auto fields = {observability::StringField("route", route), observability::StringField("code", wire::ToString(kind)),
                       observability::StringField("error", e.what())};
  switch (kind) {
    case wire::ErrorKind::kStoreUnavailable:
    case wire::ErrorKind::kInternal:
      observability::LogError("request failed", fields);
      break;
    default:
      observability::LogInfo("request rejected", fields);
      break;
  }
}

} // namespace

Router::Router(service::ServiceContext ctx) : bookings_(ctx), availability_(ctx), incidents_(ctx) {
}

google::protobuf::Value Router::Dispatch(const wire::Request& request) {
  return std::visit(Overloaded{
                        [&](const wire::CreateBooking& r) { return bookings_.Create(r); },
                        [&](const wire::DecideBooking& r) { return bookings_.Decide(r); },
                        [&](const wire::CancelBooking& r) { return bookings_.Cancel(r); },
                        [&](const wire::ListUserBookings& r) { return bookings_.ListByUser(r); },
                        [&](const wire::CheckAvailability& r) { return availability_.Check(r); },
                        [&](const wire::GetCalendar& r) { return availability_.Calendar(r); },
                        [&](const wire::ReportIncident& r) { return incidents_.Report(r); },
                        [&](const wire::ListIncidents& r) { return incidents_.List(r); },
                        [&](const wire::ApplyBlock& r) { return incidents_.ApplyBlock(r); },
                        [&](const wire::ResolveIncident& r) { return incidents_.Resolve(r); },
                    },
                    request);
}

google::protobuf::Value Router::Handle(std::string_view listener_tag, const wire::Frame& request) {
  const auto service = wire::TrimTag(listener_tag);
  const auto tag     = wire::TrimTag(request.tag);
  if (tag != service) {
    BOOKING_LOG_INFO("request for another service",
                     {observability::StringField("listener", service), observability::StringField("tag", tag)});
    return wire::ErrorPayload(wire::ErrorKind::kWrongService, "wrong service");
  }

  std::string_view route = tag;
  try {
    const auto parsed = wire::ParseRequest(tag, request.payload);
    route             = wire::RouteName(parsed);
    return Dispatch(parsed);
  } catch (const std::exception& e) {
    const auto kind = wire::Classify(e);
    LogFailure(route, e, kind);
    return wire::ErrorPayload(e);
  }
}

std::string Router::HandleFrame(std::string_view listener_tag, const wire::Frame& request) {
  const auto response = Handle(listener_tag, request);
  try {
    return wire::Encode(listener_tag, response);
  } catch (const wire::FrameError& e) {
    BOOKING_LOG_WARN("response does not fit in a frame",
                     {observability::StringField("listener", listener_tag), observability::StringField("error", e.what())});
    return wire::Encode(listener_tag, wire::ErrorPayload(wire::ErrorKind::kInternal, "response too large"));
  }
}

} // namespace booking::runtime
