#include "request.hpp"

#include <algorithm>
#include <vector>

#include "internal/wire/frame_codec.hpp"
#include "internal/wire/payload.hpp"

namespace booking::wire {

namespace {

using google::protobuf::Value;

constexpr std::string_view kActionKey = "accion";

struct Shape {
  std::string_view              action;
  std::vector<std::string_view> required;
  std::vector<std::string_view> optional;
  Request (*parse)(const Value& payload);
};

// ------------------------------------------------------------------
// Field readers
// ------------------------------------------------------------------

int64_t RequireId(const Value& payload, std::string_view key) {
  auto id = GetInt(payload, key);
  if (!id) {
    throw RequestError("missing '" + std::string(key) + "'");
  }
  if (*id <= 0) {
    throw RequestError("'" + std::string(key) + "' must be a positive id");
  }
  return *id;
}

std::optional<int64_t> OptionalId(const Value& payload, std::string_view key) {
  if (!Has(payload, key)) {
    return std::nullopt;
  }
  return RequireId(payload, key);
}

std::string RequireString(const Value& payload, std::string_view key) {
  auto text = GetString(payload, key);
  if (!text) {
    throw RequestError("missing '" + std::string(key) + "'");
  }
  return *text;
}

util::TimePoint RequireDateTime(const Value& payload, std::string_view key) {
  const auto text = RequireString(payload, key);
  auto       tp   = util::ParseDateTime(text);
  if (!tp) {
    throw RequestError("'" + std::string(key) + "' must be YYYY-MM-DDTHH:MM, got '" + text + "'");
  }
  return *tp;
}

util::Date RequireDate(const Value& payload, std::string_view key) {
  const auto text = RequireString(payload, key);
  auto       date = util::ParseDate(text);
  if (!date) {
    throw RequestError("'" + std::string(key) + "' must be YYYY-MM-DD, got '" + text + "'");
  }
  return *date;
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

Request ParseCreate(const Value& payload) {
  CreateBooking request;
  request.user_id  = RequireId(payload, "user");
  request.space_id = RequireId(payload, "space");
  request.start    = RequireDateTime(payload, "inicio");
  request.end      = RequireDateTime(payload, "fin");
  request.reason   = GetString(payload, "motivo").value_or("");
  return request;
}

Request ParseDecide(const Value& payload) {
  DecideBooking request;
  request.booking_id = RequireId(payload, "reserva");
  request.admin_id   = RequireId(payload, "admin");

  const auto word  = RequireString(payload, "estado");
  const auto state = model::IntervalStateFromWire(word);
  if (!state || (*state != model::IntervalState::kApproved && *state != model::IntervalState::kRejected)) {
    throw RequestError("'estado' must be aprobada or rechazada, got '" + word + "'");
  }
  request.outcome = *state;
  return request;
}

Request ParseCancel(const Value& payload) {
  CancelBooking request;
  request.booking_id = RequireId(payload, "reserva");
  request.user_id    = RequireId(payload, "user");
  return request;
}

Request ParseListUser(const Value& payload) {
  ListUserBookings request;
  request.user_id = RequireId(payload, "user");
  return request;
}

Request ParseCheck(const Value& payload) {
  CheckAvailability request;
  request.date = RequireDate(payload, "fecha");

  if (auto text = GetString(payload, "hora")) {
    auto time = util::ParseClock(*text);
    if (!time) {
      throw RequestError("'hora' must be HH:MM, got '" + *text + "'");
    }
    request.time = *time;
  }
  if (auto hours = GetInt(payload, "duracion")) {
    if (*hours > 24 || *hours < -24) {
      throw RequestError("'duracion' must be a number of hours within a day");
    }
    request.duration_hours = static_cast<int>(*hours);
  }
  request.space_type = GetString(payload, "tipo");
  return request;
}

Request ParseCalendar(const Value& payload) {
  GetCalendar request;
  request.space_id = RequireId(payload, "space");
  request.date     = RequireDate(payload, "fecha");
  return request;
}

Request ParseReport(const Value& payload) {
  ReportIncident request;
  request.space_id    = RequireId(payload, "space");
  request.type        = RequireString(payload, "tipo");
  request.description = RequireString(payload, "descripcion");
  request.reported_by = OptionalId(payload, "user");
  if (!IsIncidentType(request.type)) {
    throw RequestError("'tipo' must be one of mantencion, averia, limpieza, otro");
  }
  return request;
}

Request ParseListIncidents(const Value& payload) {
  ListIncidents request;
  if (auto word = GetString(payload, "estado")) {
    request.status = model::IncidentStatusFromWire(*word);
    if (!request.status) {
      throw RequestError("'estado' must be abierta or resuelta, got '" + *word + "'");
    }
  }
  request.space_id = OptionalId(payload, "space");
  return request;
}

Request ParseApplyBlock(const Value& payload) {
  ApplyBlock request;
  request.incident_id = RequireId(payload, "incidencia");
  request.start       = RequireDateTime(payload, "inicio");
  request.end         = RequireDateTime(payload, "fin");
  return request;
}

Request ParseResolve(const Value& payload) {
  ResolveIncident request;
  request.incident_id = RequireId(payload, "incidencia");
  request.solution    = GetString(payload, "solucion").value_or("");
  return request;
}

// ------------------------------------------------------------------
// Shape tables, pairwise disjoint within a tag
// ------------------------------------------------------------------

const std::vector<Shape>& BookingShapes() {
  static const std::vector<Shape> kShapes = {
      {"crear", {"user", "space", "inicio", "fin"}, {"motivo"}, &ParseCreate},
      {"decidir", {"reserva", "estado", "admin"}, {}, &ParseDecide},
      {"cancelar", {"reserva", "user"}, {}, &ParseCancel},
      {"listar", {"user"}, {}, &ParseListUser},
  };
  return kShapes;
}

const std::vector<Shape>& AvailabilityShapes() {
  static const std::vector<Shape> kShapes = {
      {"consultar", {"fecha"}, {"hora", "duracion", "tipo"}, &ParseCheck},
      {"calendario", {"space", "fecha"}, {}, &ParseCalendar},
  };
  return kShapes;
}

const std::vector<Shape>& IncidentShapes() {
  static const std::vector<Shape> kShapes = {
      {"reportar", {"space", "tipo", "descripcion"}, {"user"}, &ParseReport},
      {"listar", {}, {"estado", "space"}, &ParseListIncidents},
      {"bloquear", {"incidencia", "inicio", "fin"}, {}, &ParseApplyBlock},
      {"resolver", {"incidencia"}, {"solucion"}, &ParseResolve},
  };
  return kShapes;
}

const std::vector<Shape>& ShapesFor(const std::string& tag) {
  if (tag == kBookingTag) return BookingShapes();
  if (tag == kAvailabilityTag) return AvailabilityShapes();
  if (tag == kIncidentTag) return IncidentShapes();
  throw RequestError("unknown service '" + tag + "'");
}

bool Contains(const std::vector<std::string_view>& keys, std::string_view key) {
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

// Keys present with a non-null value, excluding the action selector.
std::vector<std::string> PresentKeys(const Value& payload) {
  std::vector<std::string> keys;
  for (const auto& [key, value] : payload.struct_value().fields()) {
    if (key == kActionKey || value.kind_case() == Value::kNullValue) continue;
    keys.push_back(key);
  }
  return keys;
}

bool Matches(const Shape& shape, const std::vector<std::string>& keys) {
  for (auto required : shape.required) {
    if (std::find(keys.begin(), keys.end(), required) == keys.end()) return false;
  }
  for (const auto& key : keys) {
    if (!Contains(shape.required, key) && !Contains(shape.optional, key)) return false;
  }
  return true;
}

const Shape& SelectByAction(const std::vector<Shape>& shapes, const std::string& action,
                            const std::vector<std::string>& keys) {
  for (const auto& shape : shapes) {
    if (shape.action != action) continue;
    for (const auto& key : keys) {
      if (!Contains(shape.required, key) && !Contains(shape.optional, key)) {
        throw RequestError("unexpected key '" + key + "' for action '" + action + "'");
      }
    }
    return shape;
  }
  throw RequestError("unrecognized action '" + action + "'");
}

const Shape& SelectByShape(const std::vector<Shape>& shapes, const std::vector<std::string>& keys) {
  const Shape* selected = nullptr;
  for (const auto& shape : shapes) {
    if (!Matches(shape, keys)) continue;
    if (selected) {
      throw RequestError("ambiguous request: matches both '" + std::string(selected->action) + "' and '" +
                         std::string(shape.action) + "'");
    }
    selected = &shape;
  }
  if (!selected) {
    throw RequestError("unrecognized action");
  }
  return *selected;
}

} // namespace

Request ParseRequest(std::string_view tag, const google::protobuf::Value& payload) {
  const auto  service = TrimTag(tag);
  const auto& shapes  = ShapesFor(service);

  if (payload.kind_case() != Value::kStructValue) {
    throw RequestError("payload must be a JSON object");
  }

  const auto keys = PresentKeys(payload);
  if (auto action = GetString(payload, kActionKey)) {
    return SelectByAction(shapes, *action, keys).parse(payload);
  }
  return SelectByShape(shapes, keys).parse(payload);
}

std::string_view RouteName(const Request& request) {
  struct Namer {
    std::string_view operator()(const CreateBooking&) const { return "book.create"; }
    std::string_view operator()(const DecideBooking&) const { return "book.decide"; }
    std::string_view operator()(const CancelBooking&) const { return "book.cancel"; }
    std::string_view operator()(const ListUserBookings&) const { return "book.list"; }
    std::string_view operator()(const CheckAvailability&) const { return "avail.check"; }
    std::string_view operator()(const GetCalendar&) const { return "avail.calendar"; }
    std::string_view operator()(const ReportIncident&) const { return "incid.report"; }
    std::string_view operator()(const ListIncidents&) const { return "incid.list"; }
    std::string_view operator()(const ApplyBlock&) const { return "incid.block"; }
    std::string_view operator()(const ResolveIncident&) const { return "incid.resolve"; }
  };
  return std::visit(Namer{}, request);
}

bool IsKnownService(std::string_view tag) {
  const auto service = TrimTag(tag);
  return service == kBookingTag || service == kAvailabilityTag || service == kIncidentTag;
}

bool IsIncidentType(std::string_view type) {
  return type == "mantencion" || type == "averia" || type == "limpieza" || type == "otro";
}

} // namespace booking::wire
