#include "incident_service.hpp"

#include "internal/core/incident_handler.hpp"
#include "internal/wire/payload.hpp"

namespace booking::service {

IncidentService::IncidentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

google::protobuf::Value IncidentService::Report(const wire::ReportIncident& req) {
  const auto incident = ctx_.incidents->Report(req.space_id, req.type, req.description, req.reported_by);

  auto resp = wire::Object();
  wire::Set(resp, "id_incidencia", incident.id);
  wire::Set(resp, "estado", model::ToWire(incident.status));
  return resp;
}

google::protobuf::Value IncidentService::List(const wire::ListIncidents& req) {
  db::IncidentFilter filter;
  filter.status   = req.status;
  filter.space_id = req.space_id;

  auto resp = wire::List();
  for (const auto& summary : ctx_.incidents->List(filter)) {
    const auto& incident = summary.incident;

    auto entry = wire::Object();
    wire::Set(entry, "id", incident.id);
    wire::Set(entry, "espacio", summary.space_name);
    wire::Set(entry, "tipo", incident.type);
    wire::Set(entry, "descripcion", incident.description);
    wire::Set(entry, "estado", model::ToWire(incident.status));
    wire::Set(entry, "fecha_reporte", util::FormatDateTime(incident.reported_at));
    wire::Set(entry, "solucion", incident.solution);
    if (incident.resolved_at) {
      wire::Set(entry, "fecha_resolucion", util::FormatDateTime(*incident.resolved_at));
    } else {
      wire::SetNull(entry, "fecha_resolucion");
    }
    wire::Append(resp, std::move(entry));
  }
  return resp;
}

google::protobuf::Value IncidentService::ApplyBlock(const wire::ApplyBlock& req) {
  const auto outcome = ctx_.incidents->ApplyBlock(req.incident_id, req.start, req.end);

  auto cancelled = wire::List();
  for (const auto& booking : outcome.cancelled) {
    auto item = wire::Object();
    wire::Set(item, "id", booking.id);
    if (booking.owner_user_id) {
      wire::Set(item, "user", *booking.owner_user_id);
    } else {
      wire::SetNull(item, "user");
    }
    wire::Append(cancelled, std::move(item));
  }

  auto resp = wire::Object();
  wire::Set(resp, "bloqueado", true);
  wire::Set(resp, "bloqueo_id", outcome.block.id);
  wire::Set(resp, "reservas_canceladas", static_cast<int64_t>(outcome.cancelled.size()));
  wire::Set(resp, "canceladas", std::move(cancelled));
  return resp;
}

google::protobuf::Value IncidentService::Resolve(const wire::ResolveIncident& req) {
  const auto outcome = ctx_.incidents->Resolve(req.incident_id, req.solution);

  auto resp = wire::Object();
  wire::Set(resp, "resuelta", true);
  wire::Set(resp, "espacio_liberado", outcome.released);
  return resp;
}

} // namespace booking::service
