#pragma once

#include <google/protobuf/struct.pb.h>

#include "internal/wire/request.hpp"
#include "service_context.hpp"

namespace booking::service {

// "incid" operations.
class IncidentService {
 public:
  explicit IncidentService(ServiceContext ctx);

  google::protobuf::Value Report(const wire::ReportIncident& req);
  google::protobuf::Value List(const wire::ListIncidents& req);
  google::protobuf::Value ApplyBlock(const wire::ApplyBlock& req);
  google::protobuf::Value Resolve(const wire::ResolveIncident& req);

 private:
  ServiceContext ctx_;
};

} // namespace booking::service
