#pragma once

#include <google/protobuf/struct.pb.h>

#include "internal/wire/request.hpp"
#include "service_context.hpp"

namespace booking::service {

// "avail" operations. Read-only.
class AvailabilityService {
 public:
  explicit AvailabilityService(ServiceContext ctx);

  google::protobuf::Value Check(const wire::CheckAvailability& req);
  google::protobuf::Value Calendar(const wire::GetCalendar& req);

 private:
  ServiceContext ctx_;
};

} // namespace booking::service
