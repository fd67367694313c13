#pragma once

#include <google/protobuf/struct.pb.h>

#include "internal/wire/request.hpp"
#include "service_context.hpp"

namespace booking::service {

// "book" operations: request struct in, response payload out.
class BookingService {
 public:
  explicit BookingService(ServiceContext ctx);

  google::protobuf::Value Create(const wire::CreateBooking& req);
  google::protobuf::Value Decide(const wire::DecideBooking& req);
  google::protobuf::Value Cancel(const wire::CancelBooking& req);
  google::protobuf::Value ListByUser(const wire::ListUserBookings& req);

 private:
  ServiceContext ctx_;
};

} // namespace booking::service
