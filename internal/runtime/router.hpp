#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/service/availability_service.hpp"
#include "internal/service/booking_service.hpp"
#include "internal/service/incident_service.hpp"
#include "internal/wire/frame_codec.hpp"

namespace booking::runtime {

/*
  Request router shared by every listener.

  Decodes the payload once into a wire::Request, dispatches it to the
  owning service and turns every failure into an error payload. Only the
  connection layer decides to drop a client; nothing thrown here escapes.
*/
class Router {
 public:
  explicit Router(service::ServiceContext ctx);

  // Response payload for one request received on the listener serving
  // listener_tag.
  google::protobuf::Value Handle(std::string_view listener_tag, const wire::Frame& request);

  // Decoded request in, encoded response frame out (tagged with listener_tag).
  std::string HandleFrame(std::string_view listener_tag, const wire::Frame& request);

 private:
  google::protobuf::Value Dispatch(const wire::Request& request);

  service::BookingService      bookings_;
  service::AvailabilityService availability_;
  service::IncidentService     incidents_;
};

} // namespace booking::runtime
