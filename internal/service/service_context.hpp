#pragma once

#include <memory>

namespace booking::core {
class BookingManager;
class AvailabilityEngine;
class IncidentHandler;
} // namespace booking::core
namespace booking::db {
class Repository;
}

namespace booking::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<booking::core::BookingManager>     bookings;
  std::shared_ptr<booking::core::AvailabilityEngine> availability;
  std::shared_ptr<booking::core::IncidentHandler>    incidents;
  std::shared_ptr<booking::db::Repository>           repository;
};

} // namespace booking::service
