#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/availability_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/runtime/router.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/service_context.hpp"

namespace booking::factory {

/*
  Application

  Owns all long-lived objects of the engine process.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  service::ServiceContext                       services;
  std::shared_ptr<runtime::Router>              router;
  std::vector<std::unique_ptr<runtime::Server>> servers;
};

// Memory or SQLite repository from config.database; SQLite schema is bootstrapped.
std::shared_ptr<db::Repository> BuildRepository(const booking::runtime::config::RuntimeConfig& config);

// Upserts the configured spaces and users in one unit.
void SeedDirectory(db::Repository& repository, const booking::runtime::config::DirectoryConfig& directory);

core::CalendarOptions CalendarOptionsFrom(const booking::runtime::config::CalendarConfig& calendar);

// Core components sharing one space lock table.
service::ServiceContext BuildServices(std::shared_ptr<db::Repository> repository, const core::CalendarOptions& calendar);

/*
  Build

  Composition root: the only place that knows concrete repository types.
  Servers are constructed but not started.
*/
Application Build(const booking::runtime::config::RuntimeConfig& config);

} // namespace booking::factory
