#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/booking_manager.hpp"
#include "internal/core/incident_handler.hpp"
#include "internal/core/space_lock_table.hpp"
#include "internal/core/unit_of_work.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"

namespace booking::factory {

std::shared_ptr<db::Repository> BuildRepository(const booking::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    auto pool = std::make_shared<db::sqlite::SqlitePool>(sqlite.path(), sqlite.pool_size(),
                                                         static_cast<int>(sqlite.busy_timeout_ms()));
    {
      auto conn = pool->Acquire();
      db::sqlite::BootstrapSchema(*conn);
    }
    BOOKING_LOG_INFO("sqlite store ready", {observability::StringField("path", sqlite.path()),
                                            observability::IntField("pool_size", sqlite.pool_size())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
  }

  BOOKING_LOG_INFO("memory store ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

void SeedDirectory(db::Repository& repository, const booking::runtime::config::DirectoryConfig& directory) {
  core::RunUnit(repository, false, [&](db::Transaction& tx) {
    for (const auto& entry : directory.spaces()) {
      db::model::SpaceRecord space;
      space.id       = entry.id();
      space.name     = entry.name();
      space.type     = entry.type();
      space.capacity = entry.capacity();
      space.location = entry.location();
      space.active   = entry.has_active() ? entry.active() : true;
      core::ThrowIfDbError(repository.UpsertSpace(tx, space), "seed space " + std::to_string(space.id));
    }
    for (const auto& entry : directory.users()) {
      db::model::UserRecord user;
      user.id     = entry.id();
      user.name   = entry.name();
      user.role   = entry.role();
      user.active = entry.has_active() ? entry.active() : true;
      core::ThrowIfDbError(repository.UpsertUser(tx, user), "seed user " + std::to_string(user.id));
    }
  });

  BOOKING_LOG_INFO("directory seeded", {observability::IntField("spaces", directory.spaces_size()),
                                        observability::IntField("users", directory.users_size())});
}

core::CalendarOptions CalendarOptionsFrom(const booking::runtime::config::CalendarConfig& calendar) {
  core::CalendarOptions options;
  if (calendar.has_open_hour()) options.open_hour = static_cast<int>(calendar.open_hour());
  if (calendar.has_close_hour()) options.close_hour = static_cast<int>(calendar.close_hour());
  if (calendar.has_default_duration_hours()) {
    options.default_duration_hours = static_cast<int>(calendar.default_duration_hours());
  }
  return options;
}

service::ServiceContext BuildServices(std::shared_ptr<db::Repository> repository, const core::CalendarOptions& calendar) {
  auto locks = std::make_shared<core::SpaceLockTable>();

  service::ServiceContext ctx;
  ctx.bookings     = std::make_shared<core::BookingManager>(repository, locks);
  ctx.availability = std::make_shared<core::AvailabilityEngine>(repository, calendar);
  ctx.incidents    = std::make_shared<core::IncidentHandler>(repository, locks);
  ctx.repository   = std::move(repository);
  return ctx;
}

Application Build(const booking::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  SeedDirectory(*app.repository, config.directory());

  // ------------------------------------------------------------------
  // Core + services
  // ------------------------------------------------------------------
  app.services = BuildServices(app.repository, CalendarOptionsFrom(config.calendar()));
  app.router   = std::make_shared<runtime::Router>(app.services);

  // ------------------------------------------------------------------
  // Listeners
  // ------------------------------------------------------------------
  const auto& server = config.server();
  if (server.listeners_size() == 0) {
    throw std::runtime_error("no listeners configured");
  }
  for (const auto& listener : server.listeners()) {
    runtime::ServerOptions options;
    options.service         = listener.service();
    options.bind_address    = listener.bind_address();
    options.io_timeout      = std::chrono::milliseconds(server.io_timeout_ms());
    options.max_connections = server.max_connections();
    options.max_frame_bytes = server.max_frame_bytes();
    app.servers.push_back(std::make_unique<runtime::Server>(std::move(options), app.router));
  }

  return app;
}

} // namespace booking::factory
