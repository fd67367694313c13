#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: booking-engine <config.yaml> OR booking-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = booking::config::ConfigLoader::LoadFromYaml(config_path);

    booking::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = booking::factory::Build(config);

    // Register signal handlers before starting listeners to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Start listeners
    // ------------------------------------------------------------
    for (auto& server : app.servers) {
      server->Start();
    }
    BOOKING_LOG_INFO("Booking engine started", {booking::observability::IntField("listeners", static_cast<int64_t>(app.servers.size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    BOOKING_LOG_INFO("Shutting down booking engine");

    for (auto& server : app.servers) {
      server->Stop();
    }
    booking::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BOOKING_LOG_ERROR("Fatal error", {booking::observability::StringField("error", e.what())});
    booking::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
