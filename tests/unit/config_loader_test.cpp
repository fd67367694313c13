#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using booking::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "booking_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(server:
  listeners:
    - service: book
      bind_address: "127.0.0.1:5001"
    - service: incid
      bind_address: "127.0.0.1:5003"
  io_timeout_ms: 1500
database:
  sqlite:
    path: "/tmp/booking \"quoted\".db"
logging:
  level: debug
calendar:
  open_hour: 7
directory:
  spaces:
    - id: 5
      name: "Auditorio"
      type: auditorio
      capacity: 200
      active: false
  users:
    - id: 2
      name: Ana
      role: estudiante
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().listeners_size() == 2);
  assert(config.server().listeners(1).service() == "incid");
  assert(config.server().io_timeout_ms() == 1500);
  assert(config.server().max_connections() == 64);
  assert(config.database().sqlite().path() == "/tmp/booking \"quoted\".db");
  assert(config.database().sqlite().pool_size() == 4);
  assert(config.logging().level() == "debug");
  assert(config.calendar().open_hour() == 7);
  assert(config.calendar().close_hour() == 22);
  assert(config.calendar().default_duration_hours() == 1);
  assert(config.directory().spaces(0).id() == 5);
  assert(config.directory().spaces(0).has_active() && !config.directory().spaces(0).active());
  assert(!config.directory().users(0).has_active());
}

void TestEmptyDocumentUsesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.database().has_memory());
  assert(config.server().io_timeout_ms() == 30000);
  assert(config.server().max_frame_bytes() == 99999 + 5);
  assert(config.calendar().open_hour() == 8);
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(directory:
  spaces:
    - id: 1
      name: "101"
)");
  assert(config.directory().spaces(0).name() == "101");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
  assert(Rejects("server:\n  bind_address: \"0.0.0.0:1\"\n"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("server:\n  listeners:\n    - service: nope\n      bind_address: \"a:1\"\n"));
  assert(Rejects("server:\n  listeners:\n    - service: book\n      bind_address: \"a:1\"\n"
                 "    - service: book\n      bind_address: \"a:2\"\n"));
  assert(Rejects("calendar:\n  open_hour: 22\n  close_hour: 8\n"));
  assert(Rejects("database:\n  sqlite:\n    pool_size: 2\n"));
  assert(Rejects("- just\n- a list\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/booking-engine.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentUsesDefaults();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "booking_engine_unit_config_loader: pass\n";
  return 0;
}
