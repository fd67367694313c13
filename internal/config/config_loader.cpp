#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace booking::config {

namespace {

constexpr uint32_t kDefaultIoTimeoutMs      = 30000;
constexpr uint32_t kDefaultMaxConnections   = 64;
constexpr uint32_t kDefaultMaxFrameBytes    = 99999 + 5;
constexpr uint32_t kDefaultSqlitePoolSize   = 4;
constexpr uint32_t kDefaultSqliteBusyMs     = 5000;
constexpr uint32_t kDefaultOpenHour         = 8;
constexpr uint32_t kDefaultCloseHour        = 22;
constexpr uint32_t kDefaultDurationHours    = 1;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings ("08" is a name, not a number).
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

booking::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  booking::runtime::config::RuntimeConfig config;

  // An empty document is an all-defaults configuration.
  if (yaml.IsNull()) {
    ConfigLoader::Normalize(config);
    return config;
  }

  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Normalize(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

booking::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

booking::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Normalize(booking::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->io_timeout_ms() == 0) server->set_io_timeout_ms(kDefaultIoTimeoutMs);
  if (server->max_connections() == 0) server->set_max_connections(kDefaultMaxConnections);
  if (server->max_frame_bytes() == 0) server->set_max_frame_bytes(kDefaultMaxFrameBytes);

  std::set<std::string> seen;
  for (const auto& listener : server->listeners()) {
    const auto& service = listener.service();
    if (service != "book" && service != "avail" && service != "incid") {
      throw std::runtime_error("Invalid configuration: unknown listener service '" + service + "'");
    }
    if (listener.bind_address().empty()) {
      throw std::runtime_error("Invalid configuration: listener '" + service + "' has no bind_address");
    }
    if (!seen.insert(service).second) {
      throw std::runtime_error("Invalid configuration: duplicate listener for '" + service + "'");
    }
  }

  auto* database = config.mutable_database();
  if (database->backend_case() == booking::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_sqlite()) {
    auto* sqlite = database->mutable_sqlite();
    if (sqlite->path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
    }
    if (sqlite->pool_size() == 0) sqlite->set_pool_size(kDefaultSqlitePoolSize);
    if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(kDefaultSqliteBusyMs);
  }

  auto* calendar = config.mutable_calendar();
  if (!calendar->has_open_hour()) calendar->set_open_hour(kDefaultOpenHour);
  if (!calendar->has_close_hour()) calendar->set_close_hour(kDefaultCloseHour);
  if (!calendar->has_default_duration_hours()) calendar->set_default_duration_hours(kDefaultDurationHours);
  if (calendar->close_hour() > 24 || calendar->open_hour() >= calendar->close_hour()) {
    throw std::runtime_error("Invalid configuration: calendar requires open_hour < close_hour <= 24");
  }
  if (calendar->default_duration_hours() == 0) {
    throw std::runtime_error("Invalid configuration: calendar.default_duration_hours must be positive");
  }

  for (const auto& space : config.directory().spaces()) {
    if (space.id() <= 0 || space.name().empty()) {
      throw std::runtime_error("Invalid configuration: directory space needs a positive id and a name");
    }
  }
  for (const auto& user : config.directory().users()) {
    if (user.id() <= 0) {
      throw std::runtime_error("Invalid configuration: directory user needs a positive id");
    }
  }
}

} // namespace booking::config
