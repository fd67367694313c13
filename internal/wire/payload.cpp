#include "payload.hpp"

#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <cmath>
#include <stdexcept>

#include "internal/wire/request.hpp"

namespace booking::wire {

namespace {

// Largest magnitude a JSON double carries without losing integer precision.
constexpr double kMaxExactInteger = 9007199254740992.0;

} // namespace

google::protobuf::Value Object() {
  google::protobuf::Value value;
  value.mutable_struct_value();
  return value;
}

google::protobuf::Value List() {
  google::protobuf::Value value;
  value.mutable_list_value();
  return value;
}

void Set(google::protobuf::Value& object, std::string_view key, std::string_view value) {
  (*object.mutable_struct_value()->mutable_fields())[std::string(key)].set_string_value(std::string(value));
}

void Set(google::protobuf::Value& object, std::string_view key, const char* value) {
  Set(object, key, std::string_view(value));
}

void Set(google::protobuf::Value& object, std::string_view key, int64_t value) {
  (*object.mutable_struct_value()->mutable_fields())[std::string(key)].set_number_value(static_cast<double>(value));
}

void Set(google::protobuf::Value& object, std::string_view key, bool value) {
  (*object.mutable_struct_value()->mutable_fields())[std::string(key)].set_bool_value(value);
}

void Set(google::protobuf::Value& object, std::string_view key, google::protobuf::Value value) {
  (*object.mutable_struct_value()->mutable_fields())[std::string(key)] = std::move(value);
}

void SetNull(google::protobuf::Value& object, std::string_view key) {
  (*object.mutable_struct_value()->mutable_fields())[std::string(key)].set_null_value(
      google::protobuf::NullValue::NULL_VALUE);
}

void Append(google::protobuf::Value& list, google::protobuf::Value value) {
  *list.mutable_list_value()->add_values() = std::move(value);
}

const google::protobuf::Value* Find(const google::protobuf::Value& object, std::string_view key) {
  if (object.kind_case() != google::protobuf::Value::kStructValue) {
    return nullptr;
  }
  const auto& fields = object.struct_value().fields();
  auto        it     = fields.find(std::string(key));
  if (it == fields.end() || it->second.kind_case() == google::protobuf::Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

bool Has(const google::protobuf::Value& object, std::string_view key) {
  return Find(object, key) != nullptr;
}

std::optional<int64_t> GetInt(const google::protobuf::Value& object, std::string_view key) {
  const auto* value = Find(object, key);
  if (!value) {
    return std::nullopt;
  }

  if (value->kind_case() == google::protobuf::Value::kNumberValue) {
    const double number = value->number_value();
    if (std::trunc(number) != number || std::fabs(number) > kMaxExactInteger) {
      throw RequestError("'" + std::string(key) + "' must be an integer");
    }
    return static_cast<int64_t>(number);
  }

  if (value->kind_case() == google::protobuf::Value::kStringValue && !value->string_value().empty()) {
    const auto& text   = value->string_value();
    const auto* last   = text.data() + text.size();
    int64_t     parsed = 0;
    auto [ptr, ec]     = std::from_chars(text.data(), last, parsed);
    if (ec == std::errc() && ptr == last) {
      return parsed;
    }
  }

  throw RequestError("'" + std::string(key) + "' must be an integer");
}

std::optional<std::string> GetString(const google::protobuf::Value& object, std::string_view key) {
  const auto* value = Find(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (value->kind_case() != google::protobuf::Value::kStringValue) {
    throw RequestError("'" + std::string(key) + "' must be a string");
  }
  return value->string_value();
}

std::string ToJson(const google::protobuf::Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("cannot serialize payload: " + std::string(status.message()));
  }
  return json;
}

} // namespace booking::wire
