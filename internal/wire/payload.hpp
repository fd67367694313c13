#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace booking::wire {

/*
  Helpers over google.protobuf.Value payloads.

  Getters return std::nullopt for an absent or null key and throw
  RequestError when the key is present with the wrong form.
*/

google::protobuf::Value Object();
google::protobuf::Value List();

void Set(google::protobuf::Value& object, std::string_view key, std::string_view value);
void Set(google::protobuf::Value& object, std::string_view key, const char* value);
void Set(google::protobuf::Value& object, std::string_view key, int64_t value);
void Set(google::protobuf::Value& object, std::string_view key, bool value);
void Set(google::protobuf::Value& object, std::string_view key, google::protobuf::Value value);
void SetNull(google::protobuf::Value& object, std::string_view key);

void Append(google::protobuf::Value& list, google::protobuf::Value value);

bool                           Has(const google::protobuf::Value& object, std::string_view key);
const google::protobuf::Value* Find(const google::protobuf::Value& object, std::string_view key);

// JSON number with an integral value, or a string of decimal digits.
std::optional<int64_t>     GetInt(const google::protobuf::Value& object, std::string_view key);
std::optional<std::string> GetString(const google::protobuf::Value& object, std::string_view key);

std::string ToJson(const google::protobuf::Value& value);

} // namespace booking::wire
