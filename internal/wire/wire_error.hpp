#pragma once

#include <google/protobuf/struct.pb.h>

#include <exception>
#include <string_view>

namespace booking::wire {

/*
  Converts internal exceptions into error payloads:

    {"error": <message>, "code": <kind>}                        terminal
    {"error": <message>, "code": "store_unavailable", "retryable": true}
*/

enum class ErrorKind {
  kInvalidRange,
  kSlotUnavailable,
  kNotFound,
  kInvalidState,
  kStoreUnavailable,
  kBadRequest,
  kWrongService,
  kInternal,
};

std::string_view ToString(ErrorKind kind);

ErrorKind Classify(const std::exception& e);

google::protobuf::Value ErrorPayload(ErrorKind kind, std::string_view message);
google::protobuf::Value ErrorPayload(const std::exception& e);

} // namespace booking::wire
