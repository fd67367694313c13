#include "wire_error.hpp"

#include "internal/util/errors.hpp"
#include "internal/wire/frame_codec.hpp"
#include "internal/wire/payload.hpp"
#include "internal/wire/request.hpp"

namespace booking::wire {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidRange:
      return "invalid_range";
    case ErrorKind::kSlotUnavailable:
      return "slot_unavailable";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kInvalidState:
      return "invalid_state";
    case ErrorKind::kStoreUnavailable:
      return "store_unavailable";
    case ErrorKind::kBadRequest:
      return "bad_request";
    case ErrorKind::kWrongService:
      return "wrong_service";
    case ErrorKind::kInternal:
      return "internal";
  }
  return "internal";
}

ErrorKind Classify(const std::exception& e) {
  using namespace booking::util;

  if (dynamic_cast<const InvalidRange*>(&e)) {
    return ErrorKind::kInvalidRange;
  }
  if (dynamic_cast<const SlotUnavailable*>(&e)) {
    return ErrorKind::kSlotUnavailable;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return ErrorKind::kNotFound;
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return ErrorKind::kInvalidState;
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return ErrorKind::kStoreUnavailable;
  }
  if (dynamic_cast<const RequestError*>(&e) || dynamic_cast<const FrameError*>(&e)) {
    return ErrorKind::kBadRequest;
  }

  return ErrorKind::kInternal;
}

google::protobuf::Value ErrorPayload(ErrorKind kind, std::string_view message) {
  auto payload = Object();
  Set(payload, "error", message);
  Set(payload, "code", ToString(kind));
  if (kind == ErrorKind::kStoreUnavailable) {
    Set(payload, "retryable", true);
  }
  return payload;
}

google::protobuf::Value ErrorPayload(const std::exception& e) {
  const auto kind = Classify(e);
  // Internal failures keep their detail in the log, not on the wire.
  if (kind == ErrorKind::kInternal) {
    return ErrorPayload(kind, "internal error");
  }
  return ErrorPayload(kind, e.what());
}

} // namespace booking::wire
