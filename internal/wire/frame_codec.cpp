#include "frame_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cstdio>

namespace booking::wire {

namespace {

bool IsBlank(std::string_view text) {
  for (char c : text) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
  }
  return true;
}

std::size_t ParseLength(std::string_view digits) {
  std::size_t length = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') {
      throw FrameError(FrameErrorKind::kBadLength, "frame length is not " + std::to_string(kLenWidth) + " digits");
    }
    length = length * 10 + static_cast<std::size_t>(c - '0');
  }
  if (length < kTagWidth) {
    throw FrameError(FrameErrorKind::kBadLength, "frame length " + std::to_string(length) + " is shorter than the tag");
  }
  return length;
}

google::protobuf::Value ParsePayload(std::string_view text) {
  google::protobuf::Value payload;
  if (IsBlank(text)) {
    payload.mutable_struct_value();
    return payload;
  }

  auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &payload);
  if (!status.ok()) {
    throw FrameError(FrameErrorKind::kBadPayload, "payload is not valid JSON: " + std::string(status.message()));
  }
  return payload;
}

} // namespace

const char* ToString(FrameErrorKind kind) {
  switch (kind) {
    case FrameErrorKind::kTooShort:
      return "too_short";
    case FrameErrorKind::kBadLength:
      return "bad_length";
    case FrameErrorKind::kBadPayload:
      return "bad_payload";
    case FrameErrorKind::kOversized:
      return "oversized";
  }
  return "unknown";
}

std::string Encode(std::string_view tag, const google::protobuf::Value& payload) {
  std::string json;
  if (payload.kind_case() != google::protobuf::Value::KIND_NOT_SET) {
    auto status = google::protobuf::util::MessageToJsonString(payload, &json);
    if (!status.ok()) {
      throw FrameError(FrameErrorKind::kBadPayload, "payload cannot be serialized: " + std::string(status.message()));
    }
  }

  const std::size_t body = kTagWidth + json.size();
  if (body > kMaxBodyBytes) {
    throw FrameError(FrameErrorKind::kOversized, "frame body of " + std::to_string(body) + " bytes exceeds " +
                                                     std::to_string(kMaxBodyBytes));
  }

  char len[kLenWidth + 1];
  std::snprintf(len, sizeof(len), "%05zu", body);

  std::string frame;
  frame.reserve(kLenWidth + body);
  frame.append(len, kLenWidth);
  frame.append(tag.substr(0, kTagWidth));
  frame.append(kTagWidth - std::min(tag.size(), kTagWidth), ' ');
  frame.append(json);
  return frame;
}

std::optional<Frame> TryDecode(std::string_view buffer, std::size_t* consumed) {
  if (buffer.size() < kHeaderBytes) {
    return std::nullopt;
  }

  const std::size_t body = ParseLength(buffer.substr(0, kLenWidth));
  if (buffer.size() < kLenWidth + body) {
    return std::nullopt;
  }

  Frame frame;
  frame.tag     = std::string(buffer.substr(kLenWidth, kTagWidth));
  frame.payload = ParsePayload(buffer.substr(kHeaderBytes, body - kTagWidth));
  if (consumed) {
    *consumed = kLenWidth + body;
  }
  return frame;
}

Frame Decode(std::string_view bytes) {
  if (bytes.size() < kHeaderBytes) {
    throw FrameError(FrameErrorKind::kTooShort,
                     "frame needs at least " + std::to_string(kHeaderBytes) + " bytes, got " + std::to_string(bytes.size()));
  }

  auto frame = TryDecode(bytes, nullptr);
  if (!frame) {
    throw FrameError(FrameErrorKind::kTooShort, "frame is truncated");
  }
  return std::move(*frame);
}

std::string TrimTag(std::string_view tag) {
  const auto last = tag.find_last_not_of(' ');
  if (last == std::string_view::npos) {
    return {};
  }
  const auto first = tag.find_first_not_of(' ');
  return std::string(tag.substr(first, last - first + 1));
}

} // namespace booking::wire
