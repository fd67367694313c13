#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace booking::wire {

/*
  Frame = LEN(5 ASCII digits) TAG(5 chars, space padded) PAYLOAD

  LEN is the byte count of TAG + PAYLOAD, zero padded. PAYLOAD is JSON
  held as google.protobuf.Value; an empty payload is an empty object.
  The codec does not look inside the payload.
*/

inline constexpr std::size_t kLenWidth     = 5;
inline constexpr std::size_t kTagWidth     = 5;
inline constexpr std::size_t kHeaderBytes  = kLenWidth + kTagWidth;
inline constexpr std::size_t kMaxBodyBytes = 99999; // TAG + PAYLOAD

enum class FrameErrorKind {
  kTooShort,
  kBadLength,
  kBadPayload,
  kOversized,
};

const char* ToString(FrameErrorKind kind);

class FrameError : public std::runtime_error {
 public:
  FrameError(FrameErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  FrameErrorKind Kind() const {
    return kind_;
  }

 private:
  FrameErrorKind kind_;
};

struct Frame {
  std::string             tag; // exactly kTagWidth chars as received
  google::protobuf::Value payload;
};

// Right-pads or truncates tag to kTagWidth. Throws FrameError(kOversized).
std::string Encode(std::string_view tag, const google::protobuf::Value& payload);

// Decodes the frame at the front of bytes; trailing bytes are ignored.
// Throws FrameError(kTooShort) for an incomplete frame.
Frame Decode(std::string_view bytes);

// Streaming form: std::nullopt while the buffer holds no complete frame,
// otherwise the frame and the bytes it used in *consumed.
// Malformed length or payload throws FrameError.
std::optional<Frame> TryDecode(std::string_view buffer, std::size_t* consumed);

// Tag without its space padding.
std::string TrimTag(std::string_view tag);

} // namespace booking::wire
