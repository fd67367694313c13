#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/wire/frame_codec.hpp"
#include "internal/wire/payload.hpp"

namespace {

using namespace booking::wire;

FrameErrorKind DecodeError(const std::string& bytes) {
  try {
    (void)Decode(bytes);
  } catch (const FrameError& e) {
    return e.Kind();
  }
  assert(false && "decode should have failed");
  return FrameErrorKind::kTooShort;
}

void TestEncodeLayout() {
  auto payload = Object();
  Set(payload, "id", int64_t{7});
  Set(payload, "estado", "pendiente");

  const auto frame = Encode("book", payload);
  const auto json  = ToJson(payload);
  assert(frame.substr(5, 5) == "book ");
  assert(frame.substr(10) == json);
  assert(std::stoul(frame.substr(0, 5)) == 5 + json.size());
  assert(frame.size() == 10 + json.size());
}

void TestTagIsPaddedOrTruncated() {
  const auto frame = Encode("incidents", Object());
  assert(frame.substr(5, 5) == "incid");

  auto decoded = Decode(Encode("ab", Object()));
  assert(decoded.tag == "ab   ");
  assert(TrimTag(decoded.tag) == "ab");
}

void TestRoundTripKeepsPayload() {
  auto payload = Object();
  Set(payload, "user", "2");
  Set(payload, "space", int64_t{1});
  Set(payload, "motivo", "clase de \"algebra\" \xc3\xb1");
  auto list = List();
  Append(list, Object());
  Set(payload, "extra", std::move(list));

  const auto decoded = Decode(Encode("avail", payload));
  assert(decoded.tag == "avail");
  assert(google::protobuf::util::MessageDifferencer::Equals(decoded.payload, payload));
}

void TestEmptyPayloadIsEmptyObject() {
  const auto decoded = Decode("00005incid");
  assert(decoded.payload.has_struct_value());
  assert(decoded.payload.struct_value().fields().empty());
}

void TestRejectsMalformedFrames() {
  assert(DecodeError("00005book") == FrameErrorKind::kTooShort);
  assert(DecodeError("") == FrameErrorKind::kTooShort);
  assert(DecodeError("00020book {}") == FrameErrorKind::kTooShort);
  assert(DecodeError("0x005book ") == FrameErrorKind::kBadLength);
  assert(DecodeError("00003book ") == FrameErrorKind::kBadLength);
  assert(DecodeError("00010book {nope") == FrameErrorKind::kBadPayload);
}

void TestDecodeHonoursLength() {
  auto first  = Encode("book", Object());
  auto second = Encode("avail", Object());

  const auto decoded = Decode(first + second);
  assert(decoded.tag == "book ");

  std::size_t consumed = 0;
  auto        partial  = TryDecode((first + second).substr(0, first.size() + 3), &consumed);
  assert(partial && consumed == first.size());

  assert(!TryDecode(second.substr(0, 7), &consumed));
}

void TestOversizedPayloadIsRejected() {
  auto payload = Object();
  Set(payload, "motivo", std::string(100000, 'x'));

  bool threw = false;
  try {
    (void)Encode("book", payload);
  } catch (const FrameError& e) {
    threw = e.Kind() == FrameErrorKind::kOversized;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEncodeLayout();
  TestTagIsPaddedOrTruncated();
  TestRoundTripKeepsPayload();
  TestEmptyPayloadIsEmptyObject();
  TestRejectsMalformedFrames();
  TestDecodeHonoursLength();
  TestOversizedPayloadIsRejected();

  std::cout << "booking_engine_unit_frame_codec: pass\n";
  return 0;
}
