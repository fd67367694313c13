#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace booking::client {

/*
  Blocking framed-TCP client for the engine listeners.

  One request in flight at a time; the connection is reused across calls.
  Transport failures throw std::system_error, malformed responses
  wire::FrameError. Domain errors come back as ordinary payloads carrying
  "error" and "code" keys.
*/
class BookingClient {
 public:
  BookingClient(std::string host, uint16_t port, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
  ~BookingClient();

  BookingClient(const BookingClient&)            = delete;
  BookingClient& operator=(const BookingClient&) = delete;

  void Connect();
  void Close();

  google::protobuf::Value Call(std::string_view tag, const google::protobuf::Value& payload);

  // payload_json is parsed as the request payload.
  google::protobuf::Value CallJson(std::string_view tag, const std::string& payload_json);

  google::protobuf::Value CreateBooking(int64_t user_id, int64_t space_id, const std::string& start,
                                        const std::string& end, const std::string& reason);
  google::protobuf::Value DecideBooking(int64_t booking_id, bool approve, int64_t admin_id);
  google::protobuf::Value CancelBooking(int64_t booking_id, int64_t user_id);
  google::protobuf::Value Calendar(int64_t space_id, const std::string& date);

  static bool IsError(const google::protobuf::Value& response);

 private:
  void WriteAll(const std::string& bytes);

  std::string               host_;
  uint16_t                  port_;
  std::chrono::milliseconds timeout_;
  int                       fd_ = -1;
  std::string               buffer_;
};

} // namespace booking::client
