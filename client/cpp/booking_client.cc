#include "booking_client.h"

#include <google/protobuf/util/json_util.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "internal/wire/frame_codec.hpp"
#include "internal/wire/payload.hpp"

namespace booking::client {

BookingClient::BookingClient(std::string host, uint16_t port, std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(port), timeout_(timeout) {
}

BookingClient::~BookingClient() {
  Close();
}

void BookingClient::Connect() {
  if (fd_ >= 0) {
    return;
  }

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo*  result = nullptr;
  const auto port   = std::to_string(port_);
  if (int rc = ::getaddrinfo(host_.c_str(), port.c_str(), &hints, &result); rc != 0) {
    throw std::runtime_error("cannot resolve " + host_ + ": " + ::gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(result, &::freeaddrinfo);

  for (auto* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      buffer_.clear();
      return;
    }
    ::close(fd);
  }
  throw std::system_error(errno, std::generic_category(), "connect " + host_ + ":" + port);
}

void BookingClient::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  buffer_.clear();
}

void BookingClient::WriteAll(const std::string& bytes) {
  std::size_t sent = 0;
  while (sent < bytes.size()) {
    const ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "send");
    }
    sent += static_cast<std::size_t>(n);
  }
}

google::protobuf::Value BookingClient::Call(std::string_view tag, const google::protobuf::Value& payload) {
  Connect();
  WriteAll(wire::Encode(tag, payload));

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  char       chunk[4096];
  for (;;) {
    std::size_t consumed = 0;
    if (auto frame = wire::TryDecode(buffer_, &consumed)) {
      buffer_.erase(0, consumed);
      return std::move(frame->payload);
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      Close();
      throw std::system_error(std::make_error_code(std::errc::timed_out), "waiting for response");
    }

    pollfd    pfd{fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0 && errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "poll");
    }
    if (ready <= 0) continue;

    const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "recv");
    }
    if (n == 0) {
      Close();
      throw std::system_error(std::make_error_code(std::errc::connection_reset), "server closed the connection");
    }
    buffer_.append(chunk, static_cast<std::size_t>(n));
  }
}

google::protobuf::Value BookingClient::CallJson(std::string_view tag, const std::string& payload_json) {
  google::protobuf::Value payload;
  auto                    status = google::protobuf::util::JsonStringToMessage(payload_json, &payload);
  if (!status.ok()) {
    throw std::invalid_argument("request payload is not valid JSON: " + std::string(status.message()));
  }
  return Call(tag, payload);
}

google::protobuf::Value BookingClient::CreateBooking(int64_t user_id, int64_t space_id, const std::string& start,
                                                     const std::string& end, const std::string& reason) {
  auto payload = wire::Object();
  wire::Set(payload, "user", user_id);
  wire::Set(payload, "space", space_id);
  wire::Set(payload, "inicio", start);
  wire::Set(payload, "fin", end);
  wire::Set(payload, "motivo", reason);
  return Call("book", payload);
}

google::protobuf::Value BookingClient::DecideBooking(int64_t booking_id, bool approve, int64_t admin_id) {
  auto payload = wire::Object();
  wire::Set(payload, "reserva", booking_id);
  wire::Set(payload, "estado", approve ? "aprobada" : "rechazada");
  wire::Set(payload, "admin", admin_id);
  return Call("book", payload);
}

google::protobuf::Value BookingClient::CancelBooking(int64_t booking_id, int64_t user_id) {
  auto payload = wire::Object();
  wire::Set(payload, "reserva", booking_id);
  wire::Set(payload, "user", user_id);
  return Call("book", payload);
}

google::protobuf::Value BookingClient::Calendar(int64_t space_id, const std::string& date) {
  auto payload = wire::Object();
  wire::Set(payload, "space", space_id);
  wire::Set(payload, "fecha", date);
  return Call("avail", payload);
}

bool BookingClient::IsError(const google::protobuf::Value& response) {
  return wire::Has(response, "error");
}

} // namespace booking::client
