#include "connection.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace booking::runtime {

namespace {

// Upper bound on how long a blocked read goes without checking for shutdown.
constexpr std::chrono::milliseconds kPollSlice{100};

std::system_error SocketError(const char* what) {
  return std::system_error(errno, std::generic_category(), what);
}

} // namespace

Connection::Connection(int fd, std::string peer, std::chrono::milliseconds io_timeout, std::size_t max_frame_bytes,
                       const std::atomic<bool>& stopping)
    : fd_(fd), peer_(std::move(peer)), io_timeout_(io_timeout), max_frame_bytes_(max_frame_bytes), stopping_(stopping) {
}

Connection::~Connection() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

std::optional<wire::Frame> Connection::ReadFrame() {
  auto last_progress = std::chrono::steady_clock::now();
  char chunk[4096];

  for (;;) {
    std::size_t consumed = 0;
    if (auto frame = wire::TryDecode(buffer_, &consumed)) {
      buffer_.erase(0, consumed);
      return frame;
    }
    if (buffer_.size() >= max_frame_bytes_) {
      throw wire::FrameError(wire::FrameErrorKind::kOversized,
                             "frame exceeds " + std::to_string(max_frame_bytes_) + " bytes");
    }

    if (buffer_.empty() && stopping_.load()) {
      return std::nullopt;
    }
    if (std::chrono::steady_clock::now() - last_progress >= io_timeout_) {
      if (buffer_.empty()) {
        return std::nullopt;
      }
      throw wire::FrameError(wire::FrameErrorKind::kTooShort, "timed out inside a frame");
    }

    pollfd pfd{fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(kPollSlice.count()));
    if (ready < 0) {
      if (errno == EINTR) continue;
      throw SocketError("poll");
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      throw SocketError("recv");
    }
    if (n == 0) {
      if (buffer_.empty()) {
        return std::nullopt;
      }
      throw wire::FrameError(wire::FrameErrorKind::kTooShort, "peer closed inside a frame");
    }

    buffer_.append(chunk, static_cast<std::size_t>(n));
    last_progress = std::chrono::steady_clock::now();
  }
}

void Connection::Write(const std::string& bytes) {
  const auto  deadline = std::chrono::steady_clock::now() + io_timeout_;
  std::size_t sent     = 0;

  while (sent < bytes.size()) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw std::system_error(std::make_error_code(std::errc::timed_out), "send");
    }

    pollfd    pfd{fd_, POLLOUT, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) continue;
      throw SocketError("poll");
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      throw SocketError("send");
    }
    sent += static_cast<std::size_t>(n);
  }
}

} // namespace booking::runtime
