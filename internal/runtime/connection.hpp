#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "internal/wire/frame_codec.hpp"

namespace booking::runtime {

/*
  One accepted client socket, owned for its lifetime.

  Reads and writes are bounded by io_timeout. Reads wake up periodically
  so that a stopping server closes idle connections between requests
  while a request already on the wire is still read to the end.
*/
class Connection {
 public:
  Connection(int fd, std::string peer, std::chrono::milliseconds io_timeout, std::size_t max_frame_bytes,
             const std::atomic<bool>& stopping);
  ~Connection();

  Connection(const Connection&)            = delete;
  Connection& operator=(const Connection&) = delete;

  // std::nullopt when the client should be let go: clean EOF, idle
  // timeout, or server shutdown between requests. Malformed or truncated
  // frames throw wire::FrameError, socket failures std::system_error.
  std::optional<wire::Frame> ReadFrame();

  void Write(const std::string& bytes);

  const std::string& Peer() const {
    return peer_;
  }

 private:
  int                       fd_;
  std::string               peer_;
  std::chrono::milliseconds io_timeout_;
  std::size_t               max_frame_bytes_;
  const std::atomic<bool>&  stopping_;
  std::string               buffer_;
};

} // namespace booking::runtime
