#pragma once

#include <stdexcept>
#include <string>

namespace booking::util {

/*
  Central error types.

  These get translated later to wire error payloads.
*/

class InvalidRange : public std::runtime_error {
 public:
  explicit InvalidRange(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SlotUnavailable : public std::runtime_error {
 public:
  explicit SlotUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persistence unreachable or gave up. The request fails, the connection survives.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace booking::util
