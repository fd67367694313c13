#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace booking::core {

/*
  Keyed mutual exclusion, one mutex per space.

  Held across conflict scan and insert so that check-then-insert on one
  space is serialized. Different spaces never share a mutex. Entries live
  as long as the table, so callers only ask for spaces the directory knows.
*/
class SpaceLockTable {
 public:
  std::shared_ptr<std::mutex> Get(int64_t space_id);

  std::size_t Size() const;

 private:
  mutable std::mutex                                       guard_;
  std::unordered_map<int64_t, std::shared_ptr<std::mutex>> locks_;
};

} // namespace booking::core
