#include "space_lock_table.hpp"

namespace booking::core {

std::shared_ptr<std::mutex> SpaceLockTable::Get(int64_t space_id) {
  std::lock_guard<std::mutex> lock(guard_);
  auto&                       space_mutex = locks_[space_id];
  if (!space_mutex) {
    space_mutex = std::make_shared<std::mutex>();
  }
  return space_mutex;
}

std::size_t SpaceLockTable::Size() const {
  std::lock_guard<std::mutex> lock(guard_);
  return locks_.size();
}

} // namespace booking::core
