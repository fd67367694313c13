#include "memory_tx.hpp"

#include <string>
#include <utility>

namespace booking::db::memory {

namespace {

template <typename Map>
std::optional<uint64_t> CurrentVersion(const Map& rows, int64_t id) {
  auto it = rows.find(id);
  if (it == rows.end()) return std::nullopt;
  return it->second.version;
}

template <typename Map>
void Validate(const Map& committed, const std::map<int64_t, std::optional<uint64_t>>& base, const char* table) {
  for (const auto& [id, version] : base) {
    if (CurrentVersion(committed, id) != version) {
      throw TransactionConflict(std::string("transaction conflict: ") + table + " row " + std::to_string(id) +
                                " was modified by a concurrent transaction");
    }
  }
}

int64_t KeyOf(int64_t id) {
  return id;
}

int64_t KeyOf(const std::pair<const int64_t, std::optional<uint64_t>>& entry) {
  return entry.first;
}

template <typename Map, typename Keys>
void Apply(Map& committed, const Map& working, const Keys& touched) {
  for (const auto& key : touched) {
    const int64_t id = KeyOf(key);
    auto          it = working.find(id);
    if (it == working.end()) {
      committed.erase(id);
    } else {
      committed[id] = it->second;
    }
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::TouchInterval(int64_t id) {
  interval_base_.try_emplace(id, CurrentVersion(working_.intervals, id));
  return working_;
}

MemoryRepository::State& MemoryTransaction::TouchIncident(int64_t id) {
  incident_base_.try_emplace(id, CurrentVersion(working_.incidents, id));
  return working_;
}

MemoryRepository::State& MemoryTransaction::TouchSpace(int64_t id) {
  spaces_touched_.insert(id);
  return working_;
}

MemoryRepository::State& MemoryTransaction::TouchUser(int64_t id) {
  users_touched_.insert(id);
  return working_;
}

void MemoryTransaction::Commit() {
  if (read_only_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  Validate(repo_.committed_.intervals, interval_base_, "interval");
  Validate(repo_.committed_.incidents, incident_base_, "incident");

  Apply(repo_.committed_.intervals, working_.intervals, interval_base_);
  Apply(repo_.committed_.incidents, working_.incidents, incident_base_);
  Apply(repo_.committed_.spaces, working_.spaces, spaces_touched_);
  Apply(repo_.committed_.users, working_.users, users_touched_);
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace booking::db::memory
