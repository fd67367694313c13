#pragma once

#include <map>
#include <optional>
#include <set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace booking::db::memory {

/*
  Transaction = snapshot + write set

  The write set remembers, per touched row, the version the snapshot saw
  (nullopt when the row did not exist). Commit fails with
  TransactionConflict if any of those rows changed underneath.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool ReadOnly() const {
    return read_only_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  // Call before writing a row so its base version is captured.
  MemoryRepository::State& TouchInterval(int64_t id);
  MemoryRepository::State& TouchIncident(int64_t id);
  MemoryRepository::State& TouchSpace(int64_t id);
  MemoryRepository::State& TouchUser(int64_t id);

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;

  std::map<int64_t, std::optional<uint64_t>> interval_base_;
  std::map<int64_t, std::optional<uint64_t>> incident_base_;
  std::set<int64_t>                          spaces_touched_;
  std::set<int64_t>                          users_touched_;

  bool read_only_   = false;
  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace booking::db::memory
