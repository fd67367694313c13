#pragma once

#include <stdexcept>
#include <string>

namespace booking::db {

/*
  One unit of work against the Interval Store.

  Every backend guarantees:

  - writes stay invisible to other units until Commit()
  - a booking, its cascade cancellations and the incident link commit
    together or not at all
  - destruction without Commit() rolls back

  Commit() throws TransactionConflict when a concurrent unit won the race;
  core::RunUnit reruns the unit from scratch.

  SQLite: BEGIN IMMEDIATE (read-only: BEGIN DEFERRED)
  Memory: snapshot + row-versioned write set
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  // Discards every write of the unit.
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

// Commit lost a race with a concurrent writer. Safe to retry the whole unit.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace booking::db
