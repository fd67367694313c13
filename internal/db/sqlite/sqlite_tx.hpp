#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_pool.hpp"

namespace booking::db::sqlite {

/*
  One unit of work on a pooled connection.

  Write units open with BEGIN IMMEDIATE so the write lock is taken before
  the conflict scan, never upgraded halfway through. Read-only units use
  BEGIN DEFERRED and, under WAL, never wait on writers. The connection
  returns to the pool when the transaction is destroyed.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(const std::shared_ptr<SqlitePool>& pool, bool read_only);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return conn_->Handle();
  }

  bool ReadOnly() const {
    return read_only_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> conn_;
  bool                      read_only_ = false;
  bool                      committed_ = false;
  bool                      finished_  = false;
};

} // namespace booking::db::sqlite
