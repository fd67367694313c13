#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace booking::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  Connections are not shared between threads; SqlitePool hands each
  transaction its own.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Pragmas, schema and transaction control. Lock contention throws
  // db::TransactionConflict, any other failure util::StoreUnavailable.
  void Exec(const std::string& sql);

  // WAL journal and busy timeout.
  void Configure(int busy_timeout_ms);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace booking::db::sqlite
