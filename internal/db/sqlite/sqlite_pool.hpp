#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace booking::db::sqlite {

/*
  SqlitePool

  Connection factory used by SqliteRepository.

  - Each transaction gets its own connection.
  - Connections are opened lazily up to max_connections and recycled.
  - ":memory:" databases are per-connection, so the pool is clamped to 1.

  Lifetime:
    Repository owns shared_ptr<SqlitePool>
    Transaction acquires shared_ptr<SqliteDB>
*/

class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  SqlitePool(std::string path, std::size_t max_connections = 4, int busy_timeout_ms = 5000);

  // Acquire a ready-to-use connection; blocks while all are in use.
  std::shared_ptr<SqliteDB> Acquire();

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string path_;
  std::size_t max_connections_;
  int         busy_timeout_ms_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace booking::db::sqlite
