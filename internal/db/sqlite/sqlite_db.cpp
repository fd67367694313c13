#include "sqlite_db.hpp"

#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"

namespace booking::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StoreUnavailable(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure(busy_timeout_ms);
  } catch (const util::StoreUnavailable&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    // BEGIN IMMEDIATE or COMMIT gave up waiting for another writer.
    if ((rc & 0xff) == SQLITE_BUSY || (rc & 0xff) == SQLITE_LOCKED) {
      throw TransactionConflict("sqlite busy: " + msg);
    }
    throw util::StoreUnavailable(msg);
  }
}

void SqliteDB::Configure(int busy_timeout_ms) {
  // WAL: availability and calendar reads proceed while a booking unit writes.
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // Space-locked units are short; wait out a competing writer instead of failing.
  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace booking::db::sqlite
