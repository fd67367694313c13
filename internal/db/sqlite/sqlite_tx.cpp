#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace booking::db::sqlite {

SqliteTransaction::SqliteTransaction(const std::shared_ptr<SqlitePool>& pool, bool read_only)
    : conn_(pool->Acquire()), read_only_(read_only) {
  conn_->Exec(read_only_ ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    conn_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    BOOKING_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what()),
                                                observability::BoolField("read_only", read_only_)});
  }
}

void SqliteTransaction::Commit() {
  // A busy COMMIT throws with the transaction still open; the destructor rolls it back.
  conn_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  conn_->Exec("ROLLBACK;");
}

} // namespace booking::db::sqlite
