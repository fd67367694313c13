#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace booking::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS spaces (id INTEGER PRIMARY KEY, name TEXT NOT NULL, type TEXT NOT NULL, capacity INTEGER NOT NULL, location TEXT, active INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS users (id INTEGER PRIMARY KEY, name TEXT NOT NULL, role TEXT, active INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS incidents (id INTEGER PRIMARY KEY AUTOINCREMENT, space_id INTEGER NOT NULL, type TEXT NOT NULL, description TEXT NOT NULL, status INTEGER NOT NULL, reported_by INTEGER, reported_at INTEGER NOT NULL, resolved_at INTEGER, solution TEXT, block_interval_id INTEGER, version INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS intervals (id INTEGER PRIMARY KEY AUTOINCREMENT, space_id INTEGER NOT NULL, owner_user_id INTEGER, start_s INTEGER NOT NULL, end_s INTEGER NOT NULL, state INTEGER NOT NULL, kind INTEGER NOT NULL, reason TEXT, created_at INTEGER NOT NULL, decided_by INTEGER, decided_at INTEGER, cancelled_by INTEGER, incident_id INTEGER, version INTEGER NOT NULL, CHECK (end_s > start_s));",
      "CREATE INDEX IF NOT EXISTS idx_intervals_space ON intervals(space_id, start_s);",
      "CREATE INDEX IF NOT EXISTS idx_intervals_owner ON intervals(owner_user_id);",
      "CREATE INDEX IF NOT EXISTS idx_intervals_incident ON intervals(incident_id);",
      "CREATE INDEX IF NOT EXISTS idx_incidents_status ON incidents(status);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,space_id,owner_user_id,start_s,end_s,state,kind,reason,created_at,version FROM intervals LIMIT 1;");
  db.Exec("SELECT id,space_id,status,block_interval_id FROM incidents LIMIT 1;");
}

} // namespace booking::db::sqlite
