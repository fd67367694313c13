#pragma once

#include "sqlite_db.hpp"

namespace booking::db::sqlite {

// Creates the engine tables and indexes if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace booking::db::sqlite
