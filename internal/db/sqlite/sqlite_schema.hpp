#pragma once

#include "sqlite_db.hpp"

namespace beatstore::db::sqlite {

inline constexpr int kSchemaVersion = 1;

/*
  Creates the beats and exclusive_inquiries tables if missing.

  Idempotent: safe on every process start, never touches existing rows.
  The schema version lives in PRAGMA user_version so the file holds
  exactly the two catalog tables.

  Throws std::runtime_error when an existing file has an incompatible shape.
*/
void InitializeSchema(SqliteDB& db);

} // namespace beatstore::db::sqlite
