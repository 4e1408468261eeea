#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace beatstore::db::sqlite {

namespace {

const std::vector<std::string> kBootstrapSql = {
    "CREATE TABLE IF NOT EXISTS beats ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "title TEXT NOT NULL, "
    "slug TEXT UNIQUE NOT NULL, "
    "description TEXT, "
    "genre TEXT, "
    "bpm INTEGER, "
    "duration INTEGER, "
    "file_name TEXT UNIQUE NOT NULL, "
    "file_type TEXT NOT NULL, "
    "created_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS exclusive_inquiries ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "beat_id INTEGER NOT NULL, "
    "name TEXT NOT NULL, "
    "email TEXT NOT NULL, "
    "offer TEXT NOT NULL, "
    "status TEXT NOT NULL DEFAULT 'new', "
    "created_at_ms INTEGER NOT NULL, "
    "FOREIGN KEY(beat_id) REFERENCES beats(id));"};

// Fail fast on a file created by an older, incompatible layout.
const std::vector<std::string> kProbeSql = {
    "SELECT id,title,slug,description,genre,bpm,duration,file_name,file_type,created_at_ms FROM beats LIMIT 1;",
    "SELECT id,beat_id,name,email,offer,status,created_at_ms FROM exclusive_inquiries LIMIT 1;"};

} // namespace

void InitializeSchema(SqliteDB& db) {
  db.Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : kBootstrapSql) {
      db.Exec(sql);
    }
    if (db.QueryInt("PRAGMA user_version;") == 0) {
      db.Exec("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
    }
    db.Exec("COMMIT;");
  } catch (const std::runtime_error&) {
    db.Exec("ROLLBACK;");
    throw;
  }

  for (const auto& sql : kProbeSql) {
    try {
      db.Exec(sql);
    } catch (const std::runtime_error& e) {
      throw std::runtime_error("incompatible catalog schema in " + db.Path() + ": " + e.what());
    }
  }
}

} // namespace beatstore::db::sqlite
