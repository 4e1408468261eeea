#include "sqlite_db.hpp"

#include <stdexcept>

namespace beatstore::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + options_.path + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
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
    throw std::runtime_error(msg);
  }
}

int64_t SqliteDB::QueryInt(const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr), db_, "sqlite prepare");
  Statement st(raw);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    throw std::runtime_error("sqlite query returned no row: " + sql);
  }
  return sqlite3_column_int64(st.get(), 0);
}

void SqliteDB::Configure() {
  // WAL lets readers proceed while a writer holds the lock
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // inquiries reference beats softly; the FK is declared but not enforced
  Exec("PRAGMA foreign_keys=OFF;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace beatstore::db::sqlite
