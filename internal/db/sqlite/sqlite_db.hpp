#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace beatstore::db::sqlite {

struct SqliteOptions {
  std::string path;
  bool        wal_mode = true;
  int         busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around one sqlite3* connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Run a single-value integer query, e.g. "PRAGMA user_version;"
  int64_t QueryInt(const std::string& sql);

  // Configure PRAGMAs (WAL, busy timeout, foreign keys off)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
};

// Finalizes on scope exit.
struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

} // namespace beatstore::db::sqlite
