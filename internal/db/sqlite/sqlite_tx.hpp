#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace beatstore::db::sqlite {

/*
  SQLite transaction wrapper.

  Owns its connection: one operation, one connection, one transaction.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::unique_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  std::unique_ptr<SqliteDB> db_;
  bool finished_ = false;
};

}
