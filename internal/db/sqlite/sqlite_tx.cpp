#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace beatstore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::unique_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::runtime_error& e) {
      BEATSTORE_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()),
                                                     observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace beatstore::db::sqlite
