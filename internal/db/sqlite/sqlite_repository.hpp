#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace beatstore::db::sqlite {

/*
  SQLite-backed catalog store.

  Holds no connection of its own: Begin() opens a fresh connection for each
  transaction and the transaction closes it, so worker threads never share a
  handle and nothing survives between operations except the file itself.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(SqliteOptions options);

  // Creates tables if missing (idempotent).
  void Initialize();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBeat(Transaction&, model::BeatRecord&) override;
  std::optional<model::BeatRecord> GetBeat(Transaction&, int64_t id) override;
  std::optional<model::BeatRecord> FindBeatByFileName(Transaction&, const std::string& file_name) override;
  std::vector<model::BeatRecord> ListBeats(Transaction&) override;

  Result InsertInquiry(Transaction&, model::InquiryRecord&) override;
  std::optional<model::InquiryRecord> GetInquiry(Transaction&, int64_t id) override;
  std::vector<model::InquiryRecord> ListInquiries(Transaction&, std::optional<int64_t> beat_id) override;
  Result UpdateInquiryStatus(Transaction&, int64_t id, const std::string& status) override;

private:
  SqliteOptions options_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
