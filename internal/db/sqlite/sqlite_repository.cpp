#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/time.hpp"
#include "sqlite_schema.hpp"

namespace beatstore::db::sqlite {

using beatstore::db::ErrorCode;
using beatstore::db::Result;

namespace {

constexpr const char* kBeatColumns =
    "id,title,slug,description,genre,bpm,duration,file_name,file_type,created_at_ms";

constexpr const char* kInquiryColumns = "id,beat_id,name,email,offer,status,created_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptionalI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

model::BeatRecord ReadBeat(sqlite3_stmt* st) {
  model::BeatRecord r;
  r.id            = ColI64(st, 0);
  r.title         = ColText(st, 1);
  r.slug          = ColText(st, 2);
  r.description   = ColOptionalText(st, 3);
  r.genre         = ColOptionalText(st, 4);
  r.bpm           = ColOptionalI64(st, 5);
  r.duration      = ColOptionalI64(st, 6);
  r.file_name     = ColText(st, 7);
  r.file_type     = ColText(st, 8);
  r.created_at_ms = static_cast<uint64_t>(ColI64(st, 9));
  return r;
}

model::InquiryRecord ReadInquiry(sqlite3_stmt* st) {
  model::InquiryRecord r;
  r.id            = ColI64(st, 0);
  r.beat_id       = ColI64(st, 1);
  r.name          = ColText(st, 2);
  r.email         = ColText(st, 3);
  r.offer         = ColText(st, 4);
  r.status        = ColText(st, 5);
  r.created_at_ms = static_cast<uint64_t>(ColI64(st, 6));
  return r;
}

// Reads have no Result channel; a statement that cannot be prepared is a bug
// or a broken file, both internal failures.
Statement PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(raw);
}

void ThrowIfStepFailed(sqlite3* db, int rc) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteRepository::SqliteRepository(SqliteOptions options)
    : options_(std::move(options)) {}

void SqliteRepository::Initialize() {
  SqliteDB db(options_);
  InitializeSchema(db);
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(std::make_unique<SqliteDB>(options_));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Beats
// ------------------------------------------------------------------

Result SqliteRepository::InsertBeat(Transaction& t, model::BeatRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO beats(title,slug,description,genre,bpm,duration,file_name,file_type,created_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  const uint64_t created_at_ms = util::NowUnixMillis();

  BindText(st.get(), 1, r.title);
  BindText(st.get(), 2, r.slug);
  BindOptionalText(st.get(), 3, r.description);
  BindOptionalText(st.get(), 4, r.genre);
  BindOptionalI64(st.get(), 5, r.bpm);
  BindOptionalI64(st.get(), 6, r.duration);
  BindText(st.get(), 7, r.file_name);
  BindText(st.get(), 8, r.file_type);
  BindI64(st.get(), 9, static_cast<int64_t>(created_at_ms));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    return Translate(db, rc);
  }

  r.id            = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  r.created_at_ms = created_at_ms;
  return Result::Ok();
}

std::optional<model::BeatRecord>
SqliteRepository::GetBeat(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, std::string("SELECT ") + kBeatColumns + " FROM beats WHERE id=?;");
  BindI64(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;

  return ReadBeat(st.get());
}

std::optional<model::BeatRecord>
SqliteRepository::FindBeatByFileName(Transaction& t, const std::string& file_name) {
  auto* db = TX(t).Handle();

  // default BINARY collation: exact, case-sensitive
  auto st = PrepareOrThrow(db, std::string("SELECT ") + kBeatColumns + " FROM beats WHERE file_name=?;");
  BindText(st.get(), 1, file_name);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;

  return ReadBeat(st.get());
}

std::vector<model::BeatRecord> SqliteRepository::ListBeats(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, std::string("SELECT ") + kBeatColumns +
                                   " FROM beats ORDER BY created_at_ms DESC, id DESC;");

  std::vector<model::BeatRecord> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadBeat(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

// ------------------------------------------------------------------
// Inquiries
// ------------------------------------------------------------------

Result SqliteRepository::InsertInquiry(Transaction& t, model::InquiryRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO exclusive_inquiries(beat_id,name,email,offer,status,created_at_ms) "
      "VALUES(?,?,?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  const uint64_t created_at_ms = util::NowUnixMillis();

  BindI64(st.get(), 1, r.beat_id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.email);
  BindText(st.get(), 4, r.offer);
  BindText(st.get(), 5, model::kInquiryStatusNew);
  BindI64(st.get(), 6, static_cast<int64_t>(created_at_ms));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    return Translate(db, rc);
  }

  r.id            = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  r.status        = model::kInquiryStatusNew;
  r.created_at_ms = created_at_ms;
  return Result::Ok();
}

std::optional<model::InquiryRecord>
SqliteRepository::GetInquiry(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, std::string("SELECT ") + kInquiryColumns + " FROM exclusive_inquiries WHERE id=?;");
  BindI64(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;

  return ReadInquiry(st.get());
}

std::vector<model::InquiryRecord>
SqliteRepository::ListInquiries(Transaction& t, std::optional<int64_t> beat_id) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kInquiryColumns + " FROM exclusive_inquiries";
  if (beat_id) sql += " WHERE beat_id=?";
  sql += " ORDER BY created_at_ms DESC, id DESC;";

  auto st = PrepareOrThrow(db, sql);
  if (beat_id) BindI64(st.get(), 1, *beat_id);

  std::vector<model::InquiryRecord> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadInquiry(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

Result SqliteRepository::UpdateInquiryStatus(Transaction& t, int64_t id, const std::string& status) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE exclusive_inquiries SET status=? WHERE id=?;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  BindText(st.get(), 1, status);
  BindI64(st.get(), 2, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    return Translate(db, rc);
  }
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "inquiry " + std::to_string(id) + " not found");
  }
  return Result::Ok();
}

} // namespace beatstore::db::sqlite
