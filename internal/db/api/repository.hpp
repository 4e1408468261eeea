#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/beat_record.hpp"
#include "internal/db/model/inquiry_record.hpp"

namespace beatstore::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Ids and creation times are assigned by the store, never by callers
  - slug and file_name uniqueness is enforced here, reported as
    ErrorCode::ConstraintViolation, never by overwriting

  The DB is the catalog of record once a beat is known.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Beats
  // ---------------------------------------------------------------------

  // On success writes the assigned id and created_at_ms back into the record.
  virtual Result InsertBeat(Transaction&, model::BeatRecord&) = 0;

  virtual std::optional<model::BeatRecord> GetBeat(Transaction&, int64_t id) = 0;

  // Exact, case-sensitive match.
  virtual std::optional<model::BeatRecord> FindBeatByFileName(Transaction&, const std::string& file_name) = 0;

  // Most recently catalogued first.
  virtual std::vector<model::BeatRecord> ListBeats(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Inquiries
  // ---------------------------------------------------------------------

  // Status is forced to "new"; assigned id and created_at_ms are written back.
  virtual Result InsertInquiry(Transaction&, model::InquiryRecord&) = 0;

  virtual std::optional<model::InquiryRecord> GetInquiry(Transaction&, int64_t id) = 0;

  // Newest first, optionally restricted to one beat.
  virtual std::vector<model::InquiryRecord> ListInquiries(Transaction&, std::optional<int64_t> beat_id) = 0;

  virtual Result UpdateInquiryStatus(Transaction&, int64_t id, const std::string& status) = 0;
};

} // namespace beatstore::db
