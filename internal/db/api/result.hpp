#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace beatstore::db {

/*
  Outcome of a catalog write.

  Reads report absence through std::optional; only writes carry a Result.
  Both backends map their failures onto the same codes, so a slug clash
  looks identical whether it came from a UNIQUE index or the memory store.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,            // UpdateInquiryStatus on an unknown id
  ConstraintViolation, // duplicate slug or file_name
  Busy,                // writer lock not acquired within busy_timeout_ms

  IOError,
  Corruption,

  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // "constraint_violation: UNIQUE constraint failed: beats.slug"
  std::string Describe() const {
    std::string out(ErrorCodeName(code));
    if (!message.empty()) {
      out += ": " + message;
    }
    return out;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace beatstore::db
