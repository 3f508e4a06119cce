#pragma once

#include <string>
#include <string_view>

namespace pagewise::db {

// Outcome of a repository call. Backends map their native errors onto these
// codes; nothing above internal/db sees a sqlite3 return code.
enum class ErrorCode {
  OK = 0,

  NotFound,            // no progress record with that id / key
  AlreadyExists,       // (reader, book, context) already has a record
  Conflict,            // record version moved since it was read
  Busy,                // database locked past the busy timeout

  ConstraintViolation, // negative ledger amounts, immutable keys, schema checks

  IOError,
  Corruption,
  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
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

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // "conflict: progress record 7 modified concurrently"
  std::string Describe() const {
    std::string out(ToString(code));
    if (!message.empty()) out += ": " + message;
    return out;
  }
};

} // namespace pagewise::db
