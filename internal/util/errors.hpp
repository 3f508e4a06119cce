#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace pagewise::util {

/*
  Central error types.

  Every failure surfaced by the engine carries a Reason so the calling layer
  can render a specific message instead of a generic fault. UnknownBookLength
  and AlreadyComplete are never thrown; they are reported as notices on the
  returned snapshot.
*/

enum class Reason {
  kInvalidRawValue,
  kNoActiveMedium,
  kNotFound,
  kInvalidState,
  kStorageFailure,
  kUnknownBookLength,
  kAlreadyComplete,
};

constexpr std::string_view ToString(Reason reason) {
  switch (reason) {
    case Reason::kInvalidRawValue:
      return "invalid_raw_value";
    case Reason::kNoActiveMedium:
      return "no_active_medium";
    case Reason::kNotFound:
      return "not_found";
    case Reason::kInvalidState:
      return "invalid_state";
    case Reason::kStorageFailure:
      return "storage_failure";
    case Reason::kUnknownBookLength:
      return "unknown_book_length";
    case Reason::kAlreadyComplete:
      return "already_complete";
  }
  return "unknown";
}

class EngineError : public std::runtime_error {
 public:
  EngineError(Reason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  Reason reason() const {
    return reason_;
  }

 private:
  Reason reason_;
};

class InvalidRawValue : public EngineError {
 public:
  explicit InvalidRawValue(const std::string& msg) : EngineError(Reason::kInvalidRawValue, msg) {
  }
};

class NoActiveMedium : public EngineError {
 public:
  explicit NoActiveMedium(const std::string& msg) : EngineError(Reason::kNoActiveMedium, msg) {
  }
};

class NotFound : public EngineError {
 public:
  explicit NotFound(const std::string& msg) : EngineError(Reason::kNotFound, msg) {
  }
};

class InvalidState : public EngineError {
 public:
  explicit InvalidState(const std::string& msg) : EngineError(Reason::kInvalidState, msg) {
  }
};

class StorageFailure : public EngineError {
 public:
  explicit StorageFailure(const std::string& msg) : EngineError(Reason::kStorageFailure, msg) {
  }
};

} // namespace pagewise::util
