#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace pagewise::events {

// Emitted once per read-through when markFinished completes it.
struct BookCompleted {
  std::string     reader_id;
  std::string     book_id;
  std::uint64_t   progress_id = 0;
  util::TimePoint occurred_at{};
};

// Emitted after every committed update that raised the record's percent.
struct ProgressAdvanced {
  std::string     reader_id;
  std::string     book_id;
  std::uint64_t   progress_id = 0;
  util::Decimal   previous_percent;
  util::Decimal   percent;
  util::TimePoint occurred_at{};
};

using Event = std::variant<BookCompleted, ProgressAdvanced>;

} // namespace pagewise::events
