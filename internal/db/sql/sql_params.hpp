#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pagewise::db::sql {

/*
  Ordered statement parameters.

  SQLite binds ? placeholders left to right, so a flat vector is enough.
  std::nullptr_t binds SQL NULL.
*/

using Param = std::variant<std::nullptr_t, std::int64_t, std::string>;

using Params = std::vector<Param>;

inline Param Nullable(const std::optional<std::int64_t>& value) {
  if (!value) return nullptr;
  return *value;
}

} // namespace pagewise::db::sql
