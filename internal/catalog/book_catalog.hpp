#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pagewise::catalog {

/*
  Book lookup collaborator.

  Returns the page count of the reference edition, or nullopt when the
  catalog does not know it. Implementations must be safe to call from
  several threads.
*/
class BookCatalog {
 public:
  virtual ~BookCatalog() = default;

  virtual std::optional<std::int64_t> GetEffectiveTotalPages(const std::string& book_id) const = 0;
};

} // namespace pagewise::catalog
