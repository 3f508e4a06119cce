#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "book_catalog.hpp"

namespace pagewise::catalog {

// Thread-safe in-process catalog, seeded from configuration or by tests.
class MemoryCatalog final : public BookCatalog {
 public:
  std::optional<std::int64_t> GetEffectiveTotalPages(const std::string& book_id) const override;

  // Non-positive page counts are treated as unknown.
  void Put(const std::string& book_id, std::optional<std::int64_t> total_pages);
  void Remove(const std::string& book_id);

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                                         mutex_;
  std::unordered_map<std::string, std::optional<std::int64_t>> books_;
};

} // namespace pagewise::catalog
