#include "memory_catalog.hpp"

#include <mutex>

namespace pagewise::catalog {

std::optional<std::int64_t> MemoryCatalog::GetEffectiveTotalPages(const std::string& book_id) const {
  std::shared_lock lock(mutex_);

  auto it = books_.find(book_id);
  if (it == books_.end()) return std::nullopt;

  return it->second;
}

void MemoryCatalog::Put(const std::string& book_id, std::optional<std::int64_t> total_pages) {
  if (total_pages && *total_pages <= 0) total_pages.reset();

  std::unique_lock lock(mutex_);
  books_[book_id] = total_pages;
}

void MemoryCatalog::Remove(const std::string& book_id) {
  std::unique_lock lock(mutex_);
  books_.erase(book_id);
}

std::size_t MemoryCatalog::Size() const {
  std::shared_lock lock(mutex_);
  return books_.size();
}

} // namespace pagewise::catalog
