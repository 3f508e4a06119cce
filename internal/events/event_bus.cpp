#include "event_bus.hpp"

#include <exception>
#include <vector>

#include "internal/observability/logging.hpp"

namespace pagewise::events {

namespace {

const char* EventName(const Event& event) {
  return std::holds_alternative<BookCompleted>(event) ? "book_completed" : "progress_advanced";
}

} // namespace

EventBus::SubscriptionId EventBus::Subscribe(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  id = next_id_++;
  handlers_.emplace(id, std::move(handler));
  return id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.erase(id) > 0;
}

void EventBus::Publish(const Event& event) const {
  std::vector<std::pair<SubscriptionId, Handler>> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers.assign(handlers_.begin(), handlers_.end());
  }

  for (const auto& [id, handler] : handlers) {
    try {
      handler(event);
    } catch (const std::exception& ex) {
      PAGEWISE_LOG_WARN("event subscriber failed", {observability::StringField("event", EventName(event)),
                                                    observability::IntField("subscription", static_cast<std::int64_t>(id)),
                                                    observability::StringField("error", ex.what())});
    } catch (...) {
      PAGEWISE_LOG_WARN("event subscriber failed", {observability::StringField("event", EventName(event)),
                                                    observability::IntField("subscription", static_cast<std::int64_t>(id)),
                                                    observability::StringField("error", "non-standard exception")});
    }
  }
}

std::size_t EventBus::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.size();
}

} // namespace pagewise::events
