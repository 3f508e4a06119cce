#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

#include "events.hpp"

namespace pagewise::events {

/*
  Explicit in-process publish/subscribe.

  - Handlers run synchronously on the publishing thread, in subscription order
  - Publish never holds the bus lock while a handler runs, so handlers may
    subscribe or unsubscribe
  - A throwing handler is logged and skipped; the publisher never sees it
*/
class EventBus {
 public:
  using SubscriptionId = std::uint64_t;
  using Handler        = std::function<void(const Event&)>;

  SubscriptionId Subscribe(Handler handler);
  bool           Unsubscribe(SubscriptionId id);

  void Publish(const Event& event) const;

  std::size_t SubscriberCount() const;

 private:
  mutable std::mutex                mutex_;
  SubscriptionId                    next_id_ = 1;
  std::map<SubscriptionId, Handler> handlers_;
};

} // namespace pagewise::events
