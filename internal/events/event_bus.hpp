#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/events/store_events.hpp"
#include "internal/observability/logging.hpp"

namespace archstore::events {

/*
  Typed publish/subscribe channel.

  Handlers run synchronously on the publishing thread, outside the channel
  lock, so a handler may subscribe or unsubscribe. A throwing handler is
  logged and does not stop delivery to the others.
*/
template <class Event>
class Channel {
 public:
  using Handler      = std::function<void(const Event&)>;
  using Subscription = std::uint64_t;

  Subscription Subscribe(Handler handler) {
    std::lock_guard lock(mutex_);
    const auto      id = ++last_id_;
    handlers_.emplace_back(id, std::move(handler));
    return id;
  }

  void Unsubscribe(Subscription id) {
    std::lock_guard lock(mutex_);
    std::erase_if(handlers_, [id](const auto& entry) { return entry.first == id; });
  }

  void Publish(const Event& event) const {
    std::vector<std::pair<Subscription, Handler>> handlers;
    {
      std::lock_guard lock(mutex_);
      handlers = handlers_;
    }
    for (const auto& [id, handler] : handlers) {
      try {
        handler(event);
      } catch (const std::exception& e) {
        ARCHSTORE_LOG_ERROR("event handler failed", {observability::IntField("subscription", static_cast<std::int64_t>(id)),
                                                     observability::StringField("error", e.what())});
      }
    }
  }

  std::size_t SubscriberCount() const {
    std::lock_guard lock(mutex_);
    return handlers_.size();
  }

 private:
  mutable std::mutex                            mutex_;
  std::vector<std::pair<Subscription, Handler>> handlers_;
  Subscription                                  last_id_ = 0;
};

// One channel per store event; constructed by the factory and shared.
struct EventBus {
  Channel<CommitSummary>  commits;
  Channel<MigrationEvent> migration;
  Channel<IntegrityEvent> integrity;
  Channel<VersionEvent>   versions;
};

} // namespace archstore::events
