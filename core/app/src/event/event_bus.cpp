#include "pnlsync/eventbus/event_bus.hpp"

#include <vector>

namespace pnlsync {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace(id, std::move(callback));
  return id;
}

// Unknown ids are ignored, so a second unsubscribe of the same id is harmless.
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(id);
}

// -----------------------------------------------------------------------------
// publish(event): snapshot the callbacks, then dispatch unlocked
// -----------------------------------------------------------------------------
void EventBus::publish(const VenueEvent& event) {
  std::vector<GenericCallback> callbacks;
  {
    std::lock_guard lock(mutex_);
    callbacks.reserve(subscribers_.size());
    for (const auto& entry : subscribers_) {
      callbacks.push_back(entry.second);
    }
  }

  for (const auto& callback : callbacks) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace pnlsync
