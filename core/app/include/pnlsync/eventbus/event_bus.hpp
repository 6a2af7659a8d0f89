#pragma once

#include "pnlsync/events/event.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace pnlsync {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for normalized venue events.
// Venue bindings publish VenueEvent values; the reconciler and the sync
// engine register typed handlers.
//
// Why in architecture: The venue binding must not know which component
// consumes which event kind. The sync engine points the venue's event sink
// at publish(); handlers subscribe per kind. Tests publish directly to drive
// the reconciler without a venue at all.
//
// Thread model: subscribe, unsubscribe and publish are thread-safe.
// Callbacks run synchronously on the publishing thread. In the running
// service that is always the sync worker (the venue is only pumped there),
// which is what makes event handling single-threaded.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const VenueEvent&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published event.
  // Output: SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the published event holds
  // an EventType (e.g. ExecutionEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // What: Removes the subscription. A publish() already in progress may
  // still invoke it once.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Invokes every registered subscriber on the calling thread before
  // returning. The subscriber list is copied under the lock and callbacks
  // run unlocked, so a callback may publish or unsubscribe.
  // -------------------------------------------------------------------------
  void publish(const VenueEvent& event);

  // Live subscriptions. Components that subscribe in their constructor must
  // bring this back down in their destructor.
  std::size_t subscriberCount() const;

 private:
  // Keyed by id, so dispatch order is subscription order.
  using SubscriberMap = std::map<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  SubscriberMap subscribers_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const VenueEvent& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace pnlsync
