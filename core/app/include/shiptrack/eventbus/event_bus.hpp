#pragma once

#include "shiptrack/events/domain_event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace shiptrack {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish-subscribe channel for observers of
// committed domain events (the demo printer, tests, ad-hoc projections).
// EventChoreographer forwards every event it routes here after the fixed
// cross-context subscribers have run.
//
// The bus is deliberately not the routing mechanism between contexts: the
// subscription table lives in EventChoreographer and cannot be changed at
// runtime. Bus subscribers are observers only.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe and publish
// from any thread. Callbacks run synchronously on the publishing thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const events::DomainEvent&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked for every published event.
  // Returns the id to pass to unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<Payload>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only for events whose payload holds
  // Payload, e.g. subscribe<events::GeofenceEntered>(...). The callback
  // receives the envelope and the unwrapped payload.
  // -------------------------------------------------------------------------
  template <typename Payload>
  SubscriptionId subscribe(
      std::function<void(const events::DomainEvent&, const Payload&)> callback);

  // Future publishes skip the callback. A publish already in progress on
  // another thread may still invoke it once.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every registered callback on the calling thread. The subscriber
  // list is copied under the lock and the callbacks run without it, so a
  // callback may publish or unsubscribe without deadlocking.
  //
  // An exception thrown by a callback propagates to the caller and skips the
  // remaining callbacks. EventChoreographer catches it per event.
  // -------------------------------------------------------------------------
  void publish(const events::DomainEvent& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
// Wraps the typed callback in a generic one that checks the payload variant
// with std::get_if and ignores every other kind.
// -----------------------------------------------------------------------------
template <typename Payload>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const events::DomainEvent&, const Payload&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](
                                const events::DomainEvent& event) {
    if (const auto* payload = std::get_if<Payload>(&event.payload)) {
      cb(event, *payload);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace shiptrack
