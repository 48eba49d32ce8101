#pragma once

#include "tradecall/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradecall {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe channel for Event values.
// The parser, execution, monitor and router components report everything they
// do here; logging, IPC telemetry and tests are plain subscribers.
//
// Thread model: subscribe, unsubscribe and publish may be called from any
// thread. Callbacks run synchronously on the publishing thread, so an event
// published by the monitor thread is delivered on the monitor thread and one
// published by the signal loop is delivered on the signal loop.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback for every published event.
  // Output: Id for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback that only sees events holding EventType.
  // Implemented as a generic subscription filtered with std::get_if.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // What: Removes a subscription. A publish() already in flight on another
  // thread may still deliver its current event to the removed callback.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Invokes every subscriber with `event` before returning.
  // Thread-safety: The subscriber list is copied under the lock and the
  // callbacks run unlocked, so a callback may publish or unsubscribe.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Number of live subscriptions. Used by tests to check RAII unsubscription.
  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Guards subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Typed subscribe: wrap in a generic callback that filters on the variant.
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace tradecall
