#pragma once

#include "optguard/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace optguard {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe channel for decision events.
// DecisionCore publishes; the service forwards to telemetry, tests assert on
// what was published.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread, outside the bus
// lock, so a callback may publish or subscribe again without deadlocking.
//
// Failure model: publish() runs after the decision it reports has already
// been committed. A subscriber that throws is logged and counted; the
// remaining subscribers still receive the event and the publisher never
// sees the exception.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;

  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

  // Subscriber exceptions caught by publish() since construction.
  std::size_t failedDeliveries() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::size_t failed_deliveries_{0};
  std::vector<SubscriberEntry> subscribers_;
};

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

}  // namespace optguard
