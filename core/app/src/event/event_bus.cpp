#include "optguard/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <iterator>
#include <variant>

namespace optguard {

namespace {

const char* eventName(const Event& event) {
  static constexpr const char* kNames[] = {
      "PhaseTransitionEvent", "RegimeChangeEvent",  "AdmissionDecisionEvent",
      "LifecycleActionEvent", "ProtocolChangeEvent", "CoreHaltEvent"};
  static_assert(std::size(kNames) == std::variant_size_v<Event>);
  return kNames[event.index()];
}

}  // namespace

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& [id, callback] : snapshot) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      std::size_t failures = 0;
      {
        std::lock_guard lock(mutex_);
        failures = ++failed_deliveries_;
      }
      std::cerr << "[EventBus] subscriber " << id << " threw on "
                << eventName(event) << ": " << e.what() << " (" << failures
                << " failed deliveries)\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

std::size_t EventBus::failedDeliveries() const {
  std::lock_guard lock(mutex_);
  return failed_deliveries_;
}

}  // namespace optguard
