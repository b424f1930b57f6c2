#include "riskgate/eventbus/event_bus.hpp"

#include <algorithm>

namespace riskgate {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  return add(kAnyEvent, std::move(callback));
}

EventBus::SubscriptionId EventBus::add(std::size_t event_index,
                                       GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscriptions_.push_back(Subscription{id, event_index, std::move(callback)});
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                         [id](const Subscription& s) { return s.id == id; });
  if (it != subscriptions_.end()) {
    subscriptions_.erase(it);
  }
}

void EventBus::publish(const Event& event) {
  std::vector<GenericCallback> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& s : subscriptions_) {
      if (s.event_index == kAnyEvent || s.event_index == event.index()) {
        targets.push_back(s.callback);
      }
    }
  }
  for (const auto& callback : targets) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscriptions_.size();
}

}  // namespace riskgate
