#pragma once

#include "riskgate/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <type_traits>
#include <variant>
#include <vector>

namespace riskgate {

namespace detail {

// Position of T among the alternatives of Event, resolved at compile time.
template <typename T, typename Variant>
struct EventIndex;

template <typename T, typename... Alternatives>
struct EventIndex<T, std::variant<Alternatives...>> {
  static constexpr std::size_t compute() {
    constexpr bool matches[] = {std::is_same_v<T, Alternatives>...};
    for (std::size_t i = 0; i < sizeof...(Alternatives); ++i) {
      if (matches[i]) {
        return i;
      }
    }
    return sizeof...(Alternatives);
  }
  static constexpr std::size_t value = compute();
  static_assert(value < sizeof...(Alternatives), "T is not an Event type");
};

}  // namespace detail

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe for Event values. The bus
// gateway, the shards and the IPC publisher only meet here.
//
// Subscriptions are either typed (one Event alternative) or catch-all.
// publish() routes on event.index(), so a SignalEvent never reaches a
// DecisionEvent subscriber at all.
//
// Thread model: every method is safe from any thread. Callbacks run on the
// publishing thread, which inside an EventLoopThread is its worker.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Catch-all subscription: sees every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Typed subscription, e.g. subscribe<FillEvent>(...).
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback) {
    constexpr std::size_t index = detail::EventIndex<EventType, Event>::value;
    return add(index, [cb = std::move(callback)](const Event& event) {
      cb(*std::get_if<index>(&event));
    });
  }

  // Unknown ids are ignored. A publish already running on another thread
  // may still deliver to the removed callback once.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Collects the matching callbacks under the lock, then runs them unlocked
  // in subscription order. Callbacks may therefore publish or unsubscribe
  // re-entrantly. An exception from a callback propagates to the caller and
  // skips the remaining callbacks.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  // Sentinel for catch-all entries.
  static constexpr std::size_t kAnyEvent = std::variant_size_v<Event>;

  struct Subscription {
    SubscriptionId id;
    std::size_t event_index;
    GenericCallback callback;
  };

  SubscriptionId add(std::size_t event_index, GenericCallback callback);

  mutable std::mutex mutex_;
  SubscriptionId next_id_{1};
  std::vector<Subscription> subscriptions_;
};

}  // namespace riskgate
