#pragma once

#include "riskgate/concurrent/thread_safe_queue.hpp"
#include "riskgate/eventbus/event_bus.hpp"
#include "riskgate/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

namespace riskgate {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// A named worker that pops events from its inbox and publishes them on its
// own EventBus. Subscribers therefore always run on the worker, one event at
// a time, in the order the events were pushed.
//
// AdmissionEngine owns one loop per session shard and one "outbound" loop
// that fans decisions and alerts out to the IPC publisher.
//
// Lifecycle: start() and stop() belong to the owner. push() and subscribe()
// may be called from any thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "loop");
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;

  // Opens the inbox and spawns the worker. No-op while running.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Closes the inbox and joins the worker once everything already queued has
  // been published, so fills accepted before shutdown still reach the
  // ledger. Idempotent; the loop can be started again.
  // -------------------------------------------------------------------------
  void stop();

  // False when the inbox is closed; the event is then dropped.
  bool push(Event event);

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }
  std::size_t pending() const { return inbox_.size(); }

  // Events whose subscribers threw. Kept for STATUS.
  std::uint64_t failedDispatches() const { return failed_dispatches_.load(); }

 private:
  void run();
  void dispatch(const Event& event);

  std::string name_;
  ThreadSafeQueue<Event> inbox_;
  EventBus bus_;
  std::atomic<std::uint64_t> failed_dispatches_{0};
  std::thread worker_;
};

}  // namespace riskgate
