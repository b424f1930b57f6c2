#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace riskgate {

// -----------------------------------------------------------------------------
// PeriodicTask: cancellable background job with an observable completion
// -----------------------------------------------------------------------------
//
// @brief  Runs `job` every `interval` on its own thread until cancel() is
//         called. Used for periodic ledger snapshots and stale-pending
//         eviction.
//
// @details
// The handle is explicit: the owner holds it, cancels it, and can wait on
// completion() to know the final run has finished. Cancellation wakes the
// thread immediately rather than waiting out the interval.
//
// If run_on_cancel is true the job runs one last time after cancellation,
// which gives the shutdown snapshot for free.
//
// A job that throws is logged and the schedule continues.
//
// Thread model:
//   start() and cancel() from the owning thread. The job runs only on the
//   task thread.
// -----------------------------------------------------------------------------
class PeriodicTask {
 public:
  using Job = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval, Job job,
               bool run_on_cancel = false);

  // Cancels and joins.
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;
  PeriodicTask(PeriodicTask&&) = delete;
  PeriodicTask& operator=(PeriodicTask&&) = delete;

  // Spawns the task thread. Calling start() twice is a no-op.
  void start();

  // Sets the cancel flag, wakes the thread and joins it. Idempotent.
  void cancel();

  bool cancelled() const { return cancelled_.load(); }

  // Number of completed job runs (including a final run on cancel).
  std::uint64_t runs() const { return runs_.load(); }

  // Becomes ready once the task thread has exited.
  std::shared_future<void> completion() const { return completion_; }

 private:
  void run();
  void runJobOnce();

  std::string name_;
  std::chrono::milliseconds interval_;
  Job job_;
  bool run_on_cancel_;

  bool started_{false};  // Owner thread only
  std::atomic<bool> cancelled_{false};
  std::atomic<std::uint64_t> runs_{0};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::promise<void> done_;
  std::shared_future<void> completion_;
  std::thread thread_;
};

}  // namespace riskgate
