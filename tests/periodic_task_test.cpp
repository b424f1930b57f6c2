// =============================================================================
// periodic_task_test.cpp
// =============================================================================
// Unit tests for riskgate::PeriodicTask.
//
// Validates:
//   - The job runs repeatedly at the configured interval
//   - cancel() stops the schedule and completes the completion future
//   - run_on_cancel gives one final run (final snapshot on shutdown)
//   - cancel() before start() still completes the future
//   - A throwing job is logged and does not end the schedule
// =============================================================================

#include "riskgate/concurrent/periodic_task.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

// -----------------------------------------------------------------------------
// 1. The job runs more than once within a few intervals.
// -----------------------------------------------------------------------------
TEST(PeriodicTaskTest, RunsRepeatedly) {
  std::atomic<int> runs{0};
  riskgate::PeriodicTask task("tick", 5ms, [&runs] { runs.fetch_add(1); });
  task.start();

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (runs.load() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  task.cancel();

  EXPECT_GE(runs.load(), 3);
  EXPECT_GE(task.runs(), 3u);
}

// -----------------------------------------------------------------------------
// 2. cancel() wakes a long sleep promptly and completes the future.
// Why: Engine shutdown must not wait out a 60 s snapshot interval.
// -----------------------------------------------------------------------------
TEST(PeriodicTaskTest, CancelCompletesFuturePromptly) {
  std::atomic<int> runs{0};
  riskgate::PeriodicTask task("slow", 60s, [&runs] { runs.fetch_add(1); });
  task.start();

  const auto begin = std::chrono::steady_clock::now();
  task.cancel();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_TRUE(task.cancelled());
  EXPECT_EQ(task.completion().wait_for(0ms), std::future_status::ready);
  EXPECT_LT(elapsed, 1s);
  EXPECT_EQ(runs.load(), 0);
}

// -----------------------------------------------------------------------------
// 3. With run_on_cancel the job runs exactly once more on cancel.
// Why: The engine relies on this for the final snapshot at shutdown.
// -----------------------------------------------------------------------------
TEST(PeriodicTaskTest, RunOnCancelRunsFinalPass) {
  std::atomic<int> runs{0};
  riskgate::PeriodicTask task("final", 60s, [&runs] { runs.fetch_add(1); },
                              /*run_on_cancel=*/true);
  task.start();
  task.cancel();

  EXPECT_EQ(runs.load(), 1);
  EXPECT_EQ(task.completion().wait_for(0ms), std::future_status::ready);
}

// -----------------------------------------------------------------------------
// 4. Cancelling a task that never started completes its future, and a later
//    start() is ignored.
// -----------------------------------------------------------------------------
TEST(PeriodicTaskTest, CancelBeforeStart) {
  std::atomic<int> runs{0};
  riskgate::PeriodicTask task("never", 1ms, [&runs] { runs.fetch_add(1); });
  task.cancel();
  task.start();

  EXPECT_EQ(task.completion().wait_for(0ms), std::future_status::ready);
  std::this_thread::sleep_for(10ms);
  EXPECT_EQ(runs.load(), 0);
}

// -----------------------------------------------------------------------------
// 5. A job that throws keeps being scheduled.
// Why: One failed snapshot write must not stop later ones.
// -----------------------------------------------------------------------------
TEST(PeriodicTaskTest, ThrowingJobKeepsSchedule) {
  std::atomic<int> attempts{0};
  riskgate::PeriodicTask task("flaky", 2ms, [&attempts] {
    attempts.fetch_add(1);
    throw std::runtime_error("store offline");
  });
  task.start();

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (attempts.load() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  task.cancel();

  EXPECT_GE(attempts.load(), 3);
}
