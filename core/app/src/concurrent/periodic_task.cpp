#include "riskgate/concurrent/periodic_task.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace riskgate {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval, Job job,
                           bool run_on_cancel)
    : name_(std::move(name)),
      interval_(interval),
      job_(std::move(job)),
      run_on_cancel_(run_on_cancel),
      completion_(done_.get_future().share()) {}

PeriodicTask::~PeriodicTask() { cancel(); }

void PeriodicTask::start() {
  if (started_ || cancelled_.load()) {
    return;
  }
  started_ = true;
  thread_ = std::thread([this] { run(); });
}

void PeriodicTask::cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_.store(true);
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  } else if (!started_) {
    // Never started: nothing will run, complete the handle here.
    started_ = true;
    done_.set_value();
  }
}

// -----------------------------------------------------------------------------
// run(): sleep for the interval (or until cancelled), then run the job
// -----------------------------------------------------------------------------
void PeriodicTask::run() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [this] { return cancelled_.load(); })) {
        break;
      }
    }
    runJobOnce();
  }

  if (run_on_cancel_) {
    runJobOnce();
  }
  done_.set_value();
}

void PeriodicTask::runJobOnce() {
  try {
    job_();
  } catch (const std::exception& e) {
    std::cerr << "[PeriodicTask:" << name_ << "] ERROR: " << e.what() << "\n";
  }
  runs_.fetch_add(1);
}

}  // namespace riskgate
