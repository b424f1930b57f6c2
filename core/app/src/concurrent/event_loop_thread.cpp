#include "riskgate/concurrent/event_loop_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace riskgate {

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {
  // Closed until start(): events pushed to a loop that never ran are refused
  // rather than silently parked.
  inbox_.close();
}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (worker_.joinable()) {
    return;
  }
  inbox_.reopen();
  worker_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!worker_.joinable()) {
    return;
  }
  inbox_.close();
  worker_.join();
  if (failed_dispatches_.load() > 0) {
    std::cerr << "[EventLoopThread:" << name_ << "] stopped with "
              << failed_dispatches_.load() << " failed dispatch(es)\n";
  }
}

bool EventLoopThread::push(Event event) {
  if (!inbox_.push(std::move(event))) {
    std::cerr << "[EventLoopThread:" << name_
              << "] WARNING: inbox closed, event dropped\n";
    return false;
  }
  return true;
}

// Runs until the inbox is closed AND empty: pop() only returns nullopt then.
void EventLoopThread::run() {
  while (std::optional<Event> event = inbox_.pop()) {
    dispatch(*event);
  }
}

void EventLoopThread::dispatch(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    ++failed_dispatches_;
    std::cerr << "[EventLoopThread:" << name_
              << "] ERROR: subscriber threw: " << e.what() << "\n";
  }
}

}  // namespace riskgate
