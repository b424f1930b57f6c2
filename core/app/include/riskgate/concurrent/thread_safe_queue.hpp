#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace riskgate {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Unbounded multi-producer / multi-consumer FIFO with a close flag.
//
// Every hand-off between threads goes through one of these, from the bus
// gateway into the session shards and from the shards out to IPC.
//
// close() refuses further pushes and wakes blocked consumers, while items
// already queued can still be popped. A shard relies on this to drain
// accepted fills during shutdown.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Returns false, and drops the value, once the queue is closed.
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(value));
    }
    ready_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() / popFor()
  // -------------------------------------------------------------------------
  // Blocking pop. Returns std::nullopt only when the queue is closed and
  // empty; popFor() also gives up after `timeout`.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
    return takeFrontLocked();
  }

  template <typename Rep, typename Period>
  std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    ready_.wait_for(lock, timeout,
                    [this] { return closed_ || !items_.empty(); });
    return takeFrontLocked();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    return takeFrontLocked();
  }

  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    ready_.notify_all();
  }

  void reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
  }

  // Reported by STATUS as shard backlog.
  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

 private:
  std::optional<T> takeFrontLocked() {
    if (items_.empty()) {
      return std::nullopt;
    }
    std::optional<T> front(std::move(items_.front()));
    items_.pop_front();
    return front;
  }

  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<T> items_;
  bool closed_ = false;
};

}  // namespace riskgate
