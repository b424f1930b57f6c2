// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for riskgate::ThreadSafeQueue<T>, using fill events as payload.
//
// Validates:
//   - Fills come out in the order they went in
//   - try_pop() and popFor() return nullopt instead of blocking forever
//   - close() refuses new pushes but lets queued items drain
//   - close() releases a consumer blocked in pop(); reopen() accepts again
//   - Concurrent producers keep their own ordering
// =============================================================================

#include "riskgate/concurrent/thread_safe_queue.hpp"
#include "riskgate/events/event.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {

riskgate::Event fillEvent(const std::string& fill_id) {
  riskgate::FillEvent e;
  e.fill.fill_id = fill_id;
  e.fill.symbol = "SPY";
  e.fill.quantity = 1;
  e.fill.price = 450.0;
  return e;
}

std::string fillIdOf(const std::optional<riskgate::Event>& event) {
  return std::get<riskgate::FillEvent>(event.value()).fill.fill_id;
}

}  // namespace

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  riskgate::ThreadSafeQueue<riskgate::Event> inbox;
};

// -----------------------------------------------------------------------------
// Why: a SELL queued behind the BUY that opened the position must not
//      overtake it.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FillsKeepOrder) {
  EXPECT_TRUE(inbox.empty());
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(inbox.push(fillEvent("f-" + std::to_string(i))));
  }
  EXPECT_EQ(inbox.size(), 10u);

  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(fillIdOf(inbox.pop()), "f-" + std::to_string(i));
  }
  EXPECT_TRUE(inbox.empty());
}

TEST_F(ThreadSafeQueueTest, NonBlockingAndTimedPops) {
  EXPECT_FALSE(inbox.try_pop().has_value());

  const auto before = std::chrono::steady_clock::now();
  EXPECT_FALSE(inbox.popFor(std::chrono::milliseconds(20)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - before,
            std::chrono::milliseconds(15));

  inbox.push(fillEvent("only"));
  EXPECT_EQ(fillIdOf(inbox.popFor(std::chrono::seconds(1))), "only");
}

// -----------------------------------------------------------------------------
// Why: on shutdown a shard stops accepting events yet still applies the
//      fills it already holds.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseRefusesPushesButDrains) {
  inbox.push(fillEvent("f-1"));
  inbox.push(fillEvent("f-2"));
  inbox.close();

  EXPECT_TRUE(inbox.closed());
  EXPECT_FALSE(inbox.push(fillEvent("late")));
  EXPECT_EQ(fillIdOf(inbox.pop()), "f-1");
  EXPECT_EQ(fillIdOf(inbox.pop()), "f-2");
  EXPECT_FALSE(inbox.pop().has_value());

  inbox.reopen();
  EXPECT_TRUE(inbox.push(fillEvent("again")));
  EXPECT_EQ(fillIdOf(inbox.try_pop()), "again");
}

TEST_F(ThreadSafeQueueTest, CloseReleasesBlockedConsumer) {
  auto consumer = std::async(std::launch::async, [this] { return inbox.pop(); });

  EXPECT_EQ(consumer.wait_for(std::chrono::milliseconds(20)),
            std::future_status::timeout);
  inbox.close();

  ASSERT_EQ(consumer.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_FALSE(consumer.get().has_value());
}

// -----------------------------------------------------------------------------
// Several producers, one consumer: nothing lost, each producer in order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersKeepTheirOrder) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 500;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        inbox.push(fillEvent(std::to_string(p) + ":" + std::to_string(i)));
      }
    });
  }

  std::vector<int> seen(kProducers, 0);
  for (int n = 0; n < kProducers * kPerProducer; ++n) {
    const std::string id = fillIdOf(inbox.pop());
    const auto colon = id.find(':');
    const int producer = std::stoi(id.substr(0, colon));
    EXPECT_EQ(std::stoi(id.substr(colon + 1)), seen[producer]);
    ++seen[producer];
  }
  for (auto& t : producers) t.join();

  EXPECT_EQ(seen, std::vector<int>(kProducers, kPerProducer));
  EXPECT_TRUE(inbox.empty());
}
