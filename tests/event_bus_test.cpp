// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for riskgate::EventBus.
//
// Validates:
//   - Typed subscribers only see their alternative; catch-all sees everything
//   - Callbacks run in subscription order across typed and catch-all entries
//   - unsubscribe() stops delivery and ignores unknown ids
//   - Callbacks may publish and unsubscribe re-entrantly
//   - A throwing callback propagates to the publisher
//
// Cross-thread delivery is covered by admission_engine_test.cpp.
// =============================================================================

#include "riskgate/eventbus/event_bus.hpp"
#include "riskgate/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using riskgate::DecisionEvent;
using riskgate::FillEvent;
using riskgate::SignalEvent;

namespace {

SignalEvent signalFor(const std::string& symbol, std::int64_t quantity) {
  SignalEvent e;
  e.signal.strategy_id = "momo";
  e.signal.symbol = symbol;
  e.signal.side = riskgate::domain::Side::Buy;
  e.signal.quantity = quantity;
  e.signal.price = 100.0;
  return e;
}

DecisionEvent rejectionFor(const std::string& symbol) {
  DecisionEvent e;
  e.session_id = "paper";
  e.signal.symbol = symbol;
  e.decision = riskgate::domain::RiskDecision::reject(
      "frequency", "Daily trade limit reached (1)", 1.0);
  return e;
}

}  // namespace

class EventBusTest : public ::testing::Test {
 protected:
  riskgate::EventBus bus;
  std::vector<std::string> log;
};

// -----------------------------------------------------------------------------
// Why: the IPC bridge subscribes to DecisionEvent; handing it a signal would
//      publish garbage on risk.approved.*.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, RoutesByAlternative) {
  bus.subscribe<DecisionEvent>([this](const DecisionEvent& e) {
    log.push_back("decision:" + e.signal.symbol + ":" +
                  e.decision.reason.value_or(""));
  });
  bus.subscribe<SignalEvent>([this](const SignalEvent& e) {
    log.push_back("signal:" + e.signal.symbol + ":" +
                  std::to_string(e.signal.quantity));
  });
  bus.subscribe([this](const riskgate::Event& e) {
    log.push_back("any:" + std::to_string(e.index()));
  });

  bus.publish(signalFor("TSLA", 237));
  bus.publish(rejectionFor("AAPL"));
  bus.publish(FillEvent{});

  const std::vector<std::string> expected{
      "signal:TSLA:237",
      "any:" + std::to_string(riskgate::Event(SignalEvent{}).index()),
      "decision:AAPL:Daily trade limit reached (1)",
      "any:" + std::to_string(riskgate::Event(DecisionEvent{}).index()),
      "any:" + std::to_string(riskgate::Event(FillEvent{}).index())};
  EXPECT_EQ(log, expected);
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  const auto id =
      bus.subscribe<SignalEvent>([&calls](const SignalEvent&) { ++calls; });

  bus.publish(signalFor("AAPL", 1));
  bus.unsubscribe(id);
  bus.unsubscribe(id);
  bus.unsubscribe(424242);
  bus.publish(signalFor("AAPL", 2));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
  EXPECT_NO_THROW(bus.publish(signalFor("AAPL", 3)));
}

// -----------------------------------------------------------------------------
// Why: callbacks run without the lock held; holding it would deadlock here.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, CallbacksMayReenter) {
  int decisions = 0;
  riskgate::EventBus::SubscriptionId once = 0;
  bus.subscribe<DecisionEvent>(
      [&decisions](const DecisionEvent&) { ++decisions; });
  once = bus.subscribe<SignalEvent>([this, &once](const SignalEvent& e) {
    bus.unsubscribe(once);
    bus.publish(rejectionFor(e.signal.symbol));
  });

  bus.publish(signalFor("MSFT", 5));
  bus.publish(signalFor("MSFT", 5));

  EXPECT_EQ(decisions, 1);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

// -----------------------------------------------------------------------------
// EventLoopThread relies on this to count and log failed dispatches.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingCallbackPropagates) {
  bool later_ran = false;
  bus.subscribe<FillEvent>(
      [](const FillEvent&) { throw std::runtime_error("ledger refused"); });
  bus.subscribe<FillEvent>([&later_ran](const FillEvent&) { later_ran = true; });

  EXPECT_THROW(bus.publish(FillEvent{}), std::runtime_error);
  EXPECT_FALSE(later_ran);
}
