// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for riskgate::codec (message and persisted-state JSON).
//
// Validates:
//   - Signal decoding: action/side alias, case, whole-number quantities
//   - Missing or mistyped fields become ValidationError naming the field
//   - Fill commission defaults to zero
//   - Price updates: single symbol and batched form
//   - Decision encoding: null reason on pass, infinite score clamped
//   - Persisted snapshot and daily stats survive a JSON round trip
//   - Audited decisions keep signal, verdict and mode; bad modes are refused
// =============================================================================

#include "riskgate/codec/json_codec.hpp"
#include "riskgate/domain/errors.hpp"

#include <gtest/gtest.h>

#include <limits>

using nlohmann::json;
using riskgate::ValidationError;
using riskgate::domain::Side;
namespace codec = riskgate::codec;

namespace {

json signalJson() {
  return json{{"strategy_id", "momo"}, {"symbol", "AAPL"},
              {"action", "BUY"},       {"quantity", 100},
              {"price", 150.25},       {"backtest_id", "bt-7"},
              {"timestamp_ms", 1700000000000LL}};
}

}  // namespace

TEST(JsonCodecTest, DecodesSignal) {
  auto s = codec::signalFromJson(signalJson());
  EXPECT_EQ(s.strategy_id, "momo");
  EXPECT_EQ(s.symbol, "AAPL");
  EXPECT_EQ(s.side, Side::Buy);
  EXPECT_EQ(s.quantity, 100);
  EXPECT_DOUBLE_EQ(s.price, 150.25);
  EXPECT_EQ(s.backtest_id, "bt-7");
  EXPECT_EQ(s.timestamp_ms, 1700000000000LL);
}

// -----------------------------------------------------------------------------
// "side" is accepted in place of "action", in any case.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, AcceptsSideAliasAnyCase) {
  json j = signalJson();
  j.erase("action");
  j["side"] = "sell";
  EXPECT_EQ(codec::signalFromJson(j).side, Side::Sell);

  j["side"] = "hold";
  EXPECT_THROW(codec::signalFromJson(j), ValidationError);
}

TEST(JsonCodecTest, QuantityMustBeWhole) {
  json j = signalJson();
  j["quantity"] = 100.0;
  EXPECT_EQ(codec::signalFromJson(j).quantity, 100);

  j["quantity"] = 100.5;
  EXPECT_THROW(codec::signalFromJson(j), ValidationError);

  j["quantity"] = "100";
  EXPECT_THROW(codec::signalFromJson(j), ValidationError);
}

// -----------------------------------------------------------------------------
// Why: the error text is what operators see on risk.invalid.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, MissingFieldIsNamed) {
  json j = signalJson();
  j.erase("symbol");
  try {
    codec::signalFromJson(j);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(std::string(e.what()), "signal: missing field 'symbol'");
  }
}

TEST(JsonCodecTest, RejectsNonPositiveValues) {
  json j = signalJson();
  j["quantity"] = 0;
  EXPECT_THROW(codec::signalFromJson(j), ValidationError);

  j = signalJson();
  j["price"] = -1.0;
  EXPECT_THROW(codec::signalFromJson(j), ValidationError);

  EXPECT_THROW(codec::signalFromJson(json::array()), ValidationError);
}

TEST(JsonCodecTest, FillCommissionDefaultsToZero) {
  json j{{"fill_id", "f-1"},  {"strategy_id", "momo"}, {"symbol", "AAPL"},
         {"action", "BUY"},   {"quantity", 10},        {"price", 150.0}};
  auto f = codec::fillFromJson(j);
  EXPECT_EQ(f.fill_id, "f-1");
  EXPECT_DOUBLE_EQ(f.commission, 0.0);
  EXPECT_TRUE(f.backtest_id.empty());

  j["commission"] = 1.5;
  EXPECT_DOUBLE_EQ(codec::fillFromJson(j).commission, 1.5);

  j.erase("fill_id");
  EXPECT_THROW(codec::fillFromJson(j), ValidationError);
}

TEST(JsonCodecTest, DecodesPriceUpdates) {
  auto single = codec::priceUpdateFromJson(
      json{{"symbol", "AAPL"}, {"price", 151.0}, {"backtest_id", "bt-1"}});
  EXPECT_EQ(single.session_id, "bt-1");
  ASSERT_EQ(single.prices.size(), 1u);
  EXPECT_DOUBLE_EQ(single.prices.at("AAPL"), 151.0);

  auto batch = codec::priceUpdateFromJson(
      json{{"prices", {{"AAPL", 151.0}, {"MSFT", 310.5}}}});
  EXPECT_TRUE(batch.session_id.empty());
  EXPECT_EQ(batch.prices.size(), 2u);

  EXPECT_THROW(codec::priceUpdateFromJson(json{{"symbol", "AAPL"}, {"price", 0}}),
               ValidationError);
  EXPECT_THROW(codec::priceUpdateFromJson(json{{"prices", {{"AAPL", -2}}}}),
               ValidationError);
}

TEST(JsonCodecTest, EncodesDecisions) {
  auto pass = codec::decisionToJson(
      riskgate::domain::RiskDecision::pass("all_passed", 0.3));
  EXPECT_TRUE(pass["reason"].is_null());
  EXPECT_EQ(pass["passed"], true);
  EXPECT_TRUE(pass["details"].is_object());

  auto reject = codec::decisionToJson(riskgate::domain::RiskDecision::reject(
      "exposure", "no room", std::numeric_limits<double>::infinity()));
  EXPECT_EQ(reject["reason"], "no room");
  EXPECT_DOUBLE_EQ(reject["score"].get<double>(),
                   std::numeric_limits<double>::max());
  // The dump must stay valid JSON.
  EXPECT_NO_THROW(json::parse(reject.dump()));
}

// -----------------------------------------------------------------------------
// Persisted snapshot: optional last_price and processed ids survive.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, SnapshotSurvivesRoundTrip) {
  riskgate::domain::LedgerSnapshot snap;
  snap.session_id = "bt-1";
  snap.cash = 54999.0;
  snap.initial_capital = 100000.0;
  snap.peak_value = 100000.0;
  snap.total_commissions = 1.0;
  snap.total_trades = 1;
  snap.last_transaction_id = 1;
  riskgate::domain::Position pos;
  pos.symbol = "SPY";
  pos.quantity = 100;
  pos.average_price = 450.0;
  snap.positions.push_back(pos);
  snap.processed_fill_ids = {"f1"};

  auto back = codec::snapshotFromJson(
      json::parse(codec::snapshotToJson(snap).dump()));

  EXPECT_EQ(back.session_id, "bt-1");
  EXPECT_DOUBLE_EQ(back.cash, 54999.0);
  EXPECT_EQ(back.last_transaction_id, 1u);
  ASSERT_EQ(back.positions.size(), 1u);
  EXPECT_FALSE(back.positions[0].last_price.has_value());
  EXPECT_EQ(back.processed_fill_ids, std::vector<std::string>{"f1"});
}

TEST(JsonCodecTest, DailyStatsSurviveRoundTrip) {
  riskgate::domain::DailyStats stats;
  stats.trading_day = 19675;
  stats.total_trades = 4;
  stats.realized_pnl = -250.0;
  stats.consecutive_losses = 2;
  stats.symbol_counts["AAPL"] = 3;
  stats.recent_timestamps_ms = {1000, 2000};
  stats.last_trade_ms = 2000;

  auto back = codec::dailyStatsFromJson(
      json::parse(codec::dailyStatsToJson(stats).dump()));

  EXPECT_EQ(back.trading_day, 19675);
  EXPECT_EQ(back.total_trades, 4);
  EXPECT_DOUBLE_EQ(back.realized_pnl, -250.0);
  EXPECT_EQ(back.symbolCount("AAPL"), 3);
  EXPECT_EQ(back.recent_timestamps_ms.size(), 2u);
  EXPECT_EQ(back.last_trade_ms.value(), 2000);
}

TEST(JsonCodecTest, DecisionRecordKeepsVerdictAndMode) {
  riskgate::domain::DecisionRecord record;
  record.session_id = "bt-7";
  record.signal = codec::signalFromJson(signalJson());
  record.decision = riskgate::domain::RiskDecision::reject(
      "exposure", "Exposure too high", 1.2, {{"exposure", 0.97}});
  record.mode = riskgate::domain::TradingMode::Defensive;
  record.degraded = true;
  record.decided_at_ms = 1700000000500LL;

  json j = codec::decisionRecordToJson(record);
  EXPECT_EQ(j["mode"], "DEFENSIVE");
  EXPECT_EQ(j["decision"]["passed"], false);

  auto back = codec::decisionRecordFromJson(j);
  EXPECT_EQ(back.session_id, "bt-7");
  EXPECT_EQ(back.signal.quantity, 100);
  EXPECT_EQ(back.decision.rule_name, "exposure");
  EXPECT_EQ(back.decision.reason.value(), "Exposure too high");
  EXPECT_EQ(back.mode, riskgate::domain::TradingMode::Defensive);
  EXPECT_TRUE(back.degraded);
  EXPECT_EQ(back.decided_at_ms, 1700000000500LL);

  j["mode"] = "PANIC";
  EXPECT_THROW(codec::decisionRecordFromJson(j), ValidationError);
}
