#include "riskgate/codec/json_codec.hpp"
#include "riskgate/domain/errors.hpp"
#include "riskgate/domain/validation.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace riskgate {
namespace codec {

namespace {

using nlohmann::json;

// JSON has no infinity; an unbounded score is written as the largest double.
double finiteOrMax(double value) {
  if (std::isfinite(value)) {
    return value;
  }
  return value > 0 ? std::numeric_limits<double>::max()
                   : std::numeric_limits<double>::lowest();
}

// Field accessors for inbound messages. Every failure becomes a
// ValidationError that names the message kind and the field.
const json& required(const json& j, const char* kind, const char* field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    throw ValidationError(std::string(kind) + ": missing field '" + field +
                          "'");
  }
  return *it;
}

std::string requiredString(const json& j, const char* kind,
                           const char* field) {
  const json& v = required(j, kind, field);
  if (!v.is_string()) {
    throw ValidationError(std::string(kind) + ": field '" + field +
                          "' must be a string");
  }
  return v.get<std::string>();
}

std::string optionalString(const json& j, const char* field) {
  auto it = j.find(field);
  if (it == j.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

double requiredNumber(const json& j, const char* kind, const char* field) {
  const json& v = required(j, kind, field);
  if (!v.is_number()) {
    throw ValidationError(std::string(kind) + ": field '" + field +
                          "' must be a number");
  }
  return v.get<double>();
}

// Whole share counts only. 100.0 is accepted, 100.5 is not.
std::int64_t requiredQuantity(const json& j, const char* kind) {
  const json& v = required(j, kind, "quantity");
  if (v.is_number_integer()) {
    return v.get<std::int64_t>();
  }
  if (v.is_number_float()) {
    const double d = v.get<double>();
    if (std::isfinite(d) && std::floor(d) == d) {
      return static_cast<std::int64_t>(d);
    }
  }
  throw ValidationError(std::string(kind) +
                        ": field 'quantity' must be a whole number");
}

std::int64_t optionalTimestamp(const json& j) {
  auto it = j.find("timestamp_ms");
  if (it == j.end() || !it->is_number()) {
    return 0;
  }
  return it->get<std::int64_t>();
}

// Signals historically used "action"; "side" is accepted as an alias.
domain::Side requiredSide(const json& j, const char* kind) {
  if (j.contains("action")) {
    return sideFromString(requiredString(j, kind, "action"));
  }
  return sideFromString(requiredString(j, kind, "side"));
}

void requireObject(const json& j, const char* kind) {
  if (!j.is_object()) {
    throw ValidationError(std::string(kind) + ": payload must be an object");
  }
}

}  // namespace

domain::Side sideFromString(const std::string& text) {
  std::string upper(text);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "BUY") {
    return domain::Side::Buy;
  }
  if (upper == "SELL") {
    return domain::Side::Sell;
  }
  throw ValidationError("unknown action '" + text + "'");
}

domain::TradingMode tradingModeFromString(const std::string& text) {
  if (text == "NORMAL") {
    return domain::TradingMode::Normal;
  }
  if (text == "DEFENSIVE") {
    return domain::TradingMode::Defensive;
  }
  if (text == "LOCKDOWN") {
    return domain::TradingMode::Lockdown;
  }
  throw ValidationError("unknown trading mode '" + text + "'");
}

// -----------------------------------------------------------------------------
// Signals and fills
// -----------------------------------------------------------------------------
domain::TradeSignal signalFromJson(const json& j) {
  requireObject(j, "signal");
  domain::TradeSignal signal;
  signal.strategy_id = requiredString(j, "signal", "strategy_id");
  signal.symbol = requiredString(j, "signal", "symbol");
  signal.side = requiredSide(j, "signal");
  signal.quantity = requiredQuantity(j, "signal");
  signal.price = requiredNumber(j, "signal", "price");
  signal.backtest_id = optionalString(j, "backtest_id");
  signal.timestamp_ms = optionalTimestamp(j);
  domain::validate(signal);
  return signal;
}

json signalToJson(const domain::TradeSignal& signal) {
  json j;
  j["strategy_id"] = signal.strategy_id;
  j["symbol"] = signal.symbol;
  j["action"] = domain::sideToString(signal.side);
  j["quantity"] = signal.quantity;
  j["price"] = signal.price;
  if (!signal.backtest_id.empty()) {
    j["backtest_id"] = signal.backtest_id;
  }
  if (signal.timestamp_ms != 0) {
    j["timestamp_ms"] = signal.timestamp_ms;
  }
  return j;
}

domain::Fill fillFromJson(const json& j) {
  requireObject(j, "fill");
  domain::Fill fill;
  fill.fill_id = requiredString(j, "fill", "fill_id");
  fill.strategy_id = optionalString(j, "strategy_id");
  fill.symbol = requiredString(j, "fill", "symbol");
  fill.side = requiredSide(j, "fill");
  fill.quantity = requiredQuantity(j, "fill");
  fill.price = requiredNumber(j, "fill", "price");
  fill.commission = j.contains("commission")
                        ? requiredNumber(j, "fill", "commission")
                        : 0.0;
  fill.backtest_id = optionalString(j, "backtest_id");
  fill.timestamp_ms = optionalTimestamp(j);
  domain::validate(fill);
  return fill;
}

json fillToJson(const domain::Fill& fill) {
  json j;
  j["fill_id"] = fill.fill_id;
  j["strategy_id"] = fill.strategy_id;
  j["symbol"] = fill.symbol;
  j["action"] = domain::sideToString(fill.side);
  j["quantity"] = fill.quantity;
  j["price"] = fill.price;
  j["commission"] = fill.commission;
  if (!fill.backtest_id.empty()) {
    j["backtest_id"] = fill.backtest_id;
  }
  if (fill.timestamp_ms != 0) {
    j["timestamp_ms"] = fill.timestamp_ms;
  }
  return j;
}

PriceUpdate priceUpdateFromJson(const json& j) {
  requireObject(j, "price update");
  PriceUpdate update;
  update.session_id = optionalString(j, "backtest_id");
  update.timestamp_ms = optionalTimestamp(j);

  auto batch = j.find("prices");
  if (batch != j.end()) {
    if (!batch->is_object()) {
      throw ValidationError("price update: 'prices' must be an object");
    }
    for (const auto& [symbol, price] : batch->items()) {
      if (!price.is_number() || price.get<double>() <= 0.0) {
        throw ValidationError("price update: invalid price for " + symbol);
      }
      update.prices[symbol] = price.get<double>();
    }
  } else {
    const std::string symbol = requiredString(j, "price update", "symbol");
    const double price = requiredNumber(j, "price update", "price");
    if (!std::isfinite(price) || price <= 0.0) {
      throw ValidationError("price update: price must be positive for " +
                            symbol);
    }
    update.prices[symbol] = price;
  }
  return update;
}

json decisionToJson(const domain::RiskDecision& decision) {
  json j;
  j["rule"] = decision.rule_name;
  j["passed"] = decision.passed;
  j["reason"] = decision.reason ? json(*decision.reason) : json(nullptr);
  j["score"] = finiteOrMax(decision.score);
  j["details"] = decision.details;
  return j;
}

domain::RiskDecision decisionFromJson(const json& j) {
  domain::RiskDecision decision;
  decision.rule_name = j.at("rule").get<std::string>();
  decision.passed = j.at("passed").get<bool>();
  const json& reason = j.at("reason");
  if (!reason.is_null()) {
    decision.reason = reason.get<std::string>();
  }
  decision.score = j.value("score", 0.0);
  decision.details = j.value("details", json::object());
  return decision;
}

json decisionRecordToJson(const domain::DecisionRecord& record) {
  json j;
  j["session_id"] = record.session_id;
  j["signal"] = signalToJson(record.signal);
  j["decision"] = decisionToJson(record.decision);
  j["mode"] = domain::tradingModeToString(record.mode);
  j["degraded"] = record.degraded;
  j["decided_at_ms"] = record.decided_at_ms;
  return j;
}

domain::DecisionRecord decisionRecordFromJson(const json& j) {
  domain::DecisionRecord record;
  record.session_id = j.at("session_id").get<std::string>();
  record.signal = signalFromJson(j.at("signal"));
  record.decision = decisionFromJson(j.at("decision"));
  record.mode = tradingModeFromString(j.at("mode").get<std::string>());
  record.degraded = j.value("degraded", false);
  record.decided_at_ms = j.value("decided_at_ms", std::int64_t{0});
  return record;
}

// -----------------------------------------------------------------------------
// Ledger state
// -----------------------------------------------------------------------------
json positionToJson(const domain::Position& position) {
  json j;
  j["symbol"] = position.symbol;
  j["quantity"] = position.quantity;
  j["average_price"] = position.average_price;
  j["last_price"] =
      position.last_price ? json(*position.last_price) : json(nullptr);
  j["unrealized_pnl"] = position.unrealized_pnl;
  j["realized_pnl"] = position.realized_pnl;
  return j;
}

domain::Position positionFromJson(const json& j) {
  domain::Position position;
  position.symbol = j.at("symbol").get<std::string>();
  position.quantity = j.at("quantity").get<std::int64_t>();
  position.average_price = j.at("average_price").get<double>();
  const json& last = j.at("last_price");
  if (!last.is_null()) {
    position.last_price = last.get<double>();
  }
  position.unrealized_pnl = j.value("unrealized_pnl", 0.0);
  position.realized_pnl = j.value("realized_pnl", 0.0);
  return position;
}

json portfolioStateToJson(const domain::PortfolioState& state) {
  json j;
  j["session_id"] = state.session_id;
  j["cash"] = state.cash;
  j["initial_capital"] = state.initial_capital;
  j["portfolio_value"] = state.portfolio_value;
  j["buying_power"] = state.buying_power;
  j["exposure"] = state.exposure;
  j["peak_value"] = state.peak_value;
  j["drawdown"] = state.drawdown;
  j["total_realized_pnl"] = state.total_realized_pnl;
  j["total_unrealized_pnl"] = state.total_unrealized_pnl;
  j["total_commissions"] = state.total_commissions;
  j["total_trades"] = state.total_trades;
  json positions = json::array();
  for (const auto& [symbol, pos] : state.positions) {
    positions.push_back(positionToJson(pos));
  }
  j["positions"] = std::move(positions);
  return j;
}

json snapshotToJson(const domain::LedgerSnapshot& snapshot) {
  json j;
  j["session_id"] = snapshot.session_id;
  j["cash"] = snapshot.cash;
  j["initial_capital"] = snapshot.initial_capital;
  j["peak_value"] = snapshot.peak_value;
  j["total_realized_pnl"] = snapshot.total_realized_pnl;
  j["total_unrealized_pnl"] = snapshot.total_unrealized_pnl;
  j["total_commissions"] = snapshot.total_commissions;
  j["total_trades"] = snapshot.total_trades;
  j["last_transaction_id"] = snapshot.last_transaction_id;
  j["taken_at_ms"] = snapshot.taken_at_ms;
  json positions = json::array();
  for (const auto& pos : snapshot.positions) {
    positions.push_back(positionToJson(pos));
  }
  j["positions"] = std::move(positions);
  j["processed_fill_ids"] = snapshot.processed_fill_ids;
  return j;
}

domain::LedgerSnapshot snapshotFromJson(const json& j) {
  domain::LedgerSnapshot snapshot;
  snapshot.session_id = j.at("session_id").get<std::string>();
  snapshot.cash = j.at("cash").get<double>();
  snapshot.initial_capital = j.at("initial_capital").get<double>();
  snapshot.peak_value = j.at("peak_value").get<double>();
  snapshot.total_realized_pnl = j.at("total_realized_pnl").get<double>();
  snapshot.total_unrealized_pnl = j.value("total_unrealized_pnl", 0.0);
  snapshot.total_commissions = j.at("total_commissions").get<double>();
  snapshot.total_trades = j.at("total_trades").get<std::int64_t>();
  snapshot.last_transaction_id =
      j.at("last_transaction_id").get<std::uint64_t>();
  snapshot.taken_at_ms = j.value("taken_at_ms", std::int64_t{0});
  for (const auto& pos : j.at("positions")) {
    snapshot.positions.push_back(positionFromJson(pos));
  }
  snapshot.processed_fill_ids =
      j.value("processed_fill_ids", std::vector<std::string>{});
  return snapshot;
}

json transactionToJson(const domain::TransactionRecord& record) {
  json j;
  j["id"] = record.id;
  j["session_id"] = record.session_id;
  j["fill_id"] = record.fill_id;
  j["strategy_id"] = record.strategy_id;
  j["symbol"] = record.symbol;
  j["action"] = domain::sideToString(record.side);
  j["quantity"] = record.quantity;
  j["price"] = record.price;
  j["commission"] = record.commission;
  j["amount"] = record.amount;
  j["realized_pnl"] =
      record.realized_pnl ? json(*record.realized_pnl) : json(nullptr);
  j["cash_before"] = record.cash_before;
  j["cash_after"] = record.cash_after;
  j["portfolio_value_before"] = record.portfolio_value_before;
  j["portfolio_value_after"] = record.portfolio_value_after;
  j["timestamp_ms"] = record.timestamp_ms;
  return j;
}

domain::TransactionRecord transactionFromJson(const json& j) {
  domain::TransactionRecord record;
  record.id = j.at("id").get<std::uint64_t>();
  record.session_id = j.at("session_id").get<std::string>();
  record.fill_id = j.at("fill_id").get<std::string>();
  record.strategy_id = j.value("strategy_id", std::string{});
  record.symbol = j.at("symbol").get<std::string>();
  record.side = sideFromString(j.at("action").get<std::string>());
  record.quantity = j.at("quantity").get<std::int64_t>();
  record.price = j.at("price").get<double>();
  record.commission = j.at("commission").get<double>();
  record.amount = j.value("amount", 0.0);
  const json& realized = j.at("realized_pnl");
  if (!realized.is_null()) {
    record.realized_pnl = realized.get<double>();
  }
  record.cash_before = j.value("cash_before", 0.0);
  record.cash_after = j.value("cash_after", 0.0);
  record.portfolio_value_before = j.value("portfolio_value_before", 0.0);
  record.portfolio_value_after = j.value("portfolio_value_after", 0.0);
  record.timestamp_ms = j.value("timestamp_ms", std::int64_t{0});
  return record;
}

json dailyStatsToJson(const domain::DailyStats& stats) {
  json j;
  j["trading_day"] = stats.trading_day;
  j["total_trades"] = stats.total_trades;
  j["approved_trades"] = stats.approved_trades;
  j["rejected_trades"] = stats.rejected_trades;
  j["realized_pnl"] = stats.realized_pnl;
  j["consecutive_losses"] = stats.consecutive_losses;
  j["consecutive_wins"] = stats.consecutive_wins;
  j["symbol_counts"] = stats.symbol_counts;
  j["recent_timestamps_ms"] = stats.recent_timestamps_ms;
  j["last_trade_ms"] =
      stats.last_trade_ms ? json(*stats.last_trade_ms) : json(nullptr);
  return j;
}

domain::DailyStats dailyStatsFromJson(const json& j) {
  domain::DailyStats stats;
  stats.trading_day = j.at("trading_day").get<std::int64_t>();
  stats.total_trades = j.at("total_trades").get<std::int64_t>();
  stats.approved_trades = j.value("approved_trades", std::int64_t{0});
  stats.rejected_trades = j.value("rejected_trades", std::int64_t{0});
  stats.realized_pnl = j.at("realized_pnl").get<double>();
  stats.consecutive_losses = j.value("consecutive_losses", 0);
  stats.consecutive_wins = j.value("consecutive_wins", 0);
  stats.symbol_counts =
      j.value("symbol_counts",
              std::unordered_map<std::string, std::int64_t>{});
  stats.recent_timestamps_ms =
      j.value("recent_timestamps_ms", std::deque<std::int64_t>{});
  auto last = j.find("last_trade_ms");
  if (last != j.end() && !last->is_null()) {
    stats.last_trade_ms = last->get<std::int64_t>();
  }
  return stats;
}

json performanceToJson(const domain::PerformanceMetrics& metrics) {
  json j;
  j["initial_capital"] = metrics.initial_capital;
  j["final_value"] = metrics.final_value;
  j["total_return"] = metrics.total_return;
  j["total_return_pct"] = metrics.total_return_pct;
  j["total_transactions"] = metrics.total_transactions;
  j["closing_trades"] = metrics.closing_trades;
  j["wins"] = metrics.wins;
  j["losses"] = metrics.losses;
  j["win_rate_pct"] = metrics.win_rate_pct;
  j["gross_profit"] = metrics.gross_profit;
  j["gross_loss"] = metrics.gross_loss;
  j["profit_factor"] = metrics.profit_factor;
  j["max_drawdown"] = metrics.max_drawdown;
  j["max_drawdown_pct"] = metrics.max_drawdown_pct;
  return j;
}

}  // namespace codec
}  // namespace riskgate
