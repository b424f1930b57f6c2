#pragma once

#include "riskgate/domain/daily_stats.hpp"
#include "riskgate/domain/decision_record.hpp"
#include "riskgate/domain/fill.hpp"
#include "riskgate/domain/ledger_snapshot.hpp"
#include "riskgate/domain/performance_metrics.hpp"
#include "riskgate/domain/portfolio_state.hpp"
#include "riskgate/domain/position.hpp"
#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/domain/side.hpp"
#include "riskgate/domain/trade_signal.hpp"
#include "riskgate/domain/trading_mode.hpp"
#include "riskgate/domain/transaction_record.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>

namespace riskgate {
namespace codec {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  Conversions between domain types and the snake_case JSON used on
//         the message bus and in persisted files.
//
// @details
// Inbound decoders (signalFromJson, fillFromJson, priceUpdateFromJson)
// reject malformed input with ValidationError naming the field, and run the
// same structural validation as the pipeline. Persisted-state decoders
// (snapshotFromJson, transactionFromJson, dailyStatsFromJson,
// decisionRecordFromJson) throw
// nlohmann::json::exception on damage; the stores translate that into
// PersistenceError.
// -----------------------------------------------------------------------------

// "BUY" / "SELL", case-insensitive. Throws ValidationError otherwise.
domain::Side sideFromString(const std::string& text);

// "NORMAL" / "DEFENSIVE" / "LOCKDOWN". Throws ValidationError otherwise.
domain::TradingMode tradingModeFromString(const std::string& text);

domain::TradeSignal signalFromJson(const nlohmann::json& j);
nlohmann::json signalToJson(const domain::TradeSignal& signal);

domain::Fill fillFromJson(const nlohmann::json& j);
nlohmann::json fillToJson(const domain::Fill& fill);

// `{"symbol": "AAPL", "price": 187.2, "backtest_id": "bt-1"}` or a batch
// `{"prices": {"AAPL": 187.2, "MSFT": 402.0}}`. An absent backtest_id
// leaves session_id empty, meaning every open session.
struct PriceUpdate {
  std::string session_id;
  std::unordered_map<std::string, double> prices;
  std::int64_t timestamp_ms{0};
};
PriceUpdate priceUpdateFromJson(const nlohmann::json& j);

nlohmann::json decisionToJson(const domain::RiskDecision& decision);
domain::RiskDecision decisionFromJson(const nlohmann::json& j);

nlohmann::json decisionRecordToJson(const domain::DecisionRecord& record);
domain::DecisionRecord decisionRecordFromJson(const nlohmann::json& j);

nlohmann::json positionToJson(const domain::Position& position);
domain::Position positionFromJson(const nlohmann::json& j);

nlohmann::json portfolioStateToJson(const domain::PortfolioState& state);

nlohmann::json snapshotToJson(const domain::LedgerSnapshot& snapshot);
domain::LedgerSnapshot snapshotFromJson(const nlohmann::json& j);

nlohmann::json transactionToJson(const domain::TransactionRecord& record);
domain::TransactionRecord transactionFromJson(const nlohmann::json& j);

nlohmann::json dailyStatsToJson(const domain::DailyStats& stats);
domain::DailyStats dailyStatsFromJson(const nlohmann::json& j);

nlohmann::json performanceToJson(const domain::PerformanceMetrics& metrics);

}  // namespace codec
}  // namespace riskgate
