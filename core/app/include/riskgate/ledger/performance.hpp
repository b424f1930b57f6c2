#pragma once

#include "riskgate/domain/performance_metrics.hpp"
#include "riskgate/domain/transaction_record.hpp"

#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// computePerformance(transactions, initial_capital, final_value)
// -----------------------------------------------------------------------------
// @brief  Win rate, profit factor and drawdown of one session.
//
// @param  transactions     Oldest first, as loadTransactionsAfter(id, 0)
//                          returns them.
// @param  initial_capital  Starting value of the drawdown series.
// @param  final_value      Current portfolio value; it closes the series so
//                          an open losing position counts toward drawdown.
// -----------------------------------------------------------------------------
domain::PerformanceMetrics computePerformance(
    const std::vector<domain::TransactionRecord>& transactions,
    double initial_capital, double final_value);

}  // namespace riskgate
