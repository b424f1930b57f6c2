#include "riskgate/ledger/performance.hpp"

#include <algorithm>

namespace riskgate {

namespace {

// Tracks the deepest fall below the running peak of a value series.
class DrawdownTracker {
 public:
  explicit DrawdownTracker(double start) : peak_(start) {}

  void observe(double value) {
    peak_ = std::max(peak_, value);
    const double drop = peak_ - value;
    if (drop > max_drop_) {
      max_drop_ = drop;
    }
    if (peak_ > 0.0) {
      max_drop_pct_ = std::max(max_drop_pct_, drop / peak_);
    }
  }

  double maxDrop() const { return max_drop_; }
  double maxDropPct() const { return max_drop_pct_; }

 private:
  double peak_;
  double max_drop_{0.0};
  double max_drop_pct_{0.0};
};

}  // namespace

domain::PerformanceMetrics computePerformance(
    const std::vector<domain::TransactionRecord>& transactions,
    double initial_capital, double final_value) {
  domain::PerformanceMetrics m;
  m.initial_capital = initial_capital;
  m.final_value = final_value;
  m.total_return = final_value - initial_capital;
  if (initial_capital > 0.0) {
    m.total_return_pct = m.total_return / initial_capital * 100.0;
  }
  m.total_transactions = static_cast<std::int64_t>(transactions.size());

  DrawdownTracker drawdown(initial_capital);
  for (const auto& tx : transactions) {
    drawdown.observe(tx.portfolio_value_after);
    if (tx.side != domain::Side::Sell || !tx.realized_pnl) {
      continue;
    }
    ++m.closing_trades;
    const double pnl = *tx.realized_pnl;
    if (pnl > 0.0) {
      ++m.wins;
      m.gross_profit += pnl;
    } else if (pnl < 0.0) {
      ++m.losses;
      m.gross_loss -= pnl;
    }
  }
  drawdown.observe(final_value);

  m.max_drawdown = drawdown.maxDrop();
  m.max_drawdown_pct = drawdown.maxDropPct();
  if (m.closing_trades > 0) {
    m.win_rate_pct = static_cast<double>(m.wins) /
                     static_cast<double>(m.closing_trades) * 100.0;
  }
  if (m.gross_loss > 0.0) {
    m.profit_factor = m.gross_profit / m.gross_loss;
  }
  return m;
}

}  // namespace riskgate
