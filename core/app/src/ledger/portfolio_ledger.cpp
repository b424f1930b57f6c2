#include "riskgate/ledger/portfolio_ledger.hpp"
#include "riskgate/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <utility>

namespace riskgate {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PortfolioLedger::PortfolioLedger(std::string session_id,
                                 double initial_capital, double initial_peak,
                                 std::size_t fill_id_window)
    : session_id_(std::move(session_id)),
      fill_id_window_(std::max<std::size_t>(1, fill_id_window)),
      cash_(initial_capital),
      initial_capital_(initial_capital),
      peak_value_(std::max(initial_capital, initial_peak)) {}

// -----------------------------------------------------------------------------
// processFill: validate against ledger state, then mutate
// -----------------------------------------------------------------------------
FillResult PortfolioLedger::processFill(const domain::Fill& fill,
                                        std::int64_t now_ms) {
  std::unique_lock lock(mutex_);

  // Both consistency checks run before the first write so a rejected fill
  // leaves no trace.
  if (processed_fill_ids_.count(fill.fill_id) != 0) {
    throw DuplicateFillError(fill.fill_id);
  }
  if (fill.side == domain::Side::Sell) {
    auto it = positions_.find(fill.symbol);
    if (it == positions_.end() || it->second.quantity <= 0) {
      throw NoPositionError(fill.symbol);
    }
  }

  const double cash_before = cash_;
  const double value_before = portfolioValueLocked();

  const double realized = applyExecutionLocked(
      fill.side, fill.symbol, fill.quantity, fill.price, fill.commission);

  rememberFillLocked(fill.fill_id);
  raisePeakLocked();

  const double value_after = portfolioValueLocked();
  const double notional = static_cast<double>(fill.quantity) * fill.price;

  domain::TransactionRecord record;
  record.id = next_transaction_id_++;
  record.session_id = session_id_;
  record.fill_id = fill.fill_id;
  record.strategy_id = fill.strategy_id;
  record.symbol = fill.symbol;
  record.side = fill.side;
  record.quantity = fill.quantity;
  record.price = fill.price;
  record.commission = fill.commission;
  record.amount = fill.side == domain::Side::Buy
                      ? -(notional + fill.commission)
                      : notional - fill.commission;
  if (fill.side == domain::Side::Sell) {
    record.realized_pnl = realized;
  }
  record.cash_before = cash_before;
  record.cash_after = cash_;
  record.portfolio_value_before = value_before;
  record.portfolio_value_after = value_after;
  record.timestamp_ms = fill.timestamp_ms != 0 ? fill.timestamp_ms : now_ms;

  FillResult result;
  result.cash_after = cash_;
  result.portfolio_value = value_after;
  result.realized_pnl = realized;
  result.transaction = std::move(record);
  return result;
}

// -----------------------------------------------------------------------------
// replay: recovery path for journaled transactions
// -----------------------------------------------------------------------------
bool PortfolioLedger::replay(const domain::TransactionRecord& record) {
  std::unique_lock lock(mutex_);

  if (record.id < next_transaction_id_ ||
      processed_fill_ids_.count(record.fill_id) != 0) {
    return false;
  }
  if (record.side == domain::Side::Sell) {
    auto it = positions_.find(record.symbol);
    if (it == positions_.end() || it->second.quantity <= 0) {
      throw NoPositionError(record.symbol);
    }
  }

  applyExecutionLocked(record.side, record.symbol, record.quantity,
                       record.price, record.commission);
  rememberFillLocked(record.fill_id);
  raisePeakLocked();
  next_transaction_id_ = std::max(next_transaction_id_, record.id + 1);
  return true;
}

// -----------------------------------------------------------------------------
// applyExecutionLocked: the accounting core shared by processFill and replay
// -----------------------------------------------------------------------------
double PortfolioLedger::applyExecutionLocked(domain::Side side,
                                             const std::string& symbol,
                                             std::int64_t quantity,
                                             double price,
                                             double commission) {
  const double qty = static_cast<double>(quantity);
  double realized = 0.0;

  if (side == domain::Side::Buy) {
    domain::Position& pos = positions_[symbol];
    if (pos.symbol.empty()) {
      pos.symbol = symbol;
    }
    const std::int64_t new_quantity = pos.quantity + quantity;
    pos.average_price =
        (static_cast<double>(pos.quantity) * pos.average_price + qty * price) /
        static_cast<double>(new_quantity);
    pos.quantity = new_quantity;
    cash_ -= qty * price + commission;
  } else {
    auto it = positions_.find(symbol);
    domain::Position& pos = it->second;
    realized = qty * (price - pos.average_price) - commission;
    cash_ += qty * price - commission;
    pos.quantity -= quantity;
    pos.realized_pnl += realized;
    total_realized_pnl_ += realized;
    // Realized P&L stays in the session totals after the position closes.
    if (pos.quantity == 0) {
      positions_.erase(it);
    }
  }

  total_commissions_ += commission;
  ++total_trades_;
  recomputeUnrealizedLocked();
  return realized;
}

// -----------------------------------------------------------------------------
// updateMarketPrices
// -----------------------------------------------------------------------------
std::size_t PortfolioLedger::updateMarketPrices(
    const std::unordered_map<std::string, double>& prices) {
  std::unique_lock lock(mutex_);

  std::size_t marked = 0;
  for (const auto& [symbol, price] : prices) {
    auto it = positions_.find(symbol);
    if (it == positions_.end() || !std::isfinite(price) || price <= 0.0) {
      continue;
    }
    it->second.last_price = price;
    ++marked;
  }

  if (marked > 0) {
    recomputeUnrealizedLocked();
    raisePeakLocked();
  }
  return marked;
}

// -----------------------------------------------------------------------------
// getState: consistent projection under the shared lock
// -----------------------------------------------------------------------------
domain::PortfolioState PortfolioLedger::getState() const {
  std::shared_lock lock(mutex_);

  domain::PortfolioState state;
  state.session_id = session_id_;
  state.cash = cash_;
  state.initial_capital = initial_capital_;
  state.total_realized_pnl = total_realized_pnl_;
  state.total_unrealized_pnl = total_unrealized_pnl_;
  state.total_commissions = total_commissions_;
  state.total_trades = total_trades_;
  state.peak_value = peak_value_;
  for (const auto& [symbol, pos] : positions_) {
    state.positions.emplace(symbol, pos);
  }

  state.portfolio_value = portfolioValueLocked();
  state.drawdown = peak_value_ > 0.0
                       ? (peak_value_ - state.portfolio_value) / peak_value_
                       : 0.0;
  state.buying_power = cash_;
  state.exposure = exposureLocked();
  return state;
}

double PortfolioLedger::buyingPower() const {
  std::shared_lock lock(mutex_);
  return cash_;
}

std::optional<domain::Position> PortfolioLedger::position(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PortfolioLedger::hasProcessedFill(const std::string& fill_id) const {
  std::shared_lock lock(mutex_);
  return processed_fill_ids_.count(fill_id) != 0;
}

std::size_t PortfolioLedger::trackedFillIds() const {
  std::shared_lock lock(mutex_);
  return fill_id_order_.size();
}

std::uint64_t PortfolioLedger::lastTransactionId() const {
  std::shared_lock lock(mutex_);
  return next_transaction_id_ - 1;
}

// -----------------------------------------------------------------------------
// snapshot / restore
// -----------------------------------------------------------------------------
domain::LedgerSnapshot PortfolioLedger::snapshot(std::int64_t now_ms) const {
  std::shared_lock lock(mutex_);

  domain::LedgerSnapshot snap;
  snap.session_id = session_id_;
  snap.cash = cash_;
  snap.initial_capital = initial_capital_;
  snap.peak_value = peak_value_;
  snap.total_realized_pnl = total_realized_pnl_;
  snap.total_unrealized_pnl = total_unrealized_pnl_;
  snap.total_commissions = total_commissions_;
  snap.total_trades = total_trades_;
  snap.last_transaction_id = next_transaction_id_ - 1;
  snap.taken_at_ms = now_ms;

  snap.positions.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    snap.positions.push_back(pos);
  }
  std::sort(snap.positions.begin(), snap.positions.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.symbol < b.symbol;
            });

  snap.processed_fill_ids.assign(fill_id_order_.begin(), fill_id_order_.end());
  return snap;
}

void PortfolioLedger::restore(const domain::LedgerSnapshot& snapshot) {
  if (snapshot.session_id != session_id_) {
    throw ValidationError("snapshot for session '" + snapshot.session_id +
                          "' cannot restore ledger '" + session_id_ + "'");
  }

  std::unique_lock lock(mutex_);

  cash_ = snapshot.cash;
  initial_capital_ = snapshot.initial_capital;
  peak_value_ = snapshot.peak_value;
  total_realized_pnl_ = snapshot.total_realized_pnl;
  total_unrealized_pnl_ = snapshot.total_unrealized_pnl;
  total_commissions_ = snapshot.total_commissions;
  total_trades_ = snapshot.total_trades;
  next_transaction_id_ = snapshot.last_transaction_id + 1;

  positions_.clear();
  for (const auto& pos : snapshot.positions) {
    if (pos.quantity != 0) {
      positions_[pos.symbol] = pos;
    }
  }

  processed_fill_ids_.clear();
  fill_id_order_.clear();
  for (const auto& fill_id : snapshot.processed_fill_ids) {
    rememberFillLocked(fill_id);
  }
}

// -----------------------------------------------------------------------------
// Derived figures (caller holds a lock)
// -----------------------------------------------------------------------------
double PortfolioLedger::portfolioValueLocked() const {
  double value = cash_;
  for (const auto& [symbol, pos] : positions_) {
    value += pos.marketValue();
  }
  return value;
}

double PortfolioLedger::exposureLocked() const {
  double exposure = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    exposure += std::abs(pos.marketValue());
  }
  return exposure;
}

void PortfolioLedger::recomputeUnrealizedLocked() {
  double total = 0.0;
  for (auto& [symbol, pos] : positions_) {
    pos.unrealized_pnl =
        pos.last_price
            ? static_cast<double>(pos.quantity) *
                  (*pos.last_price - pos.average_price)
            : 0.0;
    total += pos.unrealized_pnl;
  }
  total_unrealized_pnl_ = total;
}

void PortfolioLedger::rememberFillLocked(const std::string& fill_id) {
  if (!processed_fill_ids_.insert(fill_id).second) {
    return;
  }
  fill_id_order_.push_back(fill_id);
  while (fill_id_order_.size() > fill_id_window_) {
    processed_fill_ids_.erase(fill_id_order_.front());
    fill_id_order_.pop_front();
  }
}

void PortfolioLedger::raisePeakLocked() {
  const double value = portfolioValueLocked();
  if (value > peak_value_) {
    peak_value_ = value;
  }
}

}  // namespace riskgate
