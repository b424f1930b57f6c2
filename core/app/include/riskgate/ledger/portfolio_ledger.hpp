#pragma once

#include "riskgate/domain/fill.hpp"
#include "riskgate/domain/ledger_snapshot.hpp"
#include "riskgate/domain/portfolio_state.hpp"
#include "riskgate/domain/position.hpp"
#include "riskgate/domain/transaction_record.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace riskgate {

// -----------------------------------------------------------------------------
// FillResult: what processFill() reports back to the pipeline
// -----------------------------------------------------------------------------
struct FillResult {
  double cash_after{0.0};
  double portfolio_value{0.0};
  double realized_pnl{0.0};            // 0 for a BUY
  domain::TransactionRecord transaction;
};

// -----------------------------------------------------------------------------
// PortfolioLedger: authoritative cash, positions and P&L of one session
// -----------------------------------------------------------------------------
//
// @brief  Applies fills exactly once, marks positions to market, and hands
//         out consistent projections (getState) and restorable snapshots.
//
// @details
// Accounting rules:
//
//   BUY   cash -= qty * price + commission
//         avg   = (held * avg + qty * price) / (held + qty)
//
//   SELL  requires a held position, else NoPositionError
//         realized = qty * (price - avg) - commission
//         cash    += qty * price - commission
//         avg unchanged; the position is removed when quantity reaches 0
//
//   every fill: total_trades += 1, total_commissions += commission, one
//   TransactionRecord with pre/post cash and portfolio value, then
//   peak_value = max(peak_value, portfolio_value).
//
// A fill_id that was already applied raises DuplicateFillError before any
// field is touched. The ledger remembers the most recent `fill_id_window`
// fill ids (oldest forgotten first); that window is part of the snapshot, so
// idempotence survives a restart while the persisted state stays bounded.
// Recovery does not depend on the window: replay() skips every record at or
// below the transaction id watermark.
//
// Quantity bounds (selling more than held) are the risk chain's job; the
// ledger trusts its caller there and only refuses a sale with nothing held.
//
// Thread model:
//   Mutators (processFill, replay, updateMarketPrices, restore) take the
//   unique lock; readers (getState, snapshot, position, buyingPower) take
//   the shared lock. The pipeline additionally serializes mutators per
//   session, so readers always see a state between two whole fills.
//
// Ownership:
//   Owned by SessionContext. Positions live in an arena keyed by symbol and
//   are erased explicitly when flat.
// -----------------------------------------------------------------------------
class PortfolioLedger {
 public:
  static constexpr std::size_t kDefaultFillIdWindow = 10000;

  // initial_peak seeds the high-water mark when it is above
  // initial_capital (a session resumed from an account that once was
  // worth more).
  PortfolioLedger(std::string session_id, double initial_capital,
                  double initial_peak = 0.0,
                  std::size_t fill_id_window = kDefaultFillIdWindow);

  PortfolioLedger(const PortfolioLedger&) = delete;
  PortfolioLedger& operator=(const PortfolioLedger&) = delete;
  PortfolioLedger(PortfolioLedger&&) = delete;
  PortfolioLedger& operator=(PortfolioLedger&&) = delete;

  // -------------------------------------------------------------------------
  // processFill(fill, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Applies one fill atomically.
  //
  // @param  fill    A validated fill (see domain::validate).
  // @param  now_ms  Timestamp recorded on the transaction when the fill
  //                 carries none.
  //
  // @return Cash and value after the fill, realized P&L, and the
  //         transaction record to journal.
  //
  // @throws DuplicateFillError  fill_id already applied.
  // @throws NoPositionError     SELL of a symbol that is not held.
  //         In both cases the ledger is unchanged.
  // -------------------------------------------------------------------------
  FillResult processFill(const domain::Fill& fill, std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // replay(record)
  // -------------------------------------------------------------------------
  // @brief  Re-applies a journaled transaction during recovery, keeping its
  //         id. Records at or below lastTransactionId() (the snapshot already
  //         covers them) and remembered fill ids are skipped.
  //
  // @return true if the record changed the ledger.
  // -------------------------------------------------------------------------
  bool replay(const domain::TransactionRecord& record);

  // -------------------------------------------------------------------------
  // updateMarketPrices(prices)
  // -------------------------------------------------------------------------
  // @brief  Sets last_price and unrealized P&L for every held symbol in the
  //         map; symbols not held are ignored. Cash and realized figures are
  //         never touched. Raises the peak if the new value exceeds it.
  //
  // @return Number of positions that were re-marked.
  // -------------------------------------------------------------------------
  std::size_t updateMarketPrices(
      const std::unordered_map<std::string, double>& prices);

  // Full projection, including derived value, drawdown, exposure.
  domain::PortfolioState getState() const;

  // Cash available for new purchases.
  double buyingPower() const;

  std::optional<domain::Position> position(const std::string& symbol) const;

  bool hasProcessedFill(const std::string& fill_id) const;
  std::size_t trackedFillIds() const;

  domain::LedgerSnapshot snapshot(std::int64_t now_ms) const;

  // -------------------------------------------------------------------------
  // restore(snapshot)
  // -------------------------------------------------------------------------
  // @brief  Replaces the whole ledger with a snapshot. Afterwards getState()
  //         equals the state the snapshot was taken from.
  //
  // @throws ValidationError  snapshot belongs to another session.
  // -------------------------------------------------------------------------
  void restore(const domain::LedgerSnapshot& snapshot);

  const std::string& sessionId() const { return session_id_; }
  std::uint64_t lastTransactionId() const;

 private:
  // Mutates cash and the position for one execution. Returns realized P&L.
  // Caller holds the unique lock and has verified a SELL has a position.
  double applyExecutionLocked(domain::Side side, const std::string& symbol,
                              std::int64_t quantity, double price,
                              double commission);

  double portfolioValueLocked() const;
  double exposureLocked() const;
  void recomputeUnrealizedLocked();
  void raisePeakLocked();
  void rememberFillLocked(const std::string& fill_id);

  const std::string session_id_;
  const std::size_t fill_id_window_;

  // Protects every field below.
  mutable std::shared_mutex mutex_;

  double cash_{0.0};
  double initial_capital_{0.0};
  double peak_value_{0.0};
  double total_realized_pnl_{0.0};
  double total_unrealized_pnl_{0.0};
  double total_commissions_{0.0};
  std::int64_t total_trades_{0};
  std::uint64_t next_transaction_id_{1};

  std::unordered_map<std::string, domain::Position> positions_;
  std::unordered_set<std::string> processed_fill_ids_;
  std::deque<std::string> fill_id_order_;  // Oldest first
};

}  // namespace riskgate
