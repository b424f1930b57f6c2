#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// Position: per-symbol holding inside one session's ledger
// -----------------------------------------------------------------------------
//
// @brief  Long-only holding with weighted-average cost basis.
//
// @details
// average_price is recomputed only when shares are bought:
//   new_avg = (qty * avg + fill_qty * fill_price) / (qty + fill_qty)
// A sale changes quantity and realized_pnl only.
//
// last_price stays empty until the first market price update for the
// symbol; valuation falls back to average_price until then.
//
// Thread model:
//   Value type. The authoritative copy lives inside PortfolioLedger; every
//   accessor hands out copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  std::int64_t quantity{0};
  double average_price{0.0};
  std::optional<double> last_price;
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};

  double markPrice() const { return last_price.value_or(average_price); }
  double marketValue() const {
    return static_cast<double>(quantity) * markPrice();
  }
};

}  // namespace domain
}  // namespace riskgate
