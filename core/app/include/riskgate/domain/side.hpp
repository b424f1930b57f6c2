#pragma once

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// Side: trade direction. Long-only accounting: BUY opens or adds, SELL
// reduces or closes.
// -----------------------------------------------------------------------------
enum class Side { Buy, Sell };

// Wire representation ("BUY" / "SELL") used on the bus and in persisted
// transaction records.
inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace riskgate
