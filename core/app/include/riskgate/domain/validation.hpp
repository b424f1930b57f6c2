#pragma once

#include "riskgate/domain/fill.hpp"
#include "riskgate/domain/trade_signal.hpp"

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// validate(signal) / validate(fill)
// -----------------------------------------------------------------------------
// @brief  Structural checks run before anything reads or mutates state.
//
// @throws ValidationError  naming the first offending field: empty ids or
//                          symbol, non-positive quantity, non-positive or
//                          non-finite price, negative commission.
// -----------------------------------------------------------------------------
void validate(const TradeSignal& signal);
void validate(const Fill& fill);

}  // namespace domain
}  // namespace riskgate
