#include "riskgate/domain/validation.hpp"
#include "riskgate/domain/errors.hpp"

#include <cmath>
#include <string>

namespace riskgate {
namespace domain {

namespace {

void requireNonEmpty(const std::string& value, const char* what,
                     const char* field) {
  if (value.empty()) {
    throw ValidationError(std::string(what) + ": missing " + field);
  }
}

void requirePositivePrice(double price, const char* what) {
  if (!std::isfinite(price) || price <= 0.0) {
    throw ValidationError(std::string(what) +
                          ": price must be a positive number, got " +
                          std::to_string(price));
  }
}

}  // namespace

void validate(const TradeSignal& signal) {
  requireNonEmpty(signal.strategy_id, "signal", "strategy_id");
  requireNonEmpty(signal.symbol, "signal", "symbol");
  if (signal.quantity <= 0) {
    throw ValidationError("signal: quantity must be positive, got " +
                          std::to_string(signal.quantity));
  }
  requirePositivePrice(signal.price, "signal");
}

void validate(const Fill& fill) {
  requireNonEmpty(fill.fill_id, "fill", "fill_id");
  requireNonEmpty(fill.symbol, "fill", "symbol");
  if (fill.quantity <= 0) {
    throw ValidationError("fill " + fill.fill_id +
                          ": quantity must be positive, got " +
                          std::to_string(fill.quantity));
  }
  requirePositivePrice(fill.price, "fill");
  if (!std::isfinite(fill.commission) || fill.commission < 0.0) {
    throw ValidationError("fill " + fill.fill_id +
                          ": commission must be non-negative");
  }
}

}  // namespace domain
}  // namespace riskgate
