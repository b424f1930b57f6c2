#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace riskgate {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Every failure the service raises derives from RiskGateError so a
//         caller can catch the whole family in one place.
//
// @details
//   ValidationError              malformed signal or fill; raised before any
//                                risk check or ledger mutation.
//   ConsistencyError             a fill that contradicts ledger state. The
//     NoPositionError            ledger is left untouched.
//     DuplicateFillError
//   CollaboratorUnavailableError authoritative buying-power query failed or
//                                timed out; recovered by the fallback path.
//   PersistenceError             a store read/write failed; counted, never
//                                rolls back in-memory state.
//   ConfigError                  invalid configuration; fatal at startup.
//
// Risk rejections are not errors: they are RiskDecision values.
// -----------------------------------------------------------------------------
class RiskGateError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ValidationError : public RiskGateError {
 public:
  using RiskGateError::RiskGateError;
};

class ConsistencyError : public RiskGateError {
 public:
  using RiskGateError::RiskGateError;
};

class NoPositionError : public ConsistencyError {
 public:
  explicit NoPositionError(std::string symbol)
      : ConsistencyError("No position in " + symbol + " to sell"),
        symbol_(std::move(symbol)) {}

  const std::string& symbol() const noexcept { return symbol_; }

 private:
  std::string symbol_;
};

class DuplicateFillError : public ConsistencyError {
 public:
  explicit DuplicateFillError(std::string fill_id)
      : ConsistencyError("Fill " + fill_id + " already applied"),
        fill_id_(std::move(fill_id)) {}

  const std::string& fillId() const noexcept { return fill_id_; }

 private:
  std::string fill_id_;
};

class CollaboratorUnavailableError : public RiskGateError {
 public:
  using RiskGateError::RiskGateError;
};

class PersistenceError : public RiskGateError {
 public:
  using RiskGateError::RiskGateError;
};

class ConfigError : public RiskGateError {
 public:
  using RiskGateError::RiskGateError;
};

}  // namespace riskgate
