#pragma once

#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace riskgate {
namespace rules {

// Shared text and arithmetic helpers for rejection reasons and scores.

// "$45000.00"
inline std::string money(double value) {
  std::ostringstream out;
  out << '$' << std::fixed << std::setprecision(2) << value;
  return out.str();
}

// 0.1234 -> "12.3%"
inline std::string percent(double fraction) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << fraction * 100.0 << '%';
  return out.str();
}

// Seconds with one decimal: "2.5s"
inline std::string seconds(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value << 's';
  return out.str();
}

// Plain number without trailing zeros ("5", "0.5").
inline std::string number(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

// actual / limit. A zero limit means "nothing allowed": any positive usage
// is an infinite violation, no usage is 0.
inline double ratio(double actual, double limit) {
  if (limit > 0.0) {
    return actual / limit;
  }
  return actual > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
}

}  // namespace rules
}  // namespace riskgate
