#pragma once

#include <stdexcept>
#include <string>

namespace sentiment {

// -----------------------------------------------------------------------------
// ConfigurationError — fatal input or configuration problem
// -----------------------------------------------------------------------------
//
// @brief  Thrown for any condition that must abort a run before the first
//         computation: malformed thresholds, non-positive capital, series of
//         different length, dates that do not line up, missing prices, or an
//         unreadable configuration/data file.
//
// @details
// Every check that can throw this runs before the signal fold and the
// backtest loop start. Once those loops begin they cannot fail, so a run
// either aborts up front or completes.
//
// Non-fatal conditions (missing sentiment, undefined metrics) are NOT
// reported through this type; they degrade locally and are logged.
// -----------------------------------------------------------------------------
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace sentiment
