#pragma once

#include "sentiment/config/strategy_config.hpp"
#include "sentiment/domain/market_records.hpp"
#include "sentiment/domain/signal.hpp"

#include <cstddef>
#include <vector>

namespace sentiment {

// -----------------------------------------------------------------------------
// SignalEngine — contrarian sentiment rules with held-state hysteresis
// -----------------------------------------------------------------------------
//
// @brief  Turns a daily SentimentRecord series into a same-length series of
//         HOLD / BUY / SELL signals.
//
// @details
// Rules, evaluated per day against the configured SignalThresholds:
//
//   fear  = vix >= vix_fear_threshold  AND fear_greed <= fgi_fear_threshold
//   greed = vix <= vix_greed_threshold AND fear_greed >= fgi_greed_threshold
//
//   not held AND fear   -> BUY,  held becomes true
//   held     AND greed  -> SELL, held becomes false
//   otherwise           -> HOLD, held unchanged
//
// A day with a missing VIX or fear & greed value is HOLD and leaves held
// unchanged; NaN never reaches a comparison.
//
// The held flag is NOT a member. generate() is a left fold over the series
// that threads the flag through decide(), starting from false (flat).
//
// Causality:
//   The signal for row t depends only on rows 0..t. Rows after t are never
//   read while deciding row t.
//
// Thread model:
//   Immutable after construction; safe to share across threads.
// -----------------------------------------------------------------------------
class SignalEngine {
 public:
  // Result of one fold step.
  struct Decision {
    domain::Signal signal{domain::Signal::Hold};
    bool held{false};  // Held-state after this day's emission
  };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  thresholds  Copied by value. Validated here; throws
  //                     ConfigurationError if malformed.
  // -------------------------------------------------------------------------
  explicit SignalEngine(const SignalThresholds& thresholds);

  // -------------------------------------------------------------------------
  // generate(series)
  // -------------------------------------------------------------------------
  // @brief  Runs the fold over the whole series.
  //
  // @return One signal per input record, in input order.
  //
  // @details
  // Rows with missing sentiment are counted; if any are found a single
  // warning line is written to stderr. The count is also
  // available through the overload taking `degraded_rows`.
  // -------------------------------------------------------------------------
  std::vector<domain::Signal> generate(
      const std::vector<domain::SentimentRecord>& series) const;

  std::vector<domain::Signal> generate(
      const std::vector<domain::SentimentRecord>& series,
      std::size_t& degraded_rows) const;

  // -------------------------------------------------------------------------
  // decide(held, record, thresholds)
  // -------------------------------------------------------------------------
  // @brief  Pure fold step: signal and next held-state for one day.
  // -------------------------------------------------------------------------
  static Decision decide(bool held, const domain::SentimentRecord& record,
                         const SignalThresholds& thresholds);

  const SignalThresholds& thresholds() const { return thresholds_; }

 private:
  const SignalThresholds thresholds_;
};

}  // namespace sentiment
