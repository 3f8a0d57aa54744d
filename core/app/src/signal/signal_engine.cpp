#include "sentiment/signal/signal_engine.hpp"

#include <iostream>

namespace sentiment {

namespace {

// validate() throws on malformed thresholds; returning the argument lets the
// check run in the member initializer list.
const SignalThresholds& validated(
    const SignalThresholds& thresholds) {
  validate(thresholds);
  return thresholds;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: validate and store thresholds
// -----------------------------------------------------------------------------
SignalEngine::SignalEngine(const SignalThresholds& thresholds)
    : thresholds_(validated(thresholds)) {}

// -----------------------------------------------------------------------------
// decide: one step of the fold
// -----------------------------------------------------------------------------
SignalEngine::Decision SignalEngine::decide(
    bool held, const domain::SentimentRecord& record,
    const SignalThresholds& t) {
  if (domain::isMissing(record.vix) || domain::isMissing(record.fear_greed)) {
    return Decision{domain::Signal::Hold, held};
  }

  if (!held) {
    const bool fear = record.vix >= t.vix_fear_threshold &&
                      record.fear_greed <= t.fgi_fear_threshold;
    if (fear) {
      return Decision{domain::Signal::Buy, true};
    }
    return Decision{domain::Signal::Hold, false};
  }

  const bool greed = record.vix <= t.vix_greed_threshold &&
                     record.fear_greed >= t.fgi_greed_threshold;
  if (greed) {
    return Decision{domain::Signal::Sell, false};
  }
  return Decision{domain::Signal::Hold, true};
}

// -----------------------------------------------------------------------------
// generate: left fold from held = false
// -----------------------------------------------------------------------------
std::vector<domain::Signal> SignalEngine::generate(
    const std::vector<domain::SentimentRecord>& series,
    std::size_t& degraded_rows) const {
  std::vector<domain::Signal> signals;
  signals.reserve(series.size());

  degraded_rows = 0;
  bool held = false;

  for (const auto& record : series) {
    if (domain::isMissing(record.vix) || domain::isMissing(record.fear_greed)) {
      ++degraded_rows;
    }
    Decision d = decide(held, record, thresholds_);
    signals.push_back(d.signal);
    held = d.held;
  }

  if (degraded_rows > 0) {
    std::cerr << "[SignalEngine] WARNING: " << degraded_rows
              << " row(s) with missing sentiment degraded to HOLD\n";
  }

  return signals;
}

std::vector<domain::Signal> SignalEngine::generate(
    const std::vector<domain::SentimentRecord>& series) const {
  std::size_t degraded_rows = 0;
  return generate(series, degraded_rows);
}

}  // namespace sentiment
