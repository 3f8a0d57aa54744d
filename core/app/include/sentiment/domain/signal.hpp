#pragma once

#include <optional>
#include <string>

namespace sentiment {
namespace domain {

// -----------------------------------------------------------------------------
// Signal — the strategy's decision for one day
// -----------------------------------------------------------------------------
// Computed from that day's sentiment and the signal engine's held-state
// only. Takes effect on the position from the following day (execution lag).
// -----------------------------------------------------------------------------
enum class Signal {
  Hold,
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// PositionState — what the backtest holds during a day
// -----------------------------------------------------------------------------
// Single asset, fully invested or fully in cash. No shorting, no leverage.
// -----------------------------------------------------------------------------
enum class PositionState {
  Flat,
  Long,
};

inline const char* signalToString(Signal s) {
  switch (s) {
    case Signal::Hold: return "HOLD";
    case Signal::Buy:  return "BUY";
    case Signal::Sell: return "SELL";
  }
  return "UNKNOWN";
}

inline std::optional<Signal> signalFromString(const std::string& text) {
  if (text == "HOLD") return Signal::Hold;
  if (text == "BUY") return Signal::Buy;
  if (text == "SELL") return Signal::Sell;
  return std::nullopt;
}

inline const char* positionStateToString(PositionState s) {
  switch (s) {
    case PositionState::Flat: return "FLAT";
    case PositionState::Long: return "LONG";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace sentiment
