#pragma once

#include "sentiment/config/strategy_config.hpp"
#include "sentiment/domain/market_records.hpp"
#include "sentiment/domain/signal.hpp"
#include "sentiment/domain/trade.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace sentiment {

// -----------------------------------------------------------------------------
// BacktestResult — everything a single backtest run produces
// -----------------------------------------------------------------------------
//
// @details
//   equity_curve     One point per input row, starting at initial_capital.
//   trades           Finalized round trips in entry order. Under
//                    OpenPositionPolicy::MarkToLast this also holds the
//                    force-closed final trade (closed_at_end = true).
//   open_trade       Under ReportUnrealized, the position still open after
//                    the last row, marked at the last close. Empty otherwise.
//   final_state      State after applying the last signal. Never forced to
//                    FLAT by the end-of-run policy.
//   exposure         State HELD DURING each day, i.e. the lagged state the
//                    equity accrual used. exposure[0] is always FLAT.
//   ignored_signals  BUY-while-LONG and SELL-while-FLAT signals treated as
//                    HOLD.
// -----------------------------------------------------------------------------
struct BacktestResult {
  domain::EquityCurve equity_curve;
  std::vector<domain::Trade> trades;
  std::optional<domain::Trade> open_trade;
  domain::PositionState final_state{domain::PositionState::Flat};
  std::vector<domain::PositionState> exposure;
  std::size_t ignored_signals{0};
};

// -----------------------------------------------------------------------------
// BacktestEngine — long/flat position accounting over a daily signal series
// -----------------------------------------------------------------------------
//
// @brief  Applies a signal series to an aligned close-price series, tracks
//         the FLAT/LONG state machine and the trade log, and accrues a causal
//         equity curve.
//
// @details
// The run is split into three explicit passes so the look-ahead rule is a
// named step and not an index offset buried in a loop:
//
//   1. State machine (applySignal per row):
//        FLAT --BUY-->  LONG   entry at this row's close, trade opened
//        LONG --SELL--> FLAT   exit at this row's close, trade appended
//        HOLD, BUY while LONG, SELL while FLAT: no transition
//      Produces state_after[t], the state once row t's signal is executed.
//
//   2. applyExecutionLag:
//        held_during[0] = FLAT
//        held_during[t] = state_after[t - 1]
//      A signal computed from day t's close can only be acted on at that
//      close, so the position exists during day t + 1 onward.
//
//   3. Equity accrual:
//        E[0] = initial_capital
//        E[t] = E[t-1] * close[t] / close[t-1]   if held_during[t] == LONG
//        E[t] = E[t-1]                           otherwise (cash, 0 return)
//
// Because entry and exit fill at the signal-day close, the equity gained
// while a trade is open compounds to exactly exit_price / entry_price.
//
// Validation (all before pass 1; throws ConfigurationError):
//   - prices.size() == signals.size()
//   - every close finite and > 0
//   - dates strictly increasing
//
// Thread model:
//   Stateless apart from the immutable config; run() may be called
//   concurrently on one instance.
// -----------------------------------------------------------------------------
class BacktestEngine {
 public:
  // Throws ConfigurationError if initial_capital is not positive.
  explicit BacktestEngine(const BacktestConfig& config);

  // -------------------------------------------------------------------------
  // run(prices, signals)
  // -------------------------------------------------------------------------
  // @param  prices   Daily closes, strictly increasing dates.
  // @param  signals  One signal per price row, same order.
  //
  // @return BacktestResult (see above). An empty input yields an empty
  //         curve and a FLAT final state.
  // -------------------------------------------------------------------------
  BacktestResult run(const std::vector<domain::PriceRecord>& prices,
                     const std::vector<domain::Signal>& signals) const;

  // -------------------------------------------------------------------------
  // applySignal(state, signal)
  // -------------------------------------------------------------------------
  // @brief  One transition of the position state machine.
  //
  // @return The next state. BUY while LONG and SELL while FLAT return the
  //         input state (treated as HOLD).
  // -------------------------------------------------------------------------
  static domain::PositionState applySignal(domain::PositionState state,
                                           domain::Signal signal);

  // -------------------------------------------------------------------------
  // applyExecutionLag(state_after)
  // -------------------------------------------------------------------------
  // @brief  Shifts per-row post-signal states one row later, yielding the
  //         state held during each row. Same length as the input.
  // -------------------------------------------------------------------------
  static std::vector<domain::PositionState> applyExecutionLag(
      const std::vector<domain::PositionState>& state_after);

  // Throws ConfigurationError on any input problem listed above.
  static void validateInputs(const std::vector<domain::PriceRecord>& prices,
                             const std::vector<domain::Signal>& signals);

  // The price-only part of validateInputs().
  static void validatePrices(const std::vector<domain::PriceRecord>& prices);

 private:
  static domain::Trade closeTrade(domain::Trade trade,
                                  const domain::PriceRecord& exit,
                                  std::size_t exit_index);

  const BacktestConfig config_;
};

}  // namespace sentiment
