#include "sentiment/backtest/backtest_engine.hpp"
#include "sentiment/config/configuration_error.hpp"

#include <iostream>
#include <string>

namespace sentiment {

using domain::PositionState;
using domain::Signal;

namespace {

const BacktestConfig& validated(const BacktestConfig& config) {
  validate(config);
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
BacktestEngine::BacktestEngine(const BacktestConfig& config)
    : config_(validated(config)) {}

// -----------------------------------------------------------------------------
// validateInputs: fail fast before any state is touched
// -----------------------------------------------------------------------------
void BacktestEngine::validateInputs(
    const std::vector<domain::PriceRecord>& prices,
    const std::vector<Signal>& signals) {
  // One signal per price row; anything else means the two series were
  // built from different datasets.
  if (prices.size() != signals.size()) {
    throw ConfigurationError(
        "price series has " + std::to_string(prices.size()) +
        " rows but signal series has " + std::to_string(signals.size()));
  }
  validatePrices(prices);
}

void BacktestEngine::validatePrices(
    const std::vector<domain::PriceRecord>& prices) {
  for (std::size_t i = 0; i < prices.size(); ++i) {
    const auto& p = prices[i];
    // Every close is a divisor in the equity accrual and in pnl_pct, so a
    // missing or zero close cannot be degraded the way sentiment can.
    if (domain::isMissing(p.close) || p.close <= 0.0) {
      throw ConfigurationError("missing or non-positive close on " +
                               domain::formatDate(p.date) + " (row " +
                               std::to_string(i) + ")");
    }
    // Duplicate dates would make holding_days zero and double-count a day.
    if (i > 0 && !(prices[i - 1].date < p.date)) {
      throw ConfigurationError("price dates not strictly increasing at " +
                               domain::formatDate(p.date) + " (row " +
                               std::to_string(i) + ")");
    }
  }
}

// -----------------------------------------------------------------------------
// applySignal: FLAT/LONG transition table
// -----------------------------------------------------------------------------
PositionState BacktestEngine::applySignal(PositionState state, Signal signal) {
  // Only two transitions change state. BUY while LONG and SELL while FLAT
  // fall through unchanged, same as HOLD.
  if (state == PositionState::Flat && signal == Signal::Buy) {
    return PositionState::Long;
  }
  if (state == PositionState::Long && signal == Signal::Sell) {
    return PositionState::Flat;
  }
  return state;
}

// -----------------------------------------------------------------------------
// applyExecutionLag: held_during[t] = state_after[t - 1]
// -----------------------------------------------------------------------------
std::vector<PositionState> BacktestEngine::applyExecutionLag(
    const std::vector<PositionState>& state_after) {
  // Day 0 has no previous close to earn against, so it is always FLAT.
  std::vector<PositionState> held_during(state_after.size(),
                                         PositionState::Flat);
  for (std::size_t t = 1; t < state_after.size(); ++t) {
    held_during[t] = state_after[t - 1];
  }
  return held_during;
}

// -----------------------------------------------------------------------------
// closeTrade: fill exit leg and derived fields
// -----------------------------------------------------------------------------
domain::Trade BacktestEngine::closeTrade(domain::Trade trade,
                                         const domain::PriceRecord& exit,
                                         std::size_t exit_index) {
  trade.exit_date = exit.date;
  trade.exit_price = exit.close;
  trade.exit_index = exit_index;
  // Calendar days between the two closes, not trading rows.
  trade.holding_days = exit.date - trade.entry_date;
  trade.pnl_pct = exit.close / trade.entry_price - 1.0;
  return trade;
}

// -----------------------------------------------------------------------------
// run: state machine -> execution lag -> equity accrual -> end-of-run policy
// -----------------------------------------------------------------------------
BacktestResult BacktestEngine::run(
    const std::vector<domain::PriceRecord>& prices,
    const std::vector<Signal>& signals) const {
  // Throws before any state is built; a partial result is never returned.
  validateInputs(prices, signals);

  BacktestResult result;
  const std::size_t n = prices.size();
  if (n == 0) {
    return result;
  }

  // --- Pass 1: position state machine and trade log -------------------------
  std::vector<PositionState> state_after(n, PositionState::Flat);
  std::optional<domain::Trade> open;
  PositionState state = PositionState::Flat;

  for (std::size_t t = 0; t < n; ++t) {
    const PositionState next = applySignal(state, signals[t]);

    if (next == state) {
      // A BUY or SELL that did not move the state only happens for a
      // signal series built outside SignalEngine. Count it; it acts as HOLD.
      if (signals[t] != Signal::Hold) {
        ++result.ignored_signals;
      }
    } else if (next == PositionState::Long) {
      // Entry fills at the signal day's close.
      domain::Trade trade;
      trade.entry_date = prices[t].date;
      trade.entry_price = prices[t].close;
      trade.entry_index = t;
      open = trade;
    } else {
      // LONG -> FLAT: exit also fills at the signal day's close. open is
      // always set here because FLAT -> FLAT never reaches this branch.
      result.trades.push_back(closeTrade(*open, prices[t], t));
      open.reset();
    }

    state = next;
    state_after[t] = state;
  }

  if (result.ignored_signals > 0) {
    std::cerr << "[BacktestEngine] WARNING: " << result.ignored_signals
              << " signal(s) inconsistent with the position treated as HOLD\n";
  }

  // --- Pass 2: execution lag -------------------------------------------------
  // A decision made at day t's close only earns from day t + 1 onwards.
  result.exposure = applyExecutionLag(state_after);

  // --- Pass 3: causal equity accrual -----------------------------------------
  // equity[t] depends only on closes up to t and the lagged exposure, so
  // no future price leaks into the curve.
  result.equity_curve.reserve(n);
  result.equity_curve.push_back({prices[0].date, config_.initial_capital});
  for (std::size_t t = 1; t < n; ++t) {
    double equity = result.equity_curve.back().equity;
    // FLAT days carry equity forward unchanged (cash earns nothing).
    if (result.exposure[t] == PositionState::Long) {
      equity *= prices[t].close / prices[t - 1].close;
    }
    result.equity_curve.push_back({prices[t].date, equity});
  }

  // --- End of run --------------------------------------------------------------
  result.final_state = state;

  if (open.has_value()) {
    // Mark the open leg against the last close either way; only the
    // policy decides whether that becomes a realized trade.
    domain::Trade marked = closeTrade(*open, prices[n - 1], n - 1);
    const bool can_close = marked.exit_index > marked.entry_index;

    if (config_.open_position_policy == OpenPositionPolicy::MarkToLast &&
        can_close) {
      marked.closed_at_end = true;
      result.trades.push_back(marked);
      std::cout << "[BacktestEngine] open position force-closed at "
                << domain::formatDate(marked.exit_date) << " close "
                << marked.exit_price << "\n";
    } else {
      // ReportUnrealized, or a BUY on the very last row which has no later
      // close to be marked against.
      result.open_trade = marked;
      std::cout << "[BacktestEngine] position still open since "
                << domain::formatDate(marked.entry_date)
                << " (unrealized pnl " << marked.pnl_pct << ")\n";
    }
  }

  return result;
}

}  // namespace sentiment
