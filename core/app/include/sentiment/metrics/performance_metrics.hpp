#pragma once

#include "sentiment/domain/signal.hpp"
#include "sentiment/domain/trade.hpp"

#include <cstddef>
#include <vector>

namespace sentiment {

// Trading days per year used for annualization.
inline constexpr double kTradingDaysPerYear = 252.0;

// -----------------------------------------------------------------------------
// PerformanceMetrics — summary statistics of one backtest run
// -----------------------------------------------------------------------------
//
// @details
// Undefined values are NaN (serialized as JSON null), never an exception:
//
//   cagr                   NaN when the curve has fewer than 2 points.
//   annualized_volatility  NaN with fewer than 2 daily returns.
//   sharpe_ratio           NaN with fewer than 2 daily returns or a
//                          zero-variance return series.
//
// Trade statistics are 0 when the trade log is empty. max_drawdown is 0 for
// an empty or non-decreasing curve and negative otherwise.
// -----------------------------------------------------------------------------
struct PerformanceMetrics {
  double total_return{0.0};
  double cagr{0.0};
  double annualized_volatility{0.0};
  double sharpe_ratio{0.0};
  double max_drawdown{0.0};
  std::size_t trading_days{0};      // Rows in the equity curve
  std::size_t trade_count{0};
  double win_rate{0.0};             // Fraction of trades with pnl_pct > 0
  double avg_holding_days{0.0};     // Calendar days
  double avg_trade_pnl_pct{0.0};
  double exposure_pct{0.0};         // Fraction of days held LONG
};

// -----------------------------------------------------------------------------
// SignalDistribution — how often each signal fired
// -----------------------------------------------------------------------------
// avg_hold_run is the mean length of the HOLD runs that end in a BUY or a
// SELL; a trailing run of HOLDs is not counted. 0 when no run qualifies.
// -----------------------------------------------------------------------------
struct SignalDistribution {
  std::size_t hold{0};
  std::size_t buy{0};
  std::size_t sell{0};
  double avg_hold_run{0.0};
};

// dailyReturns[t - 1] = E[t] / E[t - 1] - 1 for t >= 1.
std::vector<double> dailyReturns(const domain::EquityCurve& curve);

// Sample standard deviation (n - 1 denominator). NaN for n < 2.
double sampleStdDev(const std::vector<double>& values);

// min over t of E[t] / max(E[0..t]) - 1.
double maxDrawdown(const domain::EquityCurve& curve);

// -------------------------------------------------------------------------
// computeMetrics
// -------------------------------------------------------------------------
// @brief  Pure function of the equity curve and trade log.
//
// @param  exposure  Optional per-day held state; when empty, exposure_pct
//                   is left at 0.
// -------------------------------------------------------------------------
PerformanceMetrics computeMetrics(
    const domain::EquityCurve& curve,
    const std::vector<domain::Trade>& trades,
    const std::vector<domain::PositionState>& exposure = {});

SignalDistribution countSignals(const std::vector<domain::Signal>& signals);

}  // namespace sentiment
