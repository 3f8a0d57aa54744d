#pragma once

#include "sentiment/backtest/backtest_engine.hpp"
#include "sentiment/config/strategy_config.hpp"
#include "sentiment/data/aligned_dataset.hpp"
#include "sentiment/domain/signal.hpp"
#include "sentiment/metrics/performance_metrics.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace sentiment {

// -----------------------------------------------------------------------------
// EvaluationReport — output of one StrategyEvaluator run
// -----------------------------------------------------------------------------
//
// @brief  The single record handed to reporting and plotting consumers.
//
// @details
// Holds the full signal series and backtest result (for plotting the
// equity curve and trade markers) alongside the summary statistics.
// -----------------------------------------------------------------------------
struct EvaluationReport {
  StrategyConfig config;
  std::vector<domain::Signal> signals;
  BacktestResult backtest;
  PerformanceMetrics metrics;
  SignalDistribution distribution;
  DataQualityReport data_quality;
  std::size_t degraded_sentiment_rows{0};
};

// -------------------------------------------------------------------------
// formatReport
// -------------------------------------------------------------------------
// @brief  Serializes a report to JSON.
//
// @param  include_equity_curve  Adds an "equity_curve" array of
//                               {date, equity} objects when true.
//
// @details
// NaN metrics (undefined Sharpe, CAGR on a one-row curve) serialize as
// null. "open_trade" is null when no position is left open.
// -------------------------------------------------------------------------
nlohmann::json formatReport(const EvaluationReport& report,
                            bool include_equity_curve = false);

nlohmann::json formatTrade(const domain::Trade& trade);

nlohmann::json formatMetrics(const PerformanceMetrics& m);

// Human-readable multi-line summary for the console.
std::string formatSummary(const EvaluationReport& report);

}  // namespace sentiment
