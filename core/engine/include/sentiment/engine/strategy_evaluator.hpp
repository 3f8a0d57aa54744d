#pragma once

#include "sentiment/backtest/backtest_engine.hpp"
#include "sentiment/config/strategy_config.hpp"
#include "sentiment/data/aligned_dataset.hpp"
#include "sentiment/report/evaluation_report.hpp"
#include "sentiment/signal/signal_engine.hpp"

namespace sentiment {

// -----------------------------------------------------------------------------
// StrategyEvaluator
// -----------------------------------------------------------------------------
//
// @brief  Runs the whole pipeline for one configuration:
//
//           AlignedDataset
//             -> validateAlignment / inspectQuality      (fail fast)
//             -> SignalEngine::generate                  (signals)
//             -> BacktestEngine::run                     (curve, trades)
//             -> computeMetrics / countSignals           (summary)
//             -> EvaluationReport
//
// @details
// Every fatal check (thresholds, capital, alignment, prices) runs before the
// signal fold starts, so evaluate() either throws ConfigurationError without
// computing anything or returns a complete report.
//
// The configuration is validated in the constructor: an evaluator that
// exists always holds a usable configuration.
//
// Thread model:
//   Holds only immutable state. evaluate() may run concurrently on one
//   instance; ThresholdSweep relies on this for independent runs.
//
// Ownership:
//   SignalEngine and BacktestEngine are value members (both are small and
//   immutable); nothing is shared with the caller.
// -----------------------------------------------------------------------------
class StrategyEvaluator {
 public:
  // Throws ConfigurationError if config is invalid.
  explicit StrategyEvaluator(const StrategyConfig& config);

  StrategyEvaluator(const StrategyEvaluator&) = delete;
  StrategyEvaluator& operator=(const StrategyEvaluator&) = delete;

  // -------------------------------------------------------------------------
  // evaluate(dataset)
  // -------------------------------------------------------------------------
  // @throws ConfigurationError on misaligned or invalid input.
  // -------------------------------------------------------------------------
  EvaluationReport evaluate(const AlignedDataset& dataset) const;

  const StrategyConfig& config() const { return config_; }

 private:
  const StrategyConfig config_;
  const SignalEngine signal_engine_;
  const BacktestEngine backtest_engine_;
};

}  // namespace sentiment
