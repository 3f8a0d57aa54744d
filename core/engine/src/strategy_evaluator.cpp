#include "sentiment/engine/strategy_evaluator.hpp"
#include "sentiment/metrics/performance_metrics.hpp"

namespace sentiment {

// -----------------------------------------------------------------------------
// Constructor: engines validate their own slice of the configuration
// -----------------------------------------------------------------------------
StrategyEvaluator::StrategyEvaluator(const StrategyConfig& config)
    : config_(config),
      signal_engine_(config.thresholds),
      backtest_engine_(config.backtest) {}

// -----------------------------------------------------------------------------
// evaluate(): validate -> signals -> backtest -> metrics
// -----------------------------------------------------------------------------
EvaluationReport StrategyEvaluator::evaluate(
    const AlignedDataset& dataset) const {
  // --- Fail fast: nothing below may throw once these pass -------------------
  validateAlignment(dataset);
  BacktestEngine::validatePrices(dataset.prices);

  EvaluationReport report;
  report.config = config_;
  report.data_quality = inspectQuality(dataset);

  report.signals =
      signal_engine_.generate(dataset.sentiment, report.degraded_sentiment_rows);
  report.backtest = backtest_engine_.run(dataset.prices, report.signals);

  report.metrics = computeMetrics(report.backtest.equity_curve,
                                           report.backtest.trades,
                                           report.backtest.exposure);
  report.distribution = countSignals(report.signals);
  return report;
}

}  // namespace sentiment
