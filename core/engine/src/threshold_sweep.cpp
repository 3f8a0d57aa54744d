#include "sentiment/engine/threshold_sweep.hpp"
#include "sentiment/backtest/backtest_engine.hpp"
#include "sentiment/config/configuration_error.hpp"
#include "sentiment/engine/strategy_evaluator.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <iostream>
#include <thread>

namespace sentiment {

namespace {

const BacktestConfig& validated(const BacktestConfig& backtest) {
  validate(backtest);
  return backtest;
}

std::size_t resolveParallelism(std::size_t requested) {
  if (requested > 0) {
    return requested;
  }
  // hardware_concurrency() may report 0 when the count is unknown.
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

SweepResult evaluatePoint(const AlignedDataset& dataset,
                          const SignalThresholds& thresholds,
                          const BacktestConfig& backtest) {
  SweepResult result;
  result.thresholds = thresholds;
  try {
    StrategyEvaluator evaluator(StrategyConfig{thresholds, backtest});
    EvaluationReport report = evaluator.evaluate(dataset);
    result.metrics = report.metrics;
    result.distribution = report.distribution;
    result.ok = true;
  } catch (const ConfigurationError& e) {
    result.error = e.what();
  }
  return result;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ThresholdSweep::ThresholdSweep(const BacktestConfig& backtest,
                               std::size_t max_parallel)
    : backtest_(validated(backtest)),
      max_parallel_(resolveParallelism(max_parallel)) {}

// -----------------------------------------------------------------------------
// run(): bounded batches of async tasks, collected in grid order
// -----------------------------------------------------------------------------
std::vector<SweepResult> ThresholdSweep::run(
    const AlignedDataset& dataset,
    const std::vector<SignalThresholds>& grid) const {
  // A dataset problem would fail every point identically; report it once.
  validateAlignment(dataset);
  BacktestEngine::validatePrices(dataset.prices);

  std::vector<SweepResult> results;
  results.reserve(grid.size());
  std::size_t rejected = 0;

  std::vector<std::future<SweepResult>> batch;
  batch.reserve(std::min(max_parallel_, grid.size()));

  for (std::size_t begin = 0; begin < grid.size(); begin += max_parallel_) {
    const std::size_t end = std::min(begin + max_parallel_, grid.size());

    // 1. Launch this batch.
    for (std::size_t i = begin; i < end; ++i) {
      batch.push_back(std::async(std::launch::async, evaluatePoint,
                                 std::cref(dataset), grid[i], backtest_));
    }

    // 2. Drain it in launch order before the next batch starts. get()
    //    joins the worker, so the live thread count never exceeds
    //    max_parallel_.
    for (auto& f : batch) {
      results.push_back(f.get());
      if (!results.back().ok) {
        ++rejected;
      }
    }
    batch.clear();
  }

  std::cout << "[ThresholdSweep] evaluated " << grid.size()
            << " grid point(s), " << rejected << " rejected, "
            << max_parallel_ << " at a time\n";
  return results;
}

// -----------------------------------------------------------------------------
// makeGrid(): cartesian product
// -----------------------------------------------------------------------------
std::vector<SignalThresholds> ThresholdSweep::makeGrid(
    const std::vector<double>& vix_fear, const std::vector<double>& vix_greed,
    const std::vector<double>& fgi_fear, const std::vector<double>& fgi_greed) {
  std::vector<SignalThresholds> grid;
  grid.reserve(vix_fear.size() * vix_greed.size() * fgi_fear.size() *
               fgi_greed.size());
  for (double vf : vix_fear) {
    for (double vg : vix_greed) {
      for (double ff : fgi_fear) {
        for (double fg : fgi_greed) {
          grid.push_back(SignalThresholds{vf, vg, ff, fg});
        }
      }
    }
  }
  return grid;
}

}  // namespace sentiment
