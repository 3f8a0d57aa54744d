#pragma once

#include "sentiment/config/strategy_config.hpp"
#include "sentiment/data/aligned_dataset.hpp"
#include "sentiment/metrics/performance_metrics.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sentiment {

// -----------------------------------------------------------------------------
// SweepResult — outcome of one grid point
// -----------------------------------------------------------------------------
// Exactly one of (metrics, distribution) or error is meaningful: ok is false
// when the grid point's configuration was rejected, and error then holds the
// ConfigurationError message.
// -----------------------------------------------------------------------------
struct SweepResult {
  SignalThresholds thresholds;
  bool ok{false};
  std::string error;
  PerformanceMetrics metrics;
  SignalDistribution distribution;
};

// -----------------------------------------------------------------------------
// ThresholdSweep
// -----------------------------------------------------------------------------
//
// @brief  Evaluates the same dataset under many threshold sets, one
//         std::async task per grid point, at most max_parallel at a time.
//
// @details
// Runs are independent: each task builds its own StrategyEvaluator and only
// reads the shared dataset, which must outlive run(). Results come back in
// grid order regardless of completion order.
//
// The grid is processed in batches of max_parallel points: a batch is
// launched, fully drained, and only then is the next one started. A
// max_parallel of 0 means std::thread::hardware_concurrency() (at least 1).
//
// Dataset alignment is validated once on the calling thread before any task
// starts, so a bad dataset throws ConfigurationError from run() itself. A bad
// grid point does not abort the sweep; it yields ok = false.
//
// Thread model:
//   run() blocks until every task has finished (futures are drained before
//   returning, even when a task reports an error). No more than
//   maxParallel() worker threads are alive at any moment.
// -----------------------------------------------------------------------------
class ThresholdSweep {
 public:
  explicit ThresholdSweep(const BacktestConfig& backtest,
                          std::size_t max_parallel = 0);

  std::vector<SweepResult> run(
      const AlignedDataset& dataset,
      const std::vector<SignalThresholds>& grid) const;

  // Cartesian product of the four per-threshold value lists.
  static std::vector<SignalThresholds> makeGrid(
      const std::vector<double>& vix_fear,
      const std::vector<double>& vix_greed,
      const std::vector<double>& fgi_fear,
      const std::vector<double>& fgi_greed);

  std::size_t maxParallel() const { return max_parallel_; }

 private:
  const BacktestConfig backtest_;
  const std::size_t max_parallel_;
};

}  // namespace sentiment
