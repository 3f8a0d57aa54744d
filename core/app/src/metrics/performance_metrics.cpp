#include "sentiment/metrics/performance_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace sentiment {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Below this the return series is treated as constant. Exact zero is too
// strict: a constant non-zero return accumulates rounding noise.
constexpr double kMinStdDev = 1e-12;

}  // namespace

std::vector<double> dailyReturns(const domain::EquityCurve& curve) {
  std::vector<double> returns;
  if (curve.size() < 2) {
    return returns;
  }
  returns.reserve(curve.size() - 1);
  for (std::size_t t = 1; t < curve.size(); ++t) {
    returns.push_back(curve[t].equity / curve[t - 1].equity - 1.0);
  }
  return returns;
}

double sampleStdDev(const std::vector<double>& values) {
  if (values.size() < 2) {
    return kNaN;
  }
  const double n = static_cast<double>(values.size());
  const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
  double sq = 0.0;
  for (double v : values) {
    sq += (v - mean) * (v - mean);
  }
  return std::sqrt(sq / (n - 1.0));
}

// -----------------------------------------------------------------------------
// maxDrawdown: running-peak scan
// -----------------------------------------------------------------------------
double maxDrawdown(const domain::EquityCurve& curve) {
  double peak = 0.0;
  double worst = 0.0;
  for (const auto& point : curve) {
    peak = std::max(peak, point.equity);
    worst = std::min(worst, point.equity / peak - 1.0);
  }
  return worst;
}

// -----------------------------------------------------------------------------
// computeMetrics
// -----------------------------------------------------------------------------
PerformanceMetrics computeMetrics(
    const domain::EquityCurve& curve,
    const std::vector<domain::Trade>& trades,
    const std::vector<domain::PositionState>& exposure) {
  PerformanceMetrics m;
  m.trading_days = curve.size();

  // --- Curve statistics ------------------------------------------------------
  if (curve.empty()) {
    m.cagr = kNaN;
    m.annualized_volatility = kNaN;
    m.sharpe_ratio = kNaN;
  } else {
    const double growth = curve.back().equity / curve.front().equity;
    m.total_return = growth - 1.0;

    const std::size_t elapsed = curve.size() - 1;
    m.cagr = elapsed > 0
                 ? std::pow(growth, kTradingDaysPerYear /
                                        static_cast<double>(elapsed)) - 1.0
                 : kNaN;

    const std::vector<double> returns = dailyReturns(curve);
    const double sd = sampleStdDev(returns);
    if (std::isnan(sd)) {
      m.annualized_volatility = kNaN;
      m.sharpe_ratio = kNaN;
    } else {
      m.annualized_volatility = sd * std::sqrt(kTradingDaysPerYear);
      if (sd < kMinStdDev) {
        m.sharpe_ratio = kNaN;
      } else {
        const double mean =
            std::accumulate(returns.begin(), returns.end(), 0.0) /
            static_cast<double>(returns.size());
        m.sharpe_ratio = mean / sd * std::sqrt(kTradingDaysPerYear);
      }
    }

    m.max_drawdown = maxDrawdown(curve);
  }

  // --- Trade statistics ------------------------------------------------------
  m.trade_count = trades.size();
  if (!trades.empty()) {
    std::size_t wins = 0;
    double holding = 0.0;
    double pnl = 0.0;
    for (const auto& trade : trades) {
      if (trade.pnl_pct > 0.0) {
        ++wins;
      }
      holding += trade.holding_days;
      pnl += trade.pnl_pct;
    }
    const double count = static_cast<double>(trades.size());
    m.win_rate = static_cast<double>(wins) / count;
    m.avg_holding_days = holding / count;
    m.avg_trade_pnl_pct = pnl / count;
  }

  if (!exposure.empty()) {
    const auto held = std::count(exposure.begin(), exposure.end(),
                                 domain::PositionState::Long);
    m.exposure_pct =
        static_cast<double>(held) / static_cast<double>(exposure.size());
  }

  return m;
}

// -----------------------------------------------------------------------------
// countSignals
// -----------------------------------------------------------------------------
SignalDistribution countSignals(const std::vector<domain::Signal>& signals) {
  SignalDistribution d;
  std::size_t run = 0;
  std::size_t runs = 0;
  std::size_t run_total = 0;

  for (domain::Signal s : signals) {
    switch (s) {
      case domain::Signal::Hold:
        ++d.hold;
        ++run;
        continue;
      case domain::Signal::Buy:
        ++d.buy;
        break;
      case domain::Signal::Sell:
        ++d.sell;
        break;
    }
    if (run > 0) {
      ++runs;
      run_total += run;
    }
    run = 0;
  }

  if (runs > 0) {
    d.avg_hold_run =
        static_cast<double>(run_total) / static_cast<double>(runs);
  }
  return d;
}

}  // namespace sentiment
