#include "sentiment/report/evaluation_report.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace sentiment {

namespace {

// nlohmann::json already writes NaN as null; make it explicit so the
// in-memory document compares equal to what a reader parses back.
nlohmann::json number(double value) {
  if (!std::isfinite(value)) {
    return nullptr;
  }
  return value;
}

std::string percent(double value) {
  if (!std::isfinite(value)) {
    return "n/a";
  }
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << value * 100.0 << "%";
  return os.str();
}

std::string fixed(double value, int digits) {
  if (!std::isfinite(value)) {
    return "n/a";
  }
  std::ostringstream os;
  os << std::fixed << std::setprecision(digits) << value;
  return os.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// formatTrade()
// -----------------------------------------------------------------------------
nlohmann::json formatTrade(const domain::Trade& trade) {
  nlohmann::json j;
  j["entry_date"] = domain::formatDate(trade.entry_date);
  j["entry_price"] = trade.entry_price;
  j["exit_date"] = domain::formatDate(trade.exit_date);
  j["exit_price"] = trade.exit_price;
  j["holding_days"] = trade.holding_days;
  j["pnl_pct"] = trade.pnl_pct;
  j["closed_at_end"] = trade.closed_at_end;
  return j;
}

// -----------------------------------------------------------------------------
// formatMetrics()
// -----------------------------------------------------------------------------
nlohmann::json formatMetrics(const PerformanceMetrics& m) {
  nlohmann::json j;
  j["total_return"] = number(m.total_return);
  j["cagr"] = number(m.cagr);
  j["annualized_volatility"] = number(m.annualized_volatility);
  j["sharpe_ratio"] = number(m.sharpe_ratio);
  j["max_drawdown"] = number(m.max_drawdown);
  j["trading_days"] = m.trading_days;
  j["trade_count"] = m.trade_count;
  j["win_rate"] = number(m.win_rate);
  j["avg_holding_days"] = number(m.avg_holding_days);
  j["avg_trade_pnl_pct"] = number(m.avg_trade_pnl_pct);
  j["exposure_pct"] = number(m.exposure_pct);
  return j;
}

// -----------------------------------------------------------------------------
// formatReport()
// -----------------------------------------------------------------------------
nlohmann::json formatReport(const EvaluationReport& report,
                            bool include_equity_curve) {
  nlohmann::json j;
  j["config"] = toJson(report.config);
  j["metrics"] = formatMetrics(report.metrics);

  j["signal_distribution"]["HOLD"] = report.distribution.hold;
  j["signal_distribution"]["BUY"] = report.distribution.buy;
  j["signal_distribution"]["SELL"] = report.distribution.sell;
  j["signal_distribution"]["avg_hold_run"] =
      number(report.distribution.avg_hold_run);

  nlohmann::json trades = nlohmann::json::array();
  for (const auto& trade : report.backtest.trades) {
    trades.push_back(formatTrade(trade));
  }
  j["trades"] = std::move(trades);

  j["open_trade"] = report.backtest.open_trade.has_value()
                        ? formatTrade(*report.backtest.open_trade)
                        : nlohmann::json(nullptr);
  j["final_position"] =
      domain::positionStateToString(report.backtest.final_state);
  j["ignored_signals"] = report.backtest.ignored_signals;

  j["data_quality"]["rows"] = report.data_quality.rows;
  j["data_quality"]["missing_vix"] = report.data_quality.missing_vix;
  j["data_quality"]["missing_fear_greed"] =
      report.data_quality.missing_fear_greed;
  j["data_quality"]["missing_close"] = report.data_quality.missing_close;
  j["data_quality"]["largest_gap_days"] = report.data_quality.largest_gap_days;
  j["data_quality"]["degraded_sentiment_rows"] =
      report.degraded_sentiment_rows;

  if (include_equity_curve) {
    nlohmann::json curve = nlohmann::json::array();
    for (const auto& point : report.backtest.equity_curve) {
      curve.push_back({{"date", domain::formatDate(point.date)},
                       {"equity", point.equity}});
    }
    j["equity_curve"] = std::move(curve);
  }
  return j;
}

// -----------------------------------------------------------------------------
// formatSummary()
// -----------------------------------------------------------------------------
std::string formatSummary(const EvaluationReport& report) {
  const auto& m = report.metrics;
  const auto& d = report.distribution;

  std::ostringstream os;
  os << "signals        HOLD=" << d.hold << " BUY=" << d.buy
     << " SELL=" << d.sell << " (avg HOLD run " << fixed(d.avg_hold_run, 2)
     << " days)\n"
     << "total return   " << percent(m.total_return) << "\n"
     << "CAGR           " << percent(m.cagr) << "\n"
     << "volatility     " << percent(m.annualized_volatility) << "\n"
     << "sharpe         " << fixed(m.sharpe_ratio, 3) << "\n"
     << "max drawdown   " << percent(m.max_drawdown) << "\n"
     << "trades         " << m.trade_count << " (win rate "
     << percent(m.win_rate) << ", avg hold " << fixed(m.avg_holding_days, 1)
     << " days)\n"
     << "final position "
     << domain::positionStateToString(report.backtest.final_state);
  if (report.backtest.open_trade.has_value()) {
    os << " (open since "
       << domain::formatDate(report.backtest.open_trade->entry_date)
       << ", unrealized " << percent(report.backtest.open_trade->pnl_pct)
       << ")";
  }
  os << "\n";
  return os.str();
}

}  // namespace sentiment
