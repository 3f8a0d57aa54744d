#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace sentiment {

// -----------------------------------------------------------------------------
// SignalThresholds — contrarian sentiment trigger levels
// -----------------------------------------------------------------------------
//
// @brief  The four independently tunable levels used by the SignalEngine.
//
// @details
//   Fear  (BUY eligible):  vix >= vix_fear_threshold
//                          AND fear_greed <= fgi_fear_threshold
//   Greed (SELL eligible): vix <= vix_greed_threshold
//                          AND fear_greed >= fgi_greed_threshold
//
// All comparisons are inclusive. The defaults are the levels the historical
// signal distribution was produced with.
//
// Validity (checked by validate()):
//   0 < vix_greed_threshold < vix_fear_threshold
//   0 <= fgi_fear_threshold < fgi_greed_threshold <= 100
// The fear and greed regions can therefore never overlap on a single day.
// -----------------------------------------------------------------------------
struct SignalThresholds {
  double vix_fear_threshold{30.0};
  double vix_greed_threshold{15.0};
  double fgi_fear_threshold{20.0};
  double fgi_greed_threshold{80.0};
};

// -----------------------------------------------------------------------------
// OpenPositionPolicy — what happens to a position still open at the end
// -----------------------------------------------------------------------------
//   MarkToLast       — force-close at the last close; the trade enters the
//                      trade log with closed_at_end = true.
//   ReportUnrealized — the trade stays out of the log and is reported
//                      separately, marked at the last close.
// In both cases the final PositionState (LONG) is reported unchanged.
// -----------------------------------------------------------------------------
enum class OpenPositionPolicy {
  MarkToLast,
  ReportUnrealized,
};

struct BacktestConfig {
  double initial_capital{1.0};
  OpenPositionPolicy open_position_policy{OpenPositionPolicy::ReportUnrealized};
};

// -----------------------------------------------------------------------------
// StrategyConfig — everything one evaluation run needs
// -----------------------------------------------------------------------------
//
// @brief  Immutable bundle of signal thresholds and backtest settings, copied
//         by value into the engines at construction.
//
// JSON layout (every key optional, defaults as above):
//   {
//     "signal":   { "vix_fear_threshold": 30, "vix_greed_threshold": 15,
//                   "fgi_fear_threshold": 20, "fgi_greed_threshold": 80 },
//     "backtest": { "initial_capital": 1.0,
//                   "open_position_policy": "report_unrealized" }
//   }
// -----------------------------------------------------------------------------
struct StrategyConfig {
  SignalThresholds thresholds;
  BacktestConfig backtest;
};

// Throws ConfigurationError describing the first violated rule.
void validate(const SignalThresholds& thresholds);
void validate(const BacktestConfig& backtest);
void validate(const StrategyConfig& config);

// -------------------------------------------------------------------------
// fromJson / loadConfig
// -------------------------------------------------------------------------
// @brief  Builds a validated StrategyConfig from a JSON object or file.
//
// @throws ConfigurationError on unreadable files, malformed JSON, wrong
//         value types, unknown policy names, or failed validation.
// -------------------------------------------------------------------------
StrategyConfig fromJson(const nlohmann::json& j);
StrategyConfig loadConfig(const std::string& path);

nlohmann::json toJson(const StrategyConfig& config);

const char* policyToString(OpenPositionPolicy policy);

}  // namespace sentiment
