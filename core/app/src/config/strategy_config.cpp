#include "sentiment/config/strategy_config.hpp"
#include "sentiment/config/configuration_error.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace sentiment {

namespace {

std::string describe(const char* name, double value) {
  std::ostringstream os;
  os << name << "=" << value;
  return os.str();
}

OpenPositionPolicy policyFromString(const std::string& name) {
  if (name == "mark_to_last") {
    return OpenPositionPolicy::MarkToLast;
  }
  if (name == "report_unrealized") {
    return OpenPositionPolicy::ReportUnrealized;
  }
  throw ConfigurationError("unknown open_position_policy '" + name +
                           "' (expected mark_to_last or report_unrealized)");
}

}  // namespace

// -----------------------------------------------------------------------------
// validate(SignalThresholds)
// -----------------------------------------------------------------------------
void validate(const SignalThresholds& t) {
  const double values[] = {t.vix_fear_threshold, t.vix_greed_threshold,
                           t.fgi_fear_threshold, t.fgi_greed_threshold};
  for (double v : values) {
    if (!std::isfinite(v)) {
      throw ConfigurationError("signal thresholds must be finite numbers");
    }
  }

  if (t.vix_greed_threshold <= 0.0) {
    throw ConfigurationError("vix_greed_threshold must be positive (" +
                             describe("vix_greed_threshold",
                                      t.vix_greed_threshold) + ")");
  }
  // VIX is high in fear and low in greed, so the fear level sits above.
  if (t.vix_greed_threshold >= t.vix_fear_threshold) {
    throw ConfigurationError(
        "vix_greed_threshold must be below vix_fear_threshold (" +
        describe("vix_greed_threshold", t.vix_greed_threshold) + ", " +
        describe("vix_fear_threshold", t.vix_fear_threshold) + ")");
  }

  if (t.fgi_fear_threshold < 0.0 || t.fgi_greed_threshold > 100.0) {
    throw ConfigurationError("fear & greed thresholds must lie in [0, 100]");
  }
  if (t.fgi_fear_threshold >= t.fgi_greed_threshold) {
    throw ConfigurationError(
        "fgi_fear_threshold must be below fgi_greed_threshold (" +
        describe("fgi_fear_threshold", t.fgi_fear_threshold) + ", " +
        describe("fgi_greed_threshold", t.fgi_greed_threshold) + ")");
  }
}

// -----------------------------------------------------------------------------
// validate(BacktestConfig)
// -----------------------------------------------------------------------------
void validate(const BacktestConfig& b) {
  if (!std::isfinite(b.initial_capital) || b.initial_capital <= 0.0) {
    throw ConfigurationError("initial_capital must be a positive number (" +
                             describe("initial_capital", b.initial_capital) +
                             ")");
  }
}

void validate(const StrategyConfig& config) {
  validate(config.thresholds);
  validate(config.backtest);
}

// -----------------------------------------------------------------------------
// fromJson: overlay present keys onto the defaults, then validate
// -----------------------------------------------------------------------------
StrategyConfig fromJson(const nlohmann::json& j) {
  StrategyConfig cfg;

  if (!j.is_object()) {
    throw ConfigurationError("configuration root must be a JSON object");
  }

  try {
    if (j.contains("signal")) {
      const auto& s = j.at("signal");
      SignalThresholds& t = cfg.thresholds;
      t.vix_fear_threshold = s.value("vix_fear_threshold", t.vix_fear_threshold);
      t.vix_greed_threshold =
          s.value("vix_greed_threshold", t.vix_greed_threshold);
      t.fgi_fear_threshold = s.value("fgi_fear_threshold", t.fgi_fear_threshold);
      t.fgi_greed_threshold =
          s.value("fgi_greed_threshold", t.fgi_greed_threshold);
    }

    if (j.contains("backtest")) {
      const auto& b = j.at("backtest");
      cfg.backtest.initial_capital =
          b.value("initial_capital", cfg.backtest.initial_capital);
      if (b.contains("open_position_policy")) {
        cfg.backtest.open_position_policy = policyFromString(
            b.at("open_position_policy").get<std::string>());
      }
    }
  } catch (const nlohmann::json::exception& e) {
    // type_error (e.g. a string where a number is expected) or a non-object
    // section. Surface as a configuration problem, not a JSON internals one.
    throw ConfigurationError(std::string("invalid configuration value: ") +
                             e.what());
  }

  validate(cfg);
  return cfg;
}

// -----------------------------------------------------------------------------
// loadConfig: read and parse a JSON file
// -----------------------------------------------------------------------------
StrategyConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("cannot open configuration file: " + path);
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError("malformed configuration file " + path + ": " +
                             e.what());
  }

  StrategyConfig cfg = fromJson(j);
  std::cout << "[Config] loaded " << path << "\n";
  return cfg;
}

// -----------------------------------------------------------------------------
// toJson: echo the effective configuration into reports
// -----------------------------------------------------------------------------
nlohmann::json toJson(const StrategyConfig& config) {
  nlohmann::json j;
  j["signal"]["vix_fear_threshold"] = config.thresholds.vix_fear_threshold;
  j["signal"]["vix_greed_threshold"] = config.thresholds.vix_greed_threshold;
  j["signal"]["fgi_fear_threshold"] = config.thresholds.fgi_fear_threshold;
  j["signal"]["fgi_greed_threshold"] = config.thresholds.fgi_greed_threshold;
  j["backtest"]["initial_capital"] = config.backtest.initial_capital;
  j["backtest"]["open_position_policy"] =
      policyToString(config.backtest.open_position_policy);
  return j;
}

const char* policyToString(OpenPositionPolicy policy) {
  switch (policy) {
    case OpenPositionPolicy::MarkToLast:       return "mark_to_last";
    case OpenPositionPolicy::ReportUnrealized: return "report_unrealized";
  }
  return "unknown";
}

}  // namespace sentiment
