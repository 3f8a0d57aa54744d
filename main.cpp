// -----------------------------------------------------------------------------
// sentiment_backtest — single executable entry point.
//
// Evaluates the VIX / CNN fear & greed contrarian strategy over one dataset:
//   1) Load the StrategyConfig (JSON) or fall back to the defaults.
//   2) Obtain the aligned daily dataset: from the merged CSV the data
//      fetcher leaves on disk, from its raw download directory (spy.csv,
//      vix.csv and a fear & greed file, inner-joined on date), or live from
//      the fetcher over ZeroMQ.
//   3) Run the StrategyEvaluator (validate -> signals -> backtest -> metrics).
//   4) Print the summary; optionally write the JSON report and the signal
//      table.
//
// Usage:
//   sentiment_backtest [--config cfg.json]
//                      (--data merged.csv | --raw DIR | --zmq ENDPOINT)
//                      [--report report.json] [--signals signals.csv]
//                      [--equity]
//
// Exit codes: 0 success, 1 configuration, data or ZMQ error, 2 usage error.
// -----------------------------------------------------------------------------

#include "sentiment/config/configuration_error.hpp"
#include "sentiment/config/strategy_config.hpp"
#include "sentiment/data/csv_io.hpp"
#include "sentiment/engine/strategy_evaluator.hpp"
#include "sentiment/gateway/dataset_gateway.hpp"
#include "sentiment/report/evaluation_report.hpp"

#include <zmq.hpp>

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>

// -----------------------------------------------------------------------------
// Global pointer for signal handler access. Set only while the gateway is
// collecting; lets Ctrl-C unblock the ZMQ recv loop.
// -----------------------------------------------------------------------------
static sentiment::DatasetGateway* g_gateway_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

namespace {

struct Options {
  std::string config_path;
  std::string data_path;
  std::string raw_dir;
  std::string zmq_endpoint;
  std::string report_path;
  std::string signals_path;
  bool include_equity{false};
};

void printUsage() {
  std::cerr << "usage: sentiment_backtest [--config cfg.json]\n"
               "                          "
               "(--data merged.csv | --raw DIR | --zmq ENDPOINT)\n"
               "                          [--report report.json] "
               "[--signals signals.csv] [--equity]\n";
}

bool parseArgs(int argc, char** argv, Options& opts) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](std::string& out) {
      if (i + 1 >= argc) {
        return false;
      }
      out = argv[++i];
      return true;
    };

    bool ok = true;
    if (arg == "--config") {
      ok = next(opts.config_path);
    } else if (arg == "--data") {
      ok = next(opts.data_path);
    } else if (arg == "--raw") {
      ok = next(opts.raw_dir);
    } else if (arg == "--zmq") {
      ok = next(opts.zmq_endpoint);
    } else if (arg == "--report") {
      ok = next(opts.report_path);
    } else if (arg == "--signals") {
      ok = next(opts.signals_path);
    } else if (arg == "--equity") {
      opts.include_equity = true;
    } else {
      std::cerr << "[main] unknown argument: " << arg << "\n";
      return false;
    }
    if (!ok) {
      std::cerr << "[main] missing value for " << arg << "\n";
      return false;
    }
  }
  // Exactly one data source.
  const int sources = static_cast<int>(!opts.data_path.empty()) +
                      static_cast<int>(!opts.raw_dir.empty()) +
                      static_cast<int>(!opts.zmq_endpoint.empty());
  if (sources != 1) {
    std::cerr << "[main] exactly one of --data, --raw, --zmq is required\n";
    return false;
  }
  return true;
}

sentiment::AlignedDataset collectFromGateway(const std::string& endpoint) {
  // Five idle seconds after the first row ends the stream if the fetcher
  // dies without sending end-of-stream.
  sentiment::DatasetGateway gateway(endpoint, std::chrono::milliseconds{5000});

  g_gateway_ptr = &gateway;
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] DatasetGateway listening on " << endpoint << "\n"
            << "[main] Start the data fetcher publisher in another terminal.\n";
  sentiment::AlignedDataset dataset = gateway.collect();

  std::signal(SIGINT, SIG_DFL);
  g_gateway_ptr = nullptr;
  return dataset;
}

}  // namespace

int main(int argc, char** argv) {
  Options opts;
  if (!parseArgs(argc, argv, opts)) {
    printUsage();
    return 2;
  }

  try {
    // -------------------------------------------------------------------------
    // 1) Configuration.
    // -------------------------------------------------------------------------
    sentiment::StrategyConfig config;
    if (!opts.config_path.empty()) {
      config = sentiment::loadConfig(opts.config_path);
    }

    // -------------------------------------------------------------------------
    // 2) Dataset.
    // -------------------------------------------------------------------------
    sentiment::AlignedDataset dataset;
    if (!opts.data_path.empty()) {
      dataset = sentiment::loadMergedCsv(opts.data_path);
    } else if (!opts.raw_dir.empty()) {
      dataset = sentiment::loadRawDataset(opts.raw_dir);
    } else {
      dataset = collectFromGateway(opts.zmq_endpoint);
    }

    // -------------------------------------------------------------------------
    // 3) Evaluate.
    // -------------------------------------------------------------------------
    sentiment::StrategyEvaluator evaluator(config);
    sentiment::EvaluationReport report = evaluator.evaluate(dataset);

    // -------------------------------------------------------------------------
    // 4) Output.
    // -------------------------------------------------------------------------
    std::cout << sentiment::formatSummary(report);

    if (!opts.signals_path.empty()) {
      sentiment::writeSignalTable(opts.signals_path, dataset, report.signals);
    }

    if (!opts.report_path.empty()) {
      std::ofstream out(opts.report_path);
      if (!out) {
        throw sentiment::ConfigurationError("cannot open output file: " +
                                            opts.report_path);
      }
      out << sentiment::formatReport(report, opts.include_equity).dump(2)
          << "\n";
      std::cout << "[main] report saved: " << opts.report_path << "\n";
    }
  } catch (const sentiment::ConfigurationError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    // Bad endpoint string or socket failure while collecting.
    std::cerr << "[main] ZMQ error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
