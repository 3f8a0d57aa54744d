#pragma once

#include "sentiment/data/aligned_dataset.hpp"
#include "sentiment/domain/signal.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace sentiment {

// -----------------------------------------------------------------------------
// CSV input/output for the data fetcher's files
// -----------------------------------------------------------------------------
//
// @brief  Reads the tables the external data fetcher leaves on disk and
//         writes the processed signal table back in the same layout.
//
// @details
// Merged table (one row per trading day):
//   date,spy_price,vix,cnn_fg
// Columns are located by header name, so their order does not matter and
// extra columns are ignored. In particular the signal column of a table
// written by writeSignalTable() is not read back: signals are always
// regenerated from the indicators. The date column may also be an unnamed
// first column (a dumped pandas index). An empty cell or "nan" reads as
// missing.
//
// Raw series (one indicator):
//   date,<name>
// Exactly one value column is expected.
//
// Raw directory (the fetcher's download cache):
//   spy.csv, vix.csv and one fear & greed file, each a raw series. See
//   loadRawDataset().
//
// Every reader throws ConfigurationError on a missing file, a missing
// required column, an unparseable date, or an unparseable number. The
// istream overloads take a `source` label used only in error messages.
// -----------------------------------------------------------------------------

AlignedDataset readMergedCsv(std::istream& in, const std::string& source);
AlignedDataset loadMergedCsv(const std::string& path);

DatedSeries readSeriesCsv(std::istream& in, const std::string& source);
DatedSeries loadSeriesCsv(const std::string& path);

// File names inside a raw directory.
inline constexpr const char* kPriceFile = "spy.csv";
inline constexpr const char* kVixFile = "vix.csv";

// Fear & greed files in preference order: the full history first, then the
// fetcher's current-value fallbacks.
inline constexpr const char* kFearGreedFiles[] = {
    "fear_greed_historical.csv", "cnn_fear_greed_current.csv",
    "cnn_fear_greed.csv"};

// Path of the first kFearGreedFiles entry that exists in dir, or nullopt.
std::optional<std::string> findFearGreedFile(const std::string& dir);

// -------------------------------------------------------------------------
// loadRawDataset
// -------------------------------------------------------------------------
// @brief  Loads spy.csv, vix.csv and the preferred fear & greed file from
//         dir and inner-joins them on date (see innerJoin()).
//
// @throws ConfigurationError if a required file is missing or malformed,
//         or if no fear & greed file exists.
// -------------------------------------------------------------------------
AlignedDataset loadRawDataset(const std::string& dir);

// -------------------------------------------------------------------------
// writeSignalTable
// -------------------------------------------------------------------------
// @brief  Writes date,spy_price,vix,cnn_fg,signal, one row per day. Missing
//         values are written as empty cells.
//
// @throws ConfigurationError if signals and dataset differ in length or the
//         file cannot be opened.
// -------------------------------------------------------------------------
void writeSignalTable(std::ostream& out, const AlignedDataset& dataset,
                      const std::vector<domain::Signal>& signals);
void writeSignalTable(const std::string& path, const AlignedDataset& dataset,
                      const std::vector<domain::Signal>& signals);

}  // namespace sentiment
