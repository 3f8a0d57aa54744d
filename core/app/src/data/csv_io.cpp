#include "sentiment/data/csv_io.hpp"
#include "sentiment/config/configuration_error.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace sentiment {

namespace {

std::string trim(const std::string& s) {
  const std::size_t b = s.find_first_not_of(" \t\r\n\"");
  if (b == std::string::npos) {
    return "";
  }
  const std::size_t e = s.find_last_not_of(" \t\r\n\"");
  return s.substr(b, e - b + 1);
}

// Plain comma split. The fetcher never quotes commas inside a cell; quote
// characters themselves are stripped by trim().
std::vector<std::string> splitRow(const std::string& line) {
  std::vector<std::string> cells;
  std::stringstream ss(line);
  std::string cell;
  while (std::getline(ss, cell, ',')) {
    cells.push_back(trim(cell));
  }
  // A trailing comma means a trailing empty cell.
  if (!line.empty() && line.back() == ',') {
    cells.emplace_back();
  }
  return cells;
}

std::string where(const std::string& source, std::size_t line_no) {
  return source + ":" + std::to_string(line_no);
}

double parseNumber(const std::string& cell, const std::string& location) {
  // pandas writes missing values as an empty cell; hand-edited files use
  // the textual spellings.
  if (cell.empty() || cell == "nan" || cell == "NaN" || cell == "NA") {
    return domain::kMissing;
  }
  // strtod must consume the whole cell: "12abc" is an error, not 12.
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(cell.c_str(), &end);
  if (end == cell.c_str() || *end != '\0' || errno == ERANGE) {
    throw ConfigurationError("unparseable number '" + cell + "' at " +
                             location);
  }
  return value;
}

domain::Date parseDateCell(const std::string& cell,
                           const std::string& location) {
  auto date = domain::parseDate(cell);
  if (!date.has_value()) {
    throw ConfigurationError("unparseable date '" + cell + "' at " + location);
  }
  return *date;
}

int columnIndex(const std::vector<std::string>& header,
                const std::string& name) {
  for (std::size_t i = 0; i < header.size(); ++i) {
    if (header[i] == name) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

// Index of the date column: "date" by name, else an unnamed first column.
int dateColumn(const std::vector<std::string>& header) {
  int idx = columnIndex(header, "date");
  if (idx < 0 && !header.empty() && header[0].empty()) {
    idx = 0;
  }
  return idx;
}

std::string cellAt(const std::vector<std::string>& cells, int idx) {
  return static_cast<std::size_t>(idx) < cells.size() ? cells[idx]
                                                      : std::string();
}

std::ifstream openForRead(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("cannot open data file: " + path);
  }
  return in;
}

std::string formatCell(double value) {
  if (domain::isMissing(value)) {
    return "";
  }
  std::ostringstream os;
  os.precision(10);
  os << value;
  return os.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// readMergedCsv
// -----------------------------------------------------------------------------
AlignedDataset readMergedCsv(std::istream& in, const std::string& source) {
  std::string line;

  // --- Step 1: header ----------------------------------------------------
  if (!std::getline(in, line)) {
    throw ConfigurationError("empty data file: " + source);
  }

  // Resolve every required column by name up front so a bad header fails
  // before any row is parsed.
  const auto header = splitRow(line);
  const int date_idx = dateColumn(header);
  const int price_idx = columnIndex(header, "spy_price");
  const int vix_idx = columnIndex(header, "vix");
  const int fg_idx = columnIndex(header, "cnn_fg");
  if (date_idx < 0 || price_idx < 0 || vix_idx < 0 || fg_idx < 0) {
    throw ConfigurationError(
        source + ": header must contain date, spy_price, vix and cnn_fg");
  }

  // --- Step 2: rows ------------------------------------------------------
  // line_no counts physical lines (header is 1) for error messages.
  AlignedDataset dataset;
  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    // Blank lines (often a trailing newline pair) carry no day.
    if (trim(line).empty()) {
      continue;
    }
    // Short rows read their absent trailing cells as missing; cellAt()
    // never indexes past the end.
    const auto cells = splitRow(line);
    const std::string loc = where(source, line_no);
    dataset.append(parseDateCell(cellAt(cells, date_idx), loc),
                   parseNumber(cellAt(cells, price_idx), loc),
                   parseNumber(cellAt(cells, vix_idx), loc),
                   parseNumber(cellAt(cells, fg_idx), loc));
  }
  return dataset;
}

AlignedDataset loadMergedCsv(const std::string& path) {
  std::ifstream in = openForRead(path);
  AlignedDataset dataset = readMergedCsv(in, path);
  std::cout << "[CsvLoader] loaded " << path << " (" << dataset.size()
            << " rows)\n";
  return dataset;
}

// -----------------------------------------------------------------------------
// readSeriesCsv
// -----------------------------------------------------------------------------
DatedSeries readSeriesCsv(std::istream& in, const std::string& source) {
  std::string line;
  if (!std::getline(in, line)) {
    throw ConfigurationError("empty data file: " + source);
  }
  // Index column plus exactly one indicator; the indicator's header name is
  // not checked since each fetcher source names it differently.
  const auto header = splitRow(line);
  if (header.size() != 2) {
    throw ConfigurationError(source +
                             ": expected exactly 1 data column besides date");
  }

  DatedSeries series;
  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty()) {
      continue;
    }
    const auto cells = splitRow(line);
    const std::string loc = where(source, line_no);
    series.push_back({parseDateCell(cellAt(cells, 0), loc),
                      parseNumber(cellAt(cells, 1), loc)});
  }
  return series;
}

DatedSeries loadSeriesCsv(const std::string& path) {
  std::ifstream in = openForRead(path);
  DatedSeries series = readSeriesCsv(in, path);
  std::cout << "[CsvLoader] loaded " << path << " (" << series.size()
            << " rows)\n";
  return series;
}

// -----------------------------------------------------------------------------
// findFearGreedFile: first existing candidate wins
// -----------------------------------------------------------------------------
std::optional<std::string> findFearGreedFile(const std::string& dir) {
  namespace fs = std::filesystem;
  for (const char* name : kFearGreedFiles) {
    const fs::path candidate = fs::path(dir) / name;
    // The error_code overload: an unreadable directory is "not found"
    // here, and loadRawDataset reports it.
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate.string();
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// loadRawDataset: three raw series -> inner join
// -----------------------------------------------------------------------------
AlignedDataset loadRawDataset(const std::string& dir) {
  namespace fs = std::filesystem;

  // --- Step 1: required series -------------------------------------------
  // loadSeriesCsv throws ConfigurationError naming the path when a file is
  // absent, which is the error we want for a required input.
  const fs::path root(dir);
  const DatedSeries prices = loadSeriesCsv((root / kPriceFile).string());
  const DatedSeries vix = loadSeriesCsv((root / kVixFile).string());

  // --- Step 2: fear & greed by preference ----------------------------------
  // Only a missing file moves on to the next candidate. A candidate that
  // exists but is malformed throws from loadSeriesCsv.
  const auto fg_path = findFearGreedFile(dir);
  if (!fg_path.has_value()) {
    std::string names;
    for (const char* name : kFearGreedFiles) {
      names += names.empty() ? name : std::string(", ") + name;
    }
    throw ConfigurationError("no fear & greed file in " + dir +
                             " (looked for " + names + ")");
  }
  std::cout << "[CsvLoader] using fear & greed file " << *fg_path << "\n";
  const DatedSeries fear_greed = loadSeriesCsv(*fg_path);

  // --- Step 3: align -------------------------------------------------------
  // Days missing from any series are dropped; the result is date-sorted.
  AlignedDataset dataset = innerJoin(prices, vix, fear_greed);
  std::cout << "[CsvLoader] joined " << dataset.size() << " common days from "
            << dir << "\n";
  return dataset;
}

// -----------------------------------------------------------------------------
// writeSignalTable
// -----------------------------------------------------------------------------
void writeSignalTable(std::ostream& out, const AlignedDataset& dataset,
                      const std::vector<domain::Signal>& signals) {
  // Checked before the header is written so a mismatch leaves no partial
  // file content.
  if (signals.size() != dataset.size() ||
      dataset.sentiment.size() != dataset.prices.size()) {
    throw ConfigurationError("signal table: " + std::to_string(signals.size()) +
                             " signals for " + std::to_string(dataset.size()) +
                             " rows");
  }

  // Same column names readMergedCsv() looks up, so the output loads back
  // as a merged table.
  out << "date,spy_price,vix,cnn_fg,signal\n";
  for (std::size_t i = 0; i < signals.size(); ++i) {
    const auto& s = dataset.sentiment[i];
    out << domain::formatDate(dataset.prices[i].date) << ','
        << formatCell(dataset.prices[i].close) << ',' << formatCell(s.vix)
        << ',' << formatCell(s.fear_greed) << ','
        << domain::signalToString(signals[i]) << '\n';
  }
}

void writeSignalTable(const std::string& path, const AlignedDataset& dataset,
                      const std::vector<domain::Signal>& signals) {
  std::ofstream out(path);
  if (!out) {
    throw ConfigurationError("cannot open output file: " + path);
  }
  writeSignalTable(out, dataset, signals);
  std::cout << "[CsvWriter] signals saved: " << path << " (" << signals.size()
            << " rows)\n";
}

}  // namespace sentiment
