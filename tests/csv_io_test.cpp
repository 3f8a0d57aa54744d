// =============================================================================
// csv_io_test.cpp
// =============================================================================
// Unit tests for the data fetcher CSV readers and the signal table writer.
//
// Validates:
//   - Merged table: columns located by name, unnamed index column,
//     missing cells, blank lines, timestamp dates
//   - Raw series: exactly one value column
//   - Errors: missing columns, bad numbers, bad dates, missing files
//   - Signal table layout and length check
//   - Raw directory: fear & greed file preference order, inner join of the
//     three series, missing-file errors
// =============================================================================

#include "sentiment/config/configuration_error.hpp"
#include "sentiment/data/csv_io.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using sentiment::ConfigurationError;
using sentiment::domain::fromCivil;
using sentiment::domain::Signal;

namespace fs = std::filesystem;

namespace {

// Fresh, empty directory under the GoogleTest temp dir.
fs::path makeRawDir(const std::string& name) {
  const fs::path dir = fs::path(::testing::TempDir()) / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void writeFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path);
  out << content;
}

// spy.csv and vix.csv as the fetcher saves them: a date index plus one
// value column.
void writePriceAndVix(const fs::path& dir) {
  writeFile(dir / "spy.csv",
            "date,spy_price\n"
            "2024-01-02,472.65\n"
            "2024-01-03,468.79\n"
            "2024-01-04,467.28\n");
  writeFile(dir / "vix.csv",
            "date,vix\n"
            "2024-01-02,13.2\n"
            "2024-01-03,14.04\n"
            "2024-01-04,14.13\n"
            "2024-01-05,13.35\n");
}

}  // namespace

TEST(CsvIoTest, ReadsMergedTable) {
  std::istringstream in(
      "date,spy_price,vix,cnn_fg\n"
      "2024-01-02,472.65,13.2,71\n"
      "\n"
      "2024-01-03,468.79,14.04,\n"
      "2024-01-04,467.28,nan,65\n");
  auto d = sentiment::readMergedCsv(in, "merged");

  ASSERT_EQ(d.size(), 3u);
  EXPECT_EQ(d.prices[0].date, fromCivil(2024, 1, 2));
  EXPECT_DOUBLE_EQ(d.prices[0].close, 472.65);
  EXPECT_DOUBLE_EQ(d.sentiment[0].vix, 13.2);
  EXPECT_DOUBLE_EQ(d.sentiment[0].fear_greed, 71.0);
  EXPECT_TRUE(std::isnan(d.sentiment[1].fear_greed));
  EXPECT_TRUE(std::isnan(d.sentiment[2].vix));
  EXPECT_EQ(d.sentiment[2].date, d.prices[2].date);
}

TEST(CsvIoTest, LocatesColumnsByNameAndIndex) {
  // Pandas index dump: unnamed first column, reordered columns, an extra
  // signal column and timestamps.
  std::istringstream in(
      ",vix,cnn_fg,spy_price,signal\n"
      "2020-03-16 00:00:00,82.69,2,239.85,BUY\n");
  auto d = sentiment::readMergedCsv(in, "merged");

  ASSERT_EQ(d.size(), 1u);
  EXPECT_EQ(d.prices[0].date, fromCivil(2020, 3, 16));
  EXPECT_DOUBLE_EQ(d.prices[0].close, 239.85);
  EXPECT_DOUBLE_EQ(d.sentiment[0].vix, 82.69);
  EXPECT_DOUBLE_EQ(d.sentiment[0].fear_greed, 2.0);
}

TEST(CsvIoTest, MergedTableErrors) {
  std::istringstream empty("");
  EXPECT_THROW(sentiment::readMergedCsv(empty, "e"), ConfigurationError);

  std::istringstream no_vix("date,spy_price,cnn_fg\n2024-01-02,1,2\n");
  EXPECT_THROW(sentiment::readMergedCsv(no_vix, "n"), ConfigurationError);

  std::istringstream bad_number(
      "date,spy_price,vix,cnn_fg\n2024-01-02,1.0,abc,50\n");
  EXPECT_THROW(sentiment::readMergedCsv(bad_number, "b"),
               ConfigurationError);

  std::istringstream bad_date(
      "date,spy_price,vix,cnn_fg\n01/02/2024,1.0,20,50\n");
  EXPECT_THROW(sentiment::readMergedCsv(bad_date, "d"),
               ConfigurationError);

  EXPECT_THROW(sentiment::loadMergedCsv("/nonexistent/merged.csv"),
               ConfigurationError);
}

TEST(CsvIoTest, ReadsRawSeries) {
  std::istringstream in(
      "date,VIX\n"
      "2024-01-02,13.2\n"
      "2024-01-03,\n");
  auto series = sentiment::readSeriesCsv(in, "vix");
  ASSERT_EQ(series.size(), 2u);
  EXPECT_EQ(series[0].date, fromCivil(2024, 1, 2));
  EXPECT_DOUBLE_EQ(series[0].value, 13.2);
  EXPECT_TRUE(std::isnan(series[1].value));

  std::istringstream wide("date,a,b\n2024-01-02,1,2\n");
  EXPECT_THROW(sentiment::readSeriesCsv(wide, "w"), ConfigurationError);
}

TEST(CsvIoTest, WritesSignalTable) {
  sentiment::AlignedDataset d;
  d.append(fromCivil(2024, 1, 2), 472.65, 13.2, 71.0);
  d.append(fromCivil(2024, 1, 3), 468.79, sentiment::domain::kMissing, 15.0);

  std::ostringstream out;
  sentiment::writeSignalTable(out, d, {Signal::Hold, Signal::Buy});
  EXPECT_EQ(out.str(),
            "date,spy_price,vix,cnn_fg,signal\n"
            "2024-01-02,472.65,13.2,71,HOLD\n"
            "2024-01-03,468.79,,15,BUY\n");

  std::ostringstream ignored;
  EXPECT_THROW(
      sentiment::writeSignalTable(ignored, d, {Signal::Hold}),
      ConfigurationError);
}

TEST(CsvIoTest, SignalTableReadsBack) {
  sentiment::AlignedDataset d;
  d.append(fromCivil(2024, 1, 2), 472.65, 13.2, 71.0);
  d.append(fromCivil(2024, 1, 3), 468.79, 14.04, 15.5);

  std::stringstream buf;
  sentiment::writeSignalTable(buf, d, {Signal::Hold, Signal::Sell});
  auto back = sentiment::readMergedCsv(buf, "roundtrip");

  ASSERT_EQ(back.size(), 2u);
  EXPECT_EQ(back.prices[1].date, d.prices[1].date);
  EXPECT_DOUBLE_EQ(back.prices[1].close, 468.79);
  EXPECT_DOUBLE_EQ(back.sentiment[1].fear_greed, 15.5);
}

// -----------------------------------------------------------------------------
// Raw directory: the full history wins over the current-value fallbacks,
// and a lone fallback is used when it is the only file present.
// -----------------------------------------------------------------------------
TEST(CsvIoTest, FearGreedFilePreferenceOrder) {
  const fs::path dir = makeRawDir("csv_io_fg_order");
  EXPECT_FALSE(sentiment::findFearGreedFile(dir.string()).has_value());

  writeFile(dir / "cnn_fear_greed.csv", "date,cnn_fg\n2024-01-02,70\n");
  auto found = sentiment::findFearGreedFile(dir.string());
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::path(*found).filename().string(), "cnn_fear_greed.csv");

  writeFile(dir / "cnn_fear_greed_current.csv",
            "date,cnn_fg\n2024-01-02,71\n");
  found = sentiment::findFearGreedFile(dir.string());
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::path(*found).filename().string(),
            "cnn_fear_greed_current.csv");

  writeFile(dir / "fear_greed_historical.csv",
            "date,cnn_fg\n2024-01-02,72\n");
  found = sentiment::findFearGreedFile(dir.string());
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::path(*found).filename().string(),
            "fear_greed_historical.csv");

  fs::remove_all(dir);
}

// -----------------------------------------------------------------------------
// Raw directory: only days present in all three series survive, sorted.
// -----------------------------------------------------------------------------
TEST(CsvIoTest, LoadsRawDatasetWithInnerJoin) {
  const fs::path dir = makeRawDir("csv_io_raw_join");
  writePriceAndVix(dir);
  // Out of order, missing 2024-01-03, with a day spy.csv lacks.
  writeFile(dir / "cnn_fear_greed_current.csv",
            "date,cnn_fg\n"
            "2024-01-05,60\n"
            "2024-01-04,65\n"
            "2024-01-02,71\n");

  auto d = sentiment::loadRawDataset(dir.string());
  ASSERT_EQ(d.size(), 2u);
  EXPECT_EQ(d.prices[0].date, fromCivil(2024, 1, 2));
  EXPECT_DOUBLE_EQ(d.prices[0].close, 472.65);
  EXPECT_DOUBLE_EQ(d.sentiment[0].vix, 13.2);
  EXPECT_DOUBLE_EQ(d.sentiment[0].fear_greed, 71.0);
  EXPECT_EQ(d.prices[1].date, fromCivil(2024, 1, 4));
  EXPECT_DOUBLE_EQ(d.sentiment[1].vix, 14.13);
  EXPECT_DOUBLE_EQ(d.sentiment[1].fear_greed, 65.0);

  // Adding the history file switches the source: all three days now join.
  writeFile(dir / "fear_greed_historical.csv",
            "date,cnn_fg\n"
            "2024-01-02,40\n"
            "2024-01-03,35\n"
            "2024-01-04,30\n");
  d = sentiment::loadRawDataset(dir.string());
  ASSERT_EQ(d.size(), 3u);
  EXPECT_DOUBLE_EQ(d.sentiment[0].fear_greed, 40.0);
  EXPECT_DOUBLE_EQ(d.sentiment[1].fear_greed, 35.0);

  fs::remove_all(dir);
}

TEST(CsvIoTest, RawDatasetErrors) {
  // No fear & greed file at all.
  const fs::path dir = makeRawDir("csv_io_raw_errors");
  writePriceAndVix(dir);
  EXPECT_THROW(sentiment::loadRawDataset(dir.string()), ConfigurationError);

  // Required spy.csv missing, even with a fear & greed file present.
  writeFile(dir / "cnn_fear_greed.csv", "date,cnn_fg\n2024-01-02,70\n");
  EXPECT_NO_THROW(sentiment::loadRawDataset(dir.string()));
  fs::remove(dir / "spy.csv");
  EXPECT_THROW(sentiment::loadRawDataset(dir.string()), ConfigurationError);

  // A preferred candidate that exists but is malformed is an error, not a
  // reason to fall through to the next file.
  writePriceAndVix(dir);
  writeFile(dir / "fear_greed_historical.csv", "date,a,b\n2024-01-02,1,2\n");
  EXPECT_THROW(sentiment::loadRawDataset(dir.string()), ConfigurationError);

  EXPECT_THROW(sentiment::loadRawDataset("/nonexistent/raw"),
               ConfigurationError);
  fs::remove_all(dir);
}
