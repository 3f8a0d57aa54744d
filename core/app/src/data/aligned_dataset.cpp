#include "sentiment/data/aligned_dataset.hpp"
#include "sentiment/config/configuration_error.hpp"

#include <iostream>
#include <map>
#include <string>

namespace sentiment {

namespace {

std::string rowLabel(const domain::Date& date, std::size_t row) {
  return domain::formatDate(date) + " (row " + std::to_string(row) + ")";
}

std::map<domain::Date, double> indexByDate(const DatedSeries& series,
                                           const char* name) {
  std::map<domain::Date, double> index;
  for (const auto& point : series) {
    if (!index.emplace(point.date, point.value).second) {
      throw ConfigurationError(std::string("duplicate date ") +
                               domain::formatDate(point.date) + " in " +
                               name + " series");
    }
  }
  return index;
}

}  // namespace

// -----------------------------------------------------------------------------
// validateAlignment
// -----------------------------------------------------------------------------
void validateAlignment(const AlignedDataset& dataset) {
  if (dataset.sentiment.size() != dataset.prices.size()) {
    throw ConfigurationError(
        "sentiment series has " + std::to_string(dataset.sentiment.size()) +
        " rows but price series has " + std::to_string(dataset.prices.size()));
  }

  for (std::size_t i = 0; i < dataset.prices.size(); ++i) {
    const auto& s = dataset.sentiment[i];
    const auto& p = dataset.prices[i];

    if (s.date != p.date) {
      throw ConfigurationError("row " + std::to_string(i) +
                               " misaligned: sentiment " +
                               domain::formatDate(s.date) + " vs price " +
                               domain::formatDate(p.date));
    }
    if (i > 0 && !(dataset.prices[i - 1].date < p.date)) {
      throw ConfigurationError("dates not strictly increasing at " +
                               rowLabel(p.date, i));
    }
    if (!domain::isMissing(s.vix) && s.vix <= 0.0) {
      throw ConfigurationError("non-positive VIX on " + rowLabel(s.date, i));
    }
    if (!domain::isMissing(s.fear_greed) &&
        (s.fear_greed < 0.0 || s.fear_greed > 100.0)) {
      throw ConfigurationError("fear & greed index outside [0, 100] on " +
                               rowLabel(s.date, i));
    }
  }
}

// -----------------------------------------------------------------------------
// inspectQuality
// -----------------------------------------------------------------------------
DataQualityReport inspectQuality(const AlignedDataset& dataset) {
  DataQualityReport report;
  report.rows = dataset.size();

  for (const auto& s : dataset.sentiment) {
    if (domain::isMissing(s.vix)) ++report.missing_vix;
    if (domain::isMissing(s.fear_greed)) ++report.missing_fear_greed;
  }
  for (std::size_t i = 0; i < dataset.prices.size(); ++i) {
    if (domain::isMissing(dataset.prices[i].close)) ++report.missing_close;
    if (i > 0) {
      const std::int32_t gap =
          dataset.prices[i].date - dataset.prices[i - 1].date;
      if (gap > report.largest_gap_days) report.largest_gap_days = gap;
    }
  }

  if (report.missing_vix > 0 || report.missing_fear_greed > 0 ||
      report.missing_close > 0) {
    std::cerr << "[DataQuality] WARNING: missing values: vix="
              << report.missing_vix
              << " fear_greed=" << report.missing_fear_greed
              << " close=" << report.missing_close << "\n";
  }
  if (report.largest_gap_days > kMaxExpectedGapDays) {
    std::cerr << "[DataQuality] WARNING: largest gap between rows is "
              << report.largest_gap_days << " days\n";
  }
  return report;
}

// -----------------------------------------------------------------------------
// innerJoin
// -----------------------------------------------------------------------------
AlignedDataset innerJoin(const DatedSeries& prices, const DatedSeries& vix,
                         const DatedSeries& fear_greed) {
  const auto price_index = indexByDate(prices, "price");
  const auto vix_index = indexByDate(vix, "vix");
  const auto fg_index = indexByDate(fear_greed, "fear_greed");

  AlignedDataset dataset;
  for (const auto& [date, close] : price_index) {
    auto v = vix_index.find(date);
    auto f = fg_index.find(date);
    if (v == vix_index.end() || f == fg_index.end()) {
      continue;
    }
    dataset.append(date, close, v->second, f->second);
  }

  const std::size_t kept = dataset.size();
  std::cout << "[DataAligner] joined " << kept << " rows (dropped price="
            << prices.size() - kept << " vix=" << vix.size() - kept
            << " fear_greed=" << fear_greed.size() - kept << ")\n";
  return dataset;
}

}  // namespace sentiment
