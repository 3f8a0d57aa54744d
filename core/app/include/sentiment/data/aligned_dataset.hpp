#pragma once

#include "sentiment/domain/date.hpp"
#include "sentiment/domain/market_records.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sentiment {

// -----------------------------------------------------------------------------
// AlignedDataset — the two input series the core consumes
// -----------------------------------------------------------------------------
//
// @brief  Sentiment and price rows, row i of each describing the same day.
//
// @details
// Producers (CSV loader, inner join, dataset gateway) build this with
// matching rows. Consumers must still call validateAlignment() before use:
// a row shift between the two vectors silently corrupts every downstream
// number, so alignment is checked, never assumed.
// -----------------------------------------------------------------------------
struct AlignedDataset {
  std::vector<domain::SentimentRecord> sentiment;
  std::vector<domain::PriceRecord> prices;

  std::size_t size() const { return prices.size(); }
  bool empty() const { return prices.empty(); }

  // Appends one day to both series.
  void append(domain::Date date, double close, double vix, double fear_greed) {
    sentiment.push_back({date, vix, fear_greed});
    prices.push_back({date, close});
  }
};

// A raw single-indicator series as written by the data fetcher.
struct DatedValue {
  domain::Date date{};
  double value{domain::kMissing};
};
using DatedSeries = std::vector<DatedValue>;

// -----------------------------------------------------------------------------
// DataQualityReport — non-fatal observations about a dataset
// -----------------------------------------------------------------------------
struct DataQualityReport {
  std::size_t rows{0};
  std::size_t missing_vix{0};
  std::size_t missing_fear_greed{0};
  std::size_t missing_close{0};
  std::int32_t largest_gap_days{0};  // Largest calendar gap between rows
};

// Gaps wider than this are reported as a warning.
inline constexpr std::int32_t kMaxExpectedGapDays = 5;

// -------------------------------------------------------------------------
// validateAlignment
// -------------------------------------------------------------------------
// @brief  Fails fast on any structural problem.
//
// @throws ConfigurationError if
//   - the two series differ in length,
//   - row i has different dates in the two series,
//   - dates are not strictly increasing,
//   - a non-missing VIX is <= 0 or a non-missing fear & greed value lies
//     outside [0, 100].
// Missing sentiment is allowed here (it degrades to HOLD); missing prices
// are rejected later by BacktestEngine::validateInputs().
// -------------------------------------------------------------------------
void validateAlignment(const AlignedDataset& dataset);

// -------------------------------------------------------------------------
// inspectQuality
// -------------------------------------------------------------------------
// @brief  Counts missing values and the widest date gap, logging a warning
//         for each non-zero finding. Never throws.
// -------------------------------------------------------------------------
DataQualityReport inspectQuality(const AlignedDataset& dataset);

// -------------------------------------------------------------------------
// innerJoin
// -------------------------------------------------------------------------
// @brief  Merges three raw series on date, keeping only dates present in
//         all three, in ascending date order.
//
// @details
// Input order does not matter. Dropped rows are counted and logged; this is
// the one place where misaligned data is reconciled by dropping rather than
// rejected.
//
// @throws ConfigurationError if a series repeats a date.
// -------------------------------------------------------------------------
AlignedDataset innerJoin(const DatedSeries& prices, const DatedSeries& vix,
                         const DatedSeries& fear_greed);

}  // namespace sentiment
