#pragma once

#include "sentiment/domain/date.hpp"

#include <cmath>
#include <limits>

namespace sentiment {
namespace domain {

// Sentinel used for a missing observation in any daily field.
inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

// Missing means NaN or +/-inf; such values must never reach a comparison.
inline bool isMissing(double value) { return !std::isfinite(value); }

// -----------------------------------------------------------------------------
// SentimentRecord — one day of sentiment indicators
// -----------------------------------------------------------------------------
//
// @brief  Closing values of the CBOE volatility index and the CNN fear &
//         greed index for a single trading day.
//
// @details
// Valid ranges:
//   vix         > 0
//   fear_greed  in [0, 100]
// Either field may be kMissing (the upstream feeds have holes). A record
// with a missing field still occupies its row so that the series stays
// aligned with the price series; the SignalEngine degrades it to HOLD.
//
// Ownership:
//   Held by value in AlignedDataset; never mutated after ingestion.
// -----------------------------------------------------------------------------
struct SentimentRecord {
  Date date{};
  double vix{kMissing};         // CBOE VIX close
  double fear_greed{kMissing};  // CNN Fear & Greed index, 0 = extreme fear
};

// -----------------------------------------------------------------------------
// PriceRecord — one day of the traded instrument's close
// -----------------------------------------------------------------------------
// Must be date-aligned 1:1 with the SentimentRecord series. A missing close
// breaks causal equity accrual and is rejected during validation.
// -----------------------------------------------------------------------------
struct PriceRecord {
  Date date{};
  double close{kMissing};
};

}  // namespace domain
}  // namespace sentiment
