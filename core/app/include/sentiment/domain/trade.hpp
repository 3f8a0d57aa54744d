#pragma once

#include "sentiment/domain/date.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sentiment {
namespace domain {

// -----------------------------------------------------------------------------
// Trade — one round trip FLAT -> LONG -> FLAT
// -----------------------------------------------------------------------------
//
// @brief  Record of a single long position from the executed BUY to the
//         executed SELL.
//
// @details
// Both legs fill at the close of the day the signal was generated on. The
// position is then held from the following day onward (see
// BacktestEngine::applyExecutionLag), so the equity earned while the trade
// is open compounds to exactly exit_price / entry_price.
//
//   holding_days = exit_date - entry_date  (calendar days)
//   pnl_pct      = exit_price / entry_price - 1
//
// closed_at_end is true only for a trade force-closed at the last available
// close under OpenPositionPolicy::MarkToLast. A trade that is still open and
// reported as unrealized carries the mark (last date, last close) in its
// exit fields.
//
// Ownership:
//   Owned by BacktestResult. Immutable once appended to the trade log.
// -----------------------------------------------------------------------------
struct Trade {
  Date entry_date{};
  double entry_price{0.0};
  Date exit_date{};
  double exit_price{0.0};
  std::int32_t holding_days{0};
  double pnl_pct{0.0};
  std::size_t entry_index{0};  // Row of the executed BUY
  std::size_t exit_index{0};   // Row of the executed SELL (or the mark row)
  bool closed_at_end{false};
};

// One point of the equity curve.
struct EquityPoint {
  Date date{};
  double equity{0.0};
};

using EquityCurve = std::vector<EquityPoint>;

}  // namespace domain
}  // namespace sentiment
