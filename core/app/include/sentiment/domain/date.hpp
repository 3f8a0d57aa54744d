#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sentiment {
namespace domain {

// -----------------------------------------------------------------------------
// Date — calendar day as a count of days since 1970-01-01
// -----------------------------------------------------------------------------
//
// @brief  Value type identifying one trading day in a daily series.
//
// @details
// Daily sentiment and price rows are keyed by calendar date only; there is
// no intraday component. Storing the day number (rather than a
// std::chrono::system_clock::time_point) keeps the type timezone-free and
// makes exitDate - entryDate a plain integer subtraction.
//
// Conversion to and from the civil (year, month, day) form uses the
// proleptic Gregorian calendar and is valid for any date the data feeds can
// carry (years 1900..2200 and well beyond).
//
// Thread model:
//   Plain value type; safe to copy between threads.
// -----------------------------------------------------------------------------
struct Date {
  std::int32_t days{0};  // Days since 1970-01-01 (may be negative)

  friend bool operator==(Date a, Date b) { return a.days == b.days; }
  friend bool operator!=(Date a, Date b) { return a.days != b.days; }
  friend bool operator<(Date a, Date b) { return a.days < b.days; }
  friend bool operator<=(Date a, Date b) { return a.days <= b.days; }
  friend bool operator>(Date a, Date b) { return a.days > b.days; }
  friend bool operator>=(Date a, Date b) { return a.days >= b.days; }

  // Calendar-day distance (b - a) in whole days.
  friend std::int32_t operator-(Date b, Date a) { return b.days - a.days; }
};

// -------------------------------------------------------------------------
// fromCivil
// -------------------------------------------------------------------------
// @brief  Builds a Date from year, month (1-12) and day (1-31).
//
// @details
// No range validation beyond what the algorithm needs; use parseDate() for
// untrusted input.
// -------------------------------------------------------------------------
Date fromCivil(int year, unsigned month, unsigned day);

// -------------------------------------------------------------------------
// parseDate
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD". A trailing time component separated by a
//         space or 'T' (as written by pandas index dumps) is ignored.
//
// @return The Date, or std::nullopt if the text is not a valid day.
// -------------------------------------------------------------------------
std::optional<Date> parseDate(const std::string& text);

// Formats as "YYYY-MM-DD".
std::string formatDate(Date date);

}  // namespace domain
}  // namespace sentiment
