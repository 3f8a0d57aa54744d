#include "sentiment/domain/date.hpp"

#include <cctype>
#include <cstdio>

namespace sentiment {
namespace domain {

namespace {

bool isLeapYear(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned daysInMonth(int y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  if (m == 2 && isLeapYear(y)) {
    return 29;
  }
  return kDays[m - 1];
}

// Reads exactly `width` decimal digits starting at `pos`.
bool readDigits(const std::string& s, std::size_t pos, std::size_t width,
                int& out) {
  if (pos + width > s.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    value = value * 10 + (s[i] - '0');
  }
  out = value;
  return true;
}

}  // namespace

// -----------------------------------------------------------------------------
// fromCivil: days-from-civil over 400-year eras
// -----------------------------------------------------------------------------
Date fromCivil(int year, unsigned month, unsigned day) {
  // Shift the year so that it starts in March; February (and its leap day)
  // then falls at the end of the shifted year.
  const int y = year - (month <= 2 ? 1 : 0);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);           // [0, 399]
  const unsigned mp = month > 2 ? month - 3 : month + 9;               // [0, 11]
  const unsigned doy = (153 * mp + 2) / 5 + day - 1;                   // [0, 365]
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;          // [0, 146096]
  return Date{static_cast<std::int32_t>(era * 146097 +
                                        static_cast<int>(doe) - 719468)};
}

// -----------------------------------------------------------------------------
// parseDate
// -----------------------------------------------------------------------------
std::optional<Date> parseDate(const std::string& text) {
  int year = 0;
  int month = 0;
  int day = 0;
  if (!readDigits(text, 0, 4, year) || text.size() < 10 || text[4] != '-' ||
      !readDigits(text, 5, 2, month) || text[7] != '-' ||
      !readDigits(text, 8, 2, day)) {
    return std::nullopt;
  }
  if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 ||
      static_cast<unsigned>(day) >
          daysInMonth(year, static_cast<unsigned>(month))) {
    return std::nullopt;
  }
  return fromCivil(year, static_cast<unsigned>(month),
                   static_cast<unsigned>(day));
}

// -----------------------------------------------------------------------------
// formatDate: civil-from-days, inverse of fromCivil
// -----------------------------------------------------------------------------
std::string formatDate(Date date) {
  const int z = date.days + 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const int y = static_cast<int>(yoe) + era * 400 + (m <= 2 ? 1 : 0);

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
  return std::string(buf);
}

}  // namespace domain
}  // namespace sentiment
