// =============================================================================
// date_test.cpp
// =============================================================================
// Unit tests for sentiment::domain::Date and the signal/state enums.
//
// Validates:
//   - fromCivil against known day numbers (epoch, leap days, pre-epoch)
//   - parseDate accepts pandas-style timestamps, rejects invalid days
//   - formatDate inverts fromCivil
//   - Enum string conversions used by CSV and JSON output
// =============================================================================

#include "sentiment/domain/date.hpp"
#include "sentiment/domain/signal.hpp"

#include <gtest/gtest.h>

using sentiment::domain::Date;
using sentiment::domain::formatDate;
using sentiment::domain::fromCivil;
using sentiment::domain::parseDate;

TEST(DateTest, FromCivilKnownValues) {
  EXPECT_EQ(fromCivil(1970, 1, 1).days, 0);
  EXPECT_EQ(fromCivil(1969, 12, 31).days, -1);
  EXPECT_EQ(fromCivil(2000, 3, 1).days, 11017);
  EXPECT_EQ(fromCivil(2024, 2, 29).days, 19782);
  EXPECT_EQ(fromCivil(2024, 3, 1) - fromCivil(2024, 2, 28), 2);
  EXPECT_EQ(fromCivil(2023, 3, 1) - fromCivil(2023, 2, 28), 1);
}

TEST(DateTest, ParseAcceptsDateAndTimestamp) {
  auto d = parseDate("2024-02-29");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(*d, fromCivil(2024, 2, 29));

  d = parseDate("2011-01-03 00:00:00");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(*d, fromCivil(2011, 1, 3));

  d = parseDate("2011-01-03T00:00:00");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(*d, fromCivil(2011, 1, 3));
}

TEST(DateTest, ParseRejectsInvalidText) {
  EXPECT_FALSE(parseDate("").has_value());
  EXPECT_FALSE(parseDate("2024-1-05").has_value());
  EXPECT_FALSE(parseDate("2024/01/05").has_value());
  EXPECT_FALSE(parseDate("2024-13-01").has_value());
  EXPECT_FALSE(parseDate("2024-00-10").has_value());
  EXPECT_FALSE(parseDate("2023-02-29").has_value());
  EXPECT_FALSE(parseDate("2024-04-31").has_value());
  EXPECT_FALSE(parseDate("2024-01-05x").has_value());
  EXPECT_FALSE(parseDate("yesterday").has_value());
}

TEST(DateTest, FormatInvertsFromCivil) {
  EXPECT_EQ(formatDate(Date{0}), "1970-01-01");
  EXPECT_EQ(formatDate(Date{-1}), "1969-12-31");
  EXPECT_EQ(formatDate(fromCivil(2024, 2, 29)), "2024-02-29");

  for (int days = -800; days < 25000; days += 37) {
    const Date date{days};
    auto parsed = parseDate(formatDate(date));
    ASSERT_TRUE(parsed.has_value()) << formatDate(date);
    EXPECT_EQ(parsed->days, days);
  }
}

TEST(DateTest, Ordering) {
  const Date a = fromCivil(2020, 3, 16);
  const Date b = fromCivil(2020, 3, 17);
  EXPECT_LT(a, b);
  EXPECT_NE(a, b);
  EXPECT_EQ(b - a, 1);
}

TEST(SignalTest, StringConversions) {
  using sentiment::domain::PositionState;
  using sentiment::domain::Signal;

  EXPECT_STREQ(sentiment::domain::signalToString(Signal::Hold), "HOLD");
  EXPECT_STREQ(sentiment::domain::signalToString(Signal::Buy), "BUY");
  EXPECT_STREQ(sentiment::domain::signalToString(Signal::Sell), "SELL");
  EXPECT_STREQ(sentiment::domain::positionStateToString(PositionState::Flat),
               "FLAT");
  EXPECT_STREQ(sentiment::domain::positionStateToString(PositionState::Long),
               "LONG");

  EXPECT_EQ(sentiment::domain::signalFromString("BUY").value(), Signal::Buy);
  EXPECT_EQ(sentiment::domain::signalFromString("SELL").value(), Signal::Sell);
  EXPECT_EQ(sentiment::domain::signalFromString("HOLD").value(), Signal::Hold);
  EXPECT_FALSE(sentiment::domain::signalFromString("buy").has_value());
}
