#include <gtest/gtest.h>
#include "CsvRow.hpp"
#include "SourceError.hpp"

TEST(CsvRow, SplitsAndTrims) {
  EXPECT_EQ(parse_csv_line(" 1, 2 ,3 "), (CsvRow{"1", "2", "3"}));
}

TEST(CsvRow, DropsCarriageReturn) {
  EXPECT_EQ(parse_csv_line("x,y,z\r"), (CsvRow{"x", "y", "z"}));
}

TEST(CsvRow, QuotedCellKeepsComma) {
  EXPECT_EQ(parse_csv_line("\"a,b\",2"), (CsvRow{"a,b", "2"}));
}

TEST(CsvRow, EmptyLineHasNoCells) {
  EXPECT_TRUE(parse_csv_line("").empty());
  EXPECT_TRUE(parse_csv_line("\r").empty());
}

TEST(CsvRow, BlankRows) {
  EXPECT_TRUE(is_blank_row({}));
  EXPECT_TRUE(is_blank_row(parse_csv_line(" , ,")));
  EXPECT_FALSE(is_blank_row(parse_csv_line(",1,")));
}

TEST(CsvRow, UnterminatedQuoteIsMalformed) {
  try {
    parse_csv_line("\"1,2");
    FAIL() << "expected MalformedRow";
  } catch (const SourceError& e) {
    EXPECT_EQ(e.code(), SourceErrc::MalformedRow);
  }
}

TEST(CsvRow, NormalizeCell) {
  EXPECT_EQ(normalize_cell("  Longitude "), "longitude");
}

TEST(CsvRow, Numbers) {
  EXPECT_TRUE(is_number("1"));
  EXPECT_TRUE(is_number("-2.5"));
  EXPECT_TRUE(is_number("1e3"));
  EXPECT_FALSE(is_number(""));
  EXPECT_FALSE(is_number("x"));
  EXPECT_FALSE(is_number("12abc"));
}

TEST(CsvRow, StrayQuoteMidLineIsMalformed) {
  EXPECT_THROW(parse_csv_line("1,2\",3"), SourceError);
  EXPECT_EQ(parse_csv_line("\"1\",\"2\",3"), (CsvRow{"1", "2", "3"}));
}
