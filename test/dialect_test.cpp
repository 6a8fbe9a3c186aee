/**
 * @file dialect_test.cpp
 * @brief Tests for dialect factories and command-line delimiter names.
 */

#include "tabedit/dialect.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace tabedit;

class DialectTest : public ::testing::Test {};

TEST_F(DialectTest, DefaultIsTabSeparated) {
  Dialect d;
  EXPECT_EQ(d.delimiter, "\t");
  EXPECT_EQ(d.quote_char, '"');
  EXPECT_EQ(d.comment_prefix, "#");
  EXPECT_EQ(d, Dialect::tsv());
}

TEST_F(DialectTest, Factories) {
  EXPECT_EQ(Dialect::csv().delimiter, ",");
  EXPECT_EQ(Dialect::semicolon().delimiter, ";");
  EXPECT_EQ(Dialect::pipe().delimiter, "|");
  EXPECT_NE(Dialect::csv(), Dialect::tsv());
}

TEST_F(DialectTest, FromName) {
  EXPECT_EQ(dialect_from_name("comma").delimiter, ",");
  EXPECT_EQ(dialect_from_name("tab").delimiter, "\t");
  EXPECT_EQ(dialect_from_name("\\t").delimiter, "\t");
  EXPECT_EQ(dialect_from_name("semicolon").delimiter, ";");
  EXPECT_EQ(dialect_from_name("pipe").delimiter, "|");
  EXPECT_EQ(dialect_from_name("::").delimiter, "::");
}

TEST_F(DialectTest, FromNameKeepsQuoteAndComment) {
  Dialect d = dialect_from_name("comma", '\'', "//");
  EXPECT_EQ(d.quote_char, '\'');
  EXPECT_EQ(d.comment_prefix, "//");
}

TEST_F(DialectTest, EmptyDelimiterThrows) {
  EXPECT_THROW(dialect_from_name(""), std::invalid_argument);
}

TEST_F(DialectTest, ToStringEscapesTab) {
  EXPECT_EQ(Dialect::tsv().to_string(), "Dialect{delimiter='\\t', quote='\"', comment='#'}");
}
