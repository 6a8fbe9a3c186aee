/**
 * @file split_fields_test.cpp
 * @brief Tests for the field tokenizer.
 */

#include "tabedit/split_fields.h"

#include <gtest/gtest.h>

using namespace tabedit;

using Fields = std::vector<std::string>;

class SplitFieldsTest : public ::testing::Test {};

TEST_F(SplitFieldsTest, TabDelimited) {
  EXPECT_EQ(split_fields("a\tb\tc", "\t", '"'), (Fields{"a", "b", "c"}));
}

TEST_F(SplitFieldsTest, NoDelimiterYieldsOneField) {
  EXPECT_EQ(split_fields("abc", ",", '"'), (Fields{"abc"}));
  EXPECT_EQ(split_fields("", ",", '"'), (Fields{""}));
}

TEST_F(SplitFieldsTest, TrailingDelimiterYieldsEmptyField) {
  EXPECT_EQ(split_fields("a,", ",", '"'), (Fields{"a", ""}));
  EXPECT_EQ(split_fields(",,", ",", '"'), (Fields{"", "", ""}));
}

TEST_F(SplitFieldsTest, FieldsAreNotTrimmed) {
  EXPECT_EQ(split_fields(" a , b ", ",", '"'), (Fields{" a ", " b "}));
}

TEST_F(SplitFieldsTest, QuotedDelimiter) {
  EXPECT_EQ(split_fields("1,\"Contains, comma\"", ",", '"'), (Fields{"1", "Contains, comma"}));
}

TEST_F(SplitFieldsTest, DoubledQuoteIsLiteral) {
  EXPECT_EQ(split_fields("1,\"Say \"\"hello\"\"\"", ",", '"'), (Fields{"1", "Say \"hello\""}));
}

TEST_F(SplitFieldsTest, TripleQuoteField) {
  // """" is a quoted field holding a single quote character
  EXPECT_EQ(split_fields("\"\"\"\",x", ",", '"'), (Fields{"\"", "x"}));
}

TEST_F(SplitFieldsTest, EmptyQuotedField) {
  EXPECT_EQ(split_fields("\"\",b", ",", '"'), (Fields{"", "b"}));
}

TEST_F(SplitFieldsTest, EmbeddedNewlineInQuotes) {
  EXPECT_EQ(split_fields("1\t\"line1\nline2\"", "\t", '"'), (Fields{"1", "line1\nline2"}));
}

TEST_F(SplitFieldsTest, MultiCharacterDelimiter) {
  EXPECT_EQ(split_fields("a::b::c", "::", '"'), (Fields{"a", "b", "c"}));
  EXPECT_EQ(split_fields("a:b::c", "::", '"'), (Fields{"a:b", "c"}));
  EXPECT_EQ(split_fields("\"a::b\"::c", "::", '"'), (Fields{"a::b", "c"}));
}

TEST_F(SplitFieldsTest, DelimiterIsLiteralNotRegex) {
  EXPECT_EQ(split_fields("a.b|c", ".", '"'), (Fields{"a", "b|c"}));
  EXPECT_EQ(split_fields("a.*b", ".*", '"'), (Fields{"a", "b"}));
}

TEST_F(SplitFieldsTest, CommaIsPlainTextWithTabDelimiter) {
  EXPECT_EQ(split_fields("a,b\tc", "\t", '"'), (Fields{"a,b", "c"}));
}

TEST_F(SplitFieldsTest, CustomQuoteChar) {
  EXPECT_EQ(split_fields("'a;b';'it''s'", ";", '\''), (Fields{"a;b", "it's"}));
}

TEST_F(SplitFieldsTest, TextAfterClosingQuoteIsKept) {
  EXPECT_EQ(split_fields("\"ab\"cd,e", ",", '"'), (Fields{"abcd", "e"}));
}
