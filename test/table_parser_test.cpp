/**
 * @file table_parser_test.cpp
 * @brief Tests for parsing delimited documents into columns, rows and errors.
 */

#include "tabedit/table_parser.h"

#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace tabedit;
using tabedit_test::TempTableFile;

class TableParserTest : public ::testing::Test {
protected:
  static ParseOptions csv() {
    ParseOptions opts;
    opts.dialect = Dialect::csv();
    return opts;
  }
};

// =============================================================================
// Quoting
// =============================================================================

TEST_F(TableParserTest, QuotedDelimiter) {
  auto result = parse_table("a,b\n1,\"Contains, comma\"\n", csv());
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.columns, (std::vector<std::string>{"a", "b"}));
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0], (Row{{"a", "1"}, {"b", "Contains, comma"}}));
}

TEST_F(TableParserTest, DoubledQuotes) {
  auto result = parse_table("a,b\n1,\"Say \"\"hello\"\"\"\n", csv());
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("b"), "Say \"hello\"");
}

TEST_F(TableParserTest, EmbeddedNewlineMakesOneRow) {
  auto result = parse_table("a,b\n1,\"line1\nline2\"\n", csv());
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("b"), "line1\nline2");
}

TEST_F(TableParserTest, TripleQuotedValue) {
  auto result = parse_table("a\tb\n\"\"\"\"\t\"\"\"x\"\"\"\n");
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("a"), "\"");
  EXPECT_EQ(result.rows[0].at("b"), "\"x\"");
}

// =============================================================================
// Document errors
// =============================================================================

TEST_F(TableParserTest, OnlyCommentsHasNoHeader) {
  auto result = parse_table("# only\n\n");
  EXPECT_TRUE(result.columns.empty());
  EXPECT_TRUE(result.rows.empty());
  ASSERT_EQ(result.errors.error_count(), 1u);

  const ParseError& err = result.errors.errors()[0];
  EXPECT_EQ(err.code, ErrorCode::NO_HEADER);
  EXPECT_EQ(err.severity, ErrorSeverity::FATAL);
  EXPECT_EQ(err.line, 1u);
  EXPECT_EQ(err.column, 1u);
  EXPECT_NE(err.message.find("No header line found"), std::string::npos);
}

TEST_F(TableParserTest, EmptyInputHasNoHeader) {
  auto result = parse_table("");
  ASSERT_EQ(result.errors.error_count(), 1u);
  EXPECT_EQ(result.errors.errors()[0].code, ErrorCode::NO_HEADER);
}

TEST_F(TableParserTest, HeaderOnly) {
  auto result = parse_table("a\tb\n");
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.columns, (std::vector<std::string>{"a", "b"}));
  EXPECT_TRUE(result.rows.empty());
}

// =============================================================================
// Row shape errors
// =============================================================================

TEST_F(TableParserTest, WrongFieldCountIsReportedAndSkipped) {
  auto result = parse_table("a,b\n1,2,3\n4,5\n", csv());
  ASSERT_EQ(result.errors.error_count(), 1u);

  const ParseError& err = result.errors.errors()[0];
  EXPECT_EQ(err.code, ErrorCode::INCONSISTENT_FIELD_COUNT);
  EXPECT_EQ(err.line, 2u);
  EXPECT_EQ(err.column, 1u);
  EXPECT_EQ(err.message, "Expected 2 columns, got 3");

  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0], (Row{{"a", "4"}, {"b", "5"}}));
}

TEST_F(TableParserTest, ErrorsAccumulateInDocumentOrder) {
  auto result = parse_table("a,b\n1\n2,3\n4,5,6\n7,8\n9,10,11,12\n", csv());
  ASSERT_EQ(result.errors.error_count(), 3u);
  EXPECT_EQ(result.errors.errors()[0].line, 2u);
  EXPECT_EQ(result.errors.errors()[0].message, "Expected 2 columns, got 1");
  EXPECT_EQ(result.errors.errors()[1].line, 4u);
  EXPECT_EQ(result.errors.errors()[2].line, 6u);
  EXPECT_EQ(result.errors.errors()[2].message, "Expected 2 columns, got 4");

  ASSERT_EQ(result.rows.size(), 2u);
  EXPECT_EQ(result.rows[0].at("a"), "2");
  EXPECT_EQ(result.rows[1].at("a"), "7");
}

TEST_F(TableParserTest, LineNumbersCountLogicalLines) {
  // The quoted newline does not advance the logical line number
  auto result = parse_table("a,b\n1,\"x\ny\"\n1,2,3\n", csv());
  ASSERT_EQ(result.errors.error_count(), 1u);
  EXPECT_EQ(result.errors.errors()[0].line, 3u);
}

// =============================================================================
// Line classification
// =============================================================================

TEST_F(TableParserTest, CommentsAndBlanksAreSkipped) {
  auto result = parse_table("# header comment\n\n   # indented\na\tb\n\n1\t2\n  \n# footer\n");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.columns, (std::vector<std::string>{"a", "b"}));
  ASSERT_EQ(result.rows.size(), 1u);
}

TEST_F(TableParserTest, SeparatorRowIsSkipped) {
  auto result = parse_table("a  \tb\n---\t- \n1\t2\n");
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0], (Row{{"a", "1"}, {"b", "2"}}));
}

TEST_F(TableParserTest, PartialDashesAreData) {
  auto result = parse_table("a\tb\n--\tx\n");
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("a"), "--");
}

TEST_F(TableParserTest, AllEmptyRowIsTreatedAsSeparator) {
  auto result = parse_table("a,b\n , \n1,2\n", csv());
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("a"), "1");
}

TEST_F(TableParserTest, SeparatorWithWrongFieldCountIsAnError) {
  auto result = parse_table("a\tb\n---\n");
  ASSERT_EQ(result.errors.error_count(), 1u);
  EXPECT_EQ(result.errors.errors()[0].line, 2u);
}

TEST_F(TableParserTest, QuotedCommentPrefixIsData) {
  auto result = parse_table("a,b\n\"# not a comment\",1\n", csv());
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("a"), "# not a comment");
}

TEST_F(TableParserTest, CommentPrefixInsideMultilineQuoteIsData) {
  auto result = parse_table("a,b\n1,\"x\n# y\"\n", csv());
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("b"), "x\n# y");
}

TEST_F(TableParserTest, CustomCommentPrefix) {
  ParseOptions opts = csv();
  opts.dialect.comment_prefix = "//";
  auto result = parse_table("// comment\na,b\n# data,1\n", opts);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("a"), "# data");
}

TEST_F(TableParserTest, EmptyCommentPrefixDisablesComments) {
  ParseOptions opts = csv();
  opts.dialect.comment_prefix = "";
  auto result = parse_table("a,b\n#x,1\n", opts);
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("a"), "#x");
}

// =============================================================================
// Normalization
// =============================================================================

TEST_F(TableParserTest, CrlfLineEndings) {
  auto result = parse_table("a,b\r\n1,2\r\n", csv());
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0], (Row{{"a", "1"}, {"b", "2"}}));
}

TEST_F(TableParserTest, HeaderAndValuesAreTrimmed) {
  auto result = parse_table(" a \t b \n  1 \t two  \n");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.columns, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(result.rows[0], (Row{{"a", "1"}, {"b", "two"}}));
}

TEST_F(TableParserTest, DuplicateColumnNamesLastWins) {
  auto result = parse_table("a,a\n1,2\n", csv());
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.columns, (std::vector<std::string>{"a", "a"}));
  EXPECT_EQ(result.rows[0], (Row{{"a", "2"}}));
}

TEST_F(TableParserTest, MultiCharacterDelimiter) {
  ParseOptions opts;
  opts.dialect.delimiter = "::";
  auto result = parse_table("a::b\n1::x:y\n", opts);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.rows[0].at("b"), "x:y");
}

TEST_F(TableParserTest, TableAccessor) {
  auto result = parse_table("a,b\n1,2\n", csv());
  Table table = result.table();
  EXPECT_EQ(table.columns, result.columns);
  EXPECT_EQ(table.rows, result.rows);
}

// =============================================================================
// Warnings
// =============================================================================

TEST_F(TableParserTest, UnterminatedQuoteFoldsAndWarns) {
  std::vector<std::string> warnings;
  ParseOptions opts = csv();
  opts.warning_callback = [&warnings](const std::string& msg) { warnings.push_back(msg); };

  auto result = parse_table("a,b\n1,\"open\n2,3\n", opts);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.rows.size(), 1u);
  EXPECT_EQ(result.rows[0].at("b"), "open\n2,3");

  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("folded into line 2"), std::string::npos);
}

TEST_F(TableParserTest, NoWarningForWellFormedInput) {
  int calls = 0;
  ParseOptions opts = csv();
  opts.warning_callback = [&calls](const std::string&) { ++calls; };
  parse_table("a,b\n1,\"x\"\n", opts);
  EXPECT_EQ(calls, 0);
}

TEST_F(TableParserTest, UnterminatedQuoteWithoutCallback) {
  auto result = parse_table("a,b\n1,\"open\n", csv());
  EXPECT_EQ(result.rows.size(), 1u);
}

// =============================================================================
// Files
// =============================================================================

TEST_F(TableParserTest, ParseFileStripsBom) {
  TempTableFile file("\xEF\xBB\xBFid\tname\n1\tAlice\n");
  auto result = parse_table_file(file.path());
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.columns, (std::vector<std::string>{"id", "name"}));
  ASSERT_EQ(result.rows.size(), 1u);
}

TEST_F(TableParserTest, ParseMissingFileThrows) {
  EXPECT_THROW(parse_table_file("/nonexistent/dir/table.tsv"), std::runtime_error);
}
