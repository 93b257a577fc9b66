#include "delimited_reader.hpp"
#include "parse_error.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace transtree;

namespace {

std::vector<std::string> fields(const std::string& content, char separator = ',', bool quoted = true) {
    return read_delimited_line(content, 0, 1, separator, quoted).fields;
}

}  // namespace

// ============================================================================
// Field splitting
// ============================================================================

TEST(DelimitedReader, SplitsOnSeparator) {
    EXPECT_EQ(fields("a,b,,d"), (std::vector<std::string>{"a", "b", "", "d"}));
}

TEST(DelimitedReader, TrailingSeparatorYieldsEmptyField) {
    EXPECT_EQ(fields("a,b,"), (std::vector<std::string>{"a", "b", ""}));
}

TEST(DelimitedReader, TabSeparator) {
    EXPECT_EQ(fields("key\tvalue\tnote", '\t', false), (std::vector<std::string>{"key", "value", "note"}));
}

TEST(DelimitedReader, QuotedFieldKeepsSeparator) {
    EXPECT_EQ(fields("\"a,b\",c"), (std::vector<std::string>{"a,b", "c"}));
}

TEST(DelimitedReader, DoubledQuoteDecodesToOneQuote) {
    EXPECT_EQ(fields("\"a\"\"b\",c"), (std::vector<std::string>{"a\"b", "c"}));
}

TEST(DelimitedReader, QuotesAreLiteralWhenQuotingDisabled) {
    EXPECT_EQ(fields("\"a\"\tb", '\t', false), (std::vector<std::string>{"\"a\"", "b"}));
}

// ============================================================================
// Row boundaries and line counting
// ============================================================================

TEST(DelimitedReader, ConsumesLineFeed) {
    const std::string content = "a,b\nc,d";
    const auto row = read_delimited_line(content, 0, 1, ',', true);
    EXPECT_EQ(row.pos_after_end, 4u);
    EXPECT_EQ(row.next_line_number, 2u);

    const auto second = read_delimited_line(content, row.pos_after_end, row.next_line_number, ',', true);
    EXPECT_EQ(second.fields, (std::vector<std::string>{"c", "d"}));
    EXPECT_EQ(second.pos_after_end, content.size());
    EXPECT_EQ(second.next_line_number, 2u);
}

TEST(DelimitedReader, ConsumesCarriageReturnLineFeed) {
    const std::string content = "a,b\r\nc";
    const auto row = read_delimited_line(content, 0, 1, ',', true);
    EXPECT_EQ(row.fields, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(row.pos_after_end, 5u);
    EXPECT_EQ(row.next_line_number, 2u);
}

TEST(DelimitedReader, EmbeddedNewlineInsideQuotes) {
    const std::string content = "key,\"line one\r\nline two\"\nnext,row";
    const auto row = read_delimited_line(content, 0, 1, ',', true);
    ASSERT_EQ(row.fields.size(), 2u);
    EXPECT_EQ(row.fields[1], "line one\nline two");
    EXPECT_EQ(row.next_line_number, 3u);
    EXPECT_EQ(content.substr(row.pos_after_end), "next,row");
}

TEST(DelimitedReader, OffsetAtEndReturnsNoFields) {
    const std::string content = "a,b";
    const auto row = read_delimited_line(content, content.size(), 4, ',', true);
    EXPECT_TRUE(row.fields.empty());
    EXPECT_EQ(row.pos_after_end, content.size());
    EXPECT_EQ(row.next_line_number, 4u);
}

// ============================================================================
// Malformed input
// ============================================================================

TEST(DelimitedReader, UnclosedQuoteThrows) {
    EXPECT_THROW(fields("a,\"bc"), TextParseError);
}

TEST(DelimitedReader, UnclosedQuoteReportsPosition) {
    const std::string content = "x,y\nab,\"unterminated";
    const auto first = read_delimited_line(content, 0, 1, ',', true);
    try {
        read_delimited_line(content, first.pos_after_end, first.next_line_number, ',', true);
        FAIL() << "expected TextParseError";
    } catch (const TextParseError& ex) {
        EXPECT_EQ(ex.line_number(), 2u);
        EXPECT_EQ(ex.column_number(), 4u);
        EXPECT_EQ(ex.start_position(), 7u);
        EXPECT_EQ(std::string(ex.what()), "Unclosed quote at 2:4");
    }
}
