/**
 * @file test_line_parser.cpp
 * @brief Unit tests for the text helpers behind telemetry and config parsing
 */

#include <gtest/gtest.h>

#include "telemetry/line_parser.hpp"

#include <map>
#include <string>
#include <vector>

// =============================================================================
// Splitting and trimming
// =============================================================================

TEST(LineParser, TrimStripsBothEnds) {
    EXPECT_EQ(trim("  abc \t\r\n"), "abc");
    EXPECT_EQ(trim("\t \n"), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(LineParser, StartsWithIsCaseSensitive) {
    EXPECT_TRUE(startsWith("SUMMARY total=1", "SUMMARY"));
    EXPECT_FALSE(startsWith("summary total=1", "SUMMARY"));
    EXPECT_FALSE(startsWith("SUM", "SUMMARY"));
}

TEST(LineParser, SplitKeepsEmptyFields) {
    auto parts = split("Lane 1::5", ':');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");

    auto trailing = split("Total time passed:", ':');
    ASSERT_EQ(trailing.size(), 2u);
    EXPECT_EQ(trailing[1], "");
}

TEST(LineParser, SplitWhitespaceCollapsesRuns) {
    std::vector<std::string> expected{"LANE_STATS", "lane=1", "total=3"};
    EXPECT_EQ(splitWhitespace("  LANE_STATS   lane=1\ttotal=3 "), expected);
}

// =============================================================================
// Numbers
// =============================================================================

TEST(LineParser, ParseIntStrictRejectsJunk) {
    int v = 7;
    EXPECT_TRUE(parseIntStrict(" 42 ", v));
    EXPECT_EQ(v, 42);
    EXPECT_TRUE(parseIntStrict("-3", v));
    EXPECT_EQ(v, -3);

    v = 7;
    EXPECT_FALSE(parseIntStrict("4x", v));
    EXPECT_FALSE(parseIntStrict("", v));
    EXPECT_FALSE(parseIntStrict("1.5", v));
    EXPECT_FALSE(parseIntStrict("99999999999999999999", v));
    EXPECT_EQ(v, 7);
}

TEST(LineParser, ParseRealStrictRejectsNonFinite) {
    double d = 0.0;
    EXPECT_TRUE(parseRealStrict("0.25", d));
    EXPECT_DOUBLE_EQ(d, 0.25);
    EXPECT_FALSE(parseRealStrict("nan", d));
    EXPECT_FALSE(parseRealStrict("inf", d));
    EXPECT_FALSE(parseRealStrict("1.0abc", d));
}

TEST(LineParser, ParseIntTruncatedDropsFraction) {
    int v = 0;
    EXPECT_TRUE(parseIntTruncated("12.9", v));
    EXPECT_EQ(v, 12);
    EXPECT_TRUE(parseIntTruncated("5", v));
    EXPECT_EQ(v, 5);
    EXPECT_FALSE(parseIntTruncated("five", v));
}

// =============================================================================
// Key/value tokens
// =============================================================================

TEST(LineParser, KeyValueTokensParsed) {
    std::map<std::string, std::string> out;
    ASSERT_TRUE(parseKeyValueTokens({"lane=2", "total=9"}, out));
    EXPECT_EQ(out.at("lane"), "2");
    EXPECT_EQ(out.at("total"), "9");
}

TEST(LineParser, KeyValueTokenWithoutSeparatorFailsAndLeavesOutput) {
    std::map<std::string, std::string> out{{"keep", "1"}};
    EXPECT_FALSE(parseKeyValueTokens({"lane=2", "garbage"}, out));
    EXPECT_FALSE(parseKeyValueTokens({"a=b=c"}, out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out.at("keep"), "1");
}

TEST(LineParser, ValueAfterColonTakesSecondField) {
    std::string value;
    ASSERT_TRUE(valueAfterColon("Total vehicles passed:  17 ", value));
    EXPECT_EQ(value, "17");
    EXPECT_FALSE(valueAfterColon("no colon here", value));
}
