/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string helpers used on diagnostics and wire output.
 */

#include "algoscope/utils/string_utils.hpp"

#include <gtest/gtest.h>

using algoscope::utils::StringUtils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(StringUtils::Trim("  print(1)\n\t"), "print(1)");
    EXPECT_EQ(StringUtils::Trim(" \n\t "), "");
    EXPECT_EQ(StringUtils::Trim(""), "");
}

TEST_F(StringUtilsTest, JoinAndReplaceAll) {
    EXPECT_EQ(StringUtils::Join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(StringUtils::Join({}, ", "), "");
    EXPECT_EQ(StringUtils::ReplaceAll("aXbXc", "X", "--"), "a--b--c");
    EXPECT_EQ(StringUtils::ReplaceAll("abc", "", "z"), "abc");
}

TEST_F(StringUtilsTest, FirstLineStopsAtAnyLineBreak) {
    EXPECT_EQ(StringUtils::FirstLine("Error: boom\n    at foo"), "Error: boom");
    EXPECT_EQ(StringUtils::FirstLine("one\r\ntwo"), "one");
    EXPECT_EQ(StringUtils::FirstLine("single"), "single");
}

TEST_F(StringUtilsTest, SanitizeReplacesControlCharacters) {
    EXPECT_EQ(StringUtils::Sanitize("a\tb\x1b[31m"), "a.b.[31m");
}

TEST_F(StringUtilsTest, TruncateAppendsSuffixWithinLimit) {
    EXPECT_EQ(StringUtils::Truncate("abcdefghij", 6), "abc...");
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("abcdef", 2), "ab");
    EXPECT_EQ(StringUtils::Truncate("abcdef", 3, ""), "abc");
}

TEST_F(StringUtilsTest, RedactSourceHidesWholeSourceLines) {
    std::string source = "const apiKey = 'abcdef123';\nfoo();\n";
    std::string message = "ReferenceError: const apiKey = 'abcdef123'; is broken";

    auto redacted = StringUtils::RedactSource(message, source);
    EXPECT_EQ(redacted, "ReferenceError: <source> is broken");
}

TEST_F(StringUtilsTest, RedactSourceIgnoresShortLines) {
    // "foo();" is shorter than the default minimum and stays visible
    EXPECT_EQ(StringUtils::RedactSource("TypeError: foo(); failed", "foo();"),
              "TypeError: foo(); failed");
}

TEST_F(StringUtilsTest, FormatNumberPrintsIntegralValuesWithoutFraction) {
    EXPECT_EQ(StringUtils::FormatNumber(5.0), "5");
    EXPECT_EQ(StringUtils::FormatNumber(-3.0), "-3");
    EXPECT_EQ(StringUtils::FormatNumber(2.5), "2.5");
}

TEST_F(StringUtilsTest, FormatIso8601UsesUtcWithMilliseconds) {
    std::chrono::system_clock::time_point epoch{};
    EXPECT_EQ(StringUtils::FormatIso8601(epoch + std::chrono::milliseconds(1500)),
              "1970-01-01T00:00:01.500Z");
}
