#include <gtest/gtest.h>
#include "utils/string_utils.h"

TEST(StringUtilsTest, ReplaceAll) {
    std::string s = "a\r\nb\r\nc";
    ASSERT_EQ(replaceAllInPlace(s, "\r\n", "\n"), 2u);
    ASSERT_EQ(s, "a\nb\nc");
    ASSERT_EQ(replaceAllInPlace(s, "", "x"), 0u);
}

TEST(StringUtilsTest, ReplaceChar) {
    std::string s = "one\vtwo\vthree";
    ASSERT_EQ(replaceCharInPlace(s, '\v', '\n'), 2u);
    ASSERT_EQ(s, "one\ntwo\nthree");
}

TEST(StringUtilsTest, TrimAndLower) {
    ASSERT_EQ(trimCopy("  Deck 1 \t\n"), "Deck 1");
    ASSERT_EQ(trimCopy("   "), "");
    ASSERT_EQ(toLowerCopy("JPEG"), "jpeg");
}

TEST(StringUtilsTest, SplitKeepsEmptyParts) {
    auto parts = splitString("p1:s1,,p2:s2", ',');
    ASSERT_EQ(parts.size(), 3u);
    ASSERT_EQ(parts[0], "p1:s1");
    ASSERT_EQ(parts[1], "");
    ASSERT_EQ(parts[2], "p2:s2");
}

TEST(StringUtilsTest, SanitizePathComponent) {
    ASSERT_EQ(sanitizePathComponent("Q3/Q4 Review"), "Q3_Q4 Review");
    ASSERT_EQ(sanitizePathComponent("a\\b:c"), "a_b_c");
    ASSERT_EQ(sanitizePathComponent("..hidden"), "hidden");
    ASSERT_EQ(sanitizePathComponent(".."), "_");
    ASSERT_EQ(sanitizePathComponent(""), "_");
    ASSERT_EQ(sanitizePathComponent("tab\there"), "tab_here");
}
