/**
 * @file test_text_match.cpp
 * @brief Tests for the shared string helpers
 */

#include <gtest/gtest.h>

#include "voxgate/util/text_match.h"

using namespace voxgate::util;

TEST(TextMatch, NormalizeLowersAndTrims) {
    EXPECT_EQ(normalize("  Hello World\n"), "hello world");
    EXPECT_EQ(normalize(""), "");
    EXPECT_EQ(normalize(" \t "), "");
}

TEST(TextMatch, ContainsAnyReportsFirstKeywordInListOrder) {
    std::string matched;
    EXPECT_TRUE(contains_any("check the weather and email", {"email", "weather"}, &matched));
    EXPECT_EQ(matched, "email");
    EXPECT_FALSE(contains_any("nothing here", {"email", "weather"}, &matched));
}

TEST(TextMatch, ContainsAnyIgnoresEmptyKeywords) {
    EXPECT_FALSE(contains_any("abc", {""}));
}

TEST(TextMatch, StartsWithAny) {
    EXPECT_TRUE(starts_with_any("what time is it", {"how", "what"}));
    EXPECT_FALSE(starts_with_any("so what", {"how", "what"}));
}

TEST(TextMatch, WordCount) {
    EXPECT_EQ(word_count(""), 0u);
    EXPECT_EQ(word_count("one"), 1u);
    EXPECT_EQ(word_count("  two   words "), 2u);
}

TEST(TextMatch, Truncate) {
    EXPECT_EQ(voxgate::util::truncate("abcdef", 3), "abc");
    EXPECT_EQ(voxgate::util::truncate("ab", 3), "ab");
}
