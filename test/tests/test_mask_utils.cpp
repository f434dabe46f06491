#include <gtest/gtest.h>
#include "veil/core/mask_utils.hpp"
#include "veil/core/common.hpp"

TEST(PartialMaskTest, KeepsStartAndEnd) {
    EXPECT_EQ(veil::partialMask("12345678909", 3, 2, '*', 3), "123******09");
}

TEST(PartialMaskTest, MaskNeverShorterThanMinimum) {
    EXPECT_EQ(veil::partialMask("12345", 2, 2, '*', 3), "12***45");
    EXPECT_EQ(veil::partialMask("abcdef", 0, 2, '*', 3), "****ef");
}

TEST(PartialMaskTest, ShortValuesAreFullyMasked) {
    EXPECT_EQ(veil::partialMask("abc", 2, 2, '*', 3), "***");
    EXPECT_EQ(veil::partialMask("ab", 1, 1, '*', 3), "***");
    EXPECT_EQ(veil::partialMask("abcdefg", 4, 3, '#', 3), "#######");
}

TEST(PartialMaskTest, CountsCodePointsNotBytes) {
    EXPECT_EQ(veil::partialMask("Jo\xC3\xA3o Silva", 1, 1, '*', 3), "J********a");
    EXPECT_EQ(veil::partialMask("\xC3\xA3\xC3\xA9\xC3\xAD\xC3\xB3\xC3\xBA", 1, 1, '*', 3),
              "\xC3\xA3***\xC3\xBA");
}

TEST(PartialMaskTest, DefaultMinimumIsThree) {
    EXPECT_EQ(veil::partialMask("1234", 1, 1, '*'), "1***4");
}

TEST(AlreadyMaskedTest, EmptyCountsAsMasked) {
    EXPECT_TRUE(veil::isAlreadyMasked("", '*'));
}

TEST(AlreadyMaskedTest, RatioThreshold) {
    EXPECT_TRUE(veil::isAlreadyMasked("***", '*'));
    EXPECT_TRUE(veil::isAlreadyMasked("1****", '*'));
    EXPECT_FALSE(veil::isAlreadyMasked("12345", '*'));
    EXPECT_FALSE(veil::isAlreadyMasked("12**", '*'));
    EXPECT_TRUE(veil::isAlreadyMasked("12**", '*', 0.4));
}

TEST(AlreadyMaskedTest, UsesConfiguredMaskChar) {
    EXPECT_FALSE(veil::isAlreadyMasked("xxxxx@xxxxxx.com", '*'));
    EXPECT_TRUE(veil::isAlreadyMasked("xxxxx@xxxxxx.com", 'x'));
}

TEST(AlreadyMaskedTest, LengthInCodePoints) {
    EXPECT_TRUE(veil::isAlreadyMasked("\xC3\xA3**", '*'));
}

TEST(CommonTest, EscapeRegexEscapesMetacharacters) {
    EXPECT_EQ(veil::detail::escapeRegex("a.b"), "a\\.b");
    EXPECT_EQ(veil::detail::escapeRegex("x(1)"), "x\\(1\\)");
    EXPECT_EQ(veil::detail::escapeRegex("plain"), "plain");
}

TEST(CommonTest, DigitsOnlyAndSplit) {
    EXPECT_EQ(veil::detail::digitsOnly("123.456-78/9"), "123456789");
    auto parts = veil::detail::split("a,,b", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(veil::detail::utf8CharCount("Jo\xC3\xA3o"), 4u);
}
