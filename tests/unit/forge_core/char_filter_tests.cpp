#include <gtest/gtest.h>

#include "ef/forge/char_filter.hpp"

TEST(CharFilter, KeepsLayoutWhitespace)
{
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U' '));
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\t'));
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\n'));
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\r'));
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(U'\f'));
}

TEST(CharFilter, KeepsLettersNumbersPunctuationAndMath)
{
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'A'));
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'7'));
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'.'));
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\u00E9')); // e acute
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\u4E2D')); // CJK letter
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\u00BD')); // one half
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\u00A0')); // no-break space
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'+'));
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\u2211')); // n-ary sum
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\u20AC')); // euro
}

TEST(CharFilter, KeepsArrowsDashesAndMathySymbols)
{
    for (char32_t cp : {U'\u2192', U'\u21A9', U'\u21D4', U'\u2013', U'\u2014', U'\u2015', U'\u00B0', U'\u2030',
                        U'\u2031'})
        EXPECT_TRUE(ef::forge::isAllowedCodePoint(cp)) << static_cast<unsigned>(cp);
}

TEST(CharFilter, KeepsEmojiAndJoiners)
{
    EXPECT_TRUE(ef::forge::isEmojiCodePoint(U'\U0001F600'));
    EXPECT_TRUE(ef::forge::isEmojiCodePoint(U'\U0001F680'));
    EXPECT_TRUE(ef::forge::isEmojiCodePoint(U'\U0001F1FA'));
    EXPECT_TRUE(ef::forge::isEmojiCodePoint(U'\U0001F3FD'));
    EXPECT_TRUE(ef::forge::isEmojiCodePoint(U'\u2764'));
    EXPECT_FALSE(ef::forge::isEmojiCodePoint(U'A'));

    EXPECT_TRUE(ef::forge::isEmojiJoiner(U'\u200D'));
    EXPECT_TRUE(ef::forge::isEmojiJoiner(U'\uFE0F'));
    EXPECT_TRUE(ef::forge::isEmojiJoiner(U'\u20E3'));

    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\U0001F9E0'));
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(U'\u200D'));
}

TEST(CharFilter, RejectsControlsPrivateUseAndOtherSymbols)
{
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(U'\x01'));
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(U'\x7F'));
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(U'\u00AD')); // soft hyphen
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(U'\uE000')); // private use
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(U'\u00A9')); // copyright sign
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(U'^'));
}

TEST(CharFilter, IsTotalOverTheCodePointRange)
{
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(0xD800));
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(0xDFFF));
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(0x110000));
    EXPECT_FALSE(ef::forge::isAllowedCodePoint(0xFFFFFFFF));
    EXPECT_TRUE(ef::forge::isAllowedCodePoint(0x10400)); // Deseret letter
}
