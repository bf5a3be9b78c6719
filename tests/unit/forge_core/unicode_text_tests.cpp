#include <gtest/gtest.h>

#include "ef/forge/html_entities.hpp"
#include "ef/forge/unicode_text.hpp"

#include <string>

TEST(HtmlEntities, DecodesNamedReferences)
{
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&lt;b&gt; &quot;x&quot; &amp;amp;"), "<b> \"x\" &amp;");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&nbsp;"), "\xC2\xA0");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&mdash;&hellip;"), "\xE2\x80\x94\xE2\x80\xA6");
}

TEST(HtmlEntities, DecodesNumericReferences)
{
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#65;&#x42;&#X43;"), "ABC");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#68 and &#x45"), "D and E");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#x1F600;"), "\xF0\x9F\x98\x80");
}

TEST(HtmlEntities, InvalidNumericReferencesBecomeReplacementCharacter)
{
    const std::string replacement = "\xEF\xBF\xBD";
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#0;"), replacement);
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#xD800;"), replacement);
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#x110000;"), replacement);
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#99999999999;"), replacement);
}

TEST(HtmlEntities, C1ReferencesUseWindows1252)
{
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#150;"), "\xE2\x80\x93");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#x80;"), "\xE2\x82\xAC");
}

TEST(HtmlEntities, DecodesTheFullNamedReferenceSet)
{
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&lbrace;x&rbrace; &hyphen; &NewLine;"), "{x} \xE2\x80\x90 \n");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&NotEqualTilde;"), "\xE2\x89\x82\xCC\xB8");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&notin; &AMP;"), "\xE2\x88\x89 &");
    EXPECT_EQ(ef::forge::lookupNamedEntity("lbrace").value_or(""), "{");
}

TEST(HtmlEntities, LegacyNamesDecodeWithoutSemicolon)
{
    EXPECT_EQ(ef::forge::decodeHtmlEntities("fish &amp chips"), "fish & chips");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&copy 2024"), "\xC2\xA9 2024");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&eacutex &notit;"), "\xC3\xA9x \xC2\xACit;");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&lbrace x"), "&lbrace x");
}

TEST(HtmlEntities, NoncharacterReferencesAreDropped)
{
    EXPECT_EQ(ef::forge::decodeHtmlEntities("a&#xFFFE;b&#xFDD0;c&#x1FFFF;d"), "abcd");
}

TEST(HtmlEntities, LeavesUnknownAndUnterminatedNamesAlone)
{
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&bogus; & &;"), "&bogus; & &;");
    EXPECT_EQ(ef::forge::decodeHtmlEntities("&#;"), "&#;");
    EXPECT_FALSE(ef::forge::lookupNamedEntity("nope").has_value());
    EXPECT_EQ(ef::forge::lookupNamedEntity("copy").value_or(""), "\xC2\xA9");
}

TEST(UnicodeText, NormalizesToComposedForm)
{
    EXPECT_EQ(ef::forge::normalizeNfc("e\xCC\x81"), "\xC3\xA9");
    EXPECT_EQ(ef::forge::normalizeNfc("plain"), "plain");
    EXPECT_EQ(ef::forge::normalizeNfc(""), "");
}

TEST(UnicodeText, FilterReplacesRejectedCodePointsWithSpace)
{
    EXPECT_EQ(ef::forge::filterCodePoints("a\x01z"), "a z");
    EXPECT_EQ(ef::forge::filterCodePoints("\xC2\xA9 2024"), "  2024");
    EXPECT_EQ(ef::forge::filterCodePoints("ok\xFF"), "ok ");
    EXPECT_EQ(ef::forge::filterCodePoints("caf\xC3\xA9 \xF0\x9F\x98\x80"), "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(UnicodeText, TrimsUnicodeWhitespace)
{
    EXPECT_EQ(ef::forge::trimUnicode(" \xC2\xA0text\n\t"), "text");
    EXPECT_EQ(ef::forge::trimUnicode("\xE2\x80\x83"), "");
    EXPECT_EQ(ef::forge::trimUnicode("a b"), "a b");
}

TEST(UnicodeText, WordBoundariesFollowLettersAndDigits)
{
    const std::string text = "x caf\xC3\xA9_1!";
    EXPECT_TRUE(ef::forge::isWordBoundary(text, 0));
    EXPECT_TRUE(ef::forge::isWordBoundary(text, 1));
    EXPECT_TRUE(ef::forge::isWordBoundary(text, 2));
    EXPECT_FALSE(ef::forge::isWordBoundary(text, 5));
    EXPECT_TRUE(ef::forge::isWordBoundary(text, text.size() - 1));
    EXPECT_FALSE(ef::forge::isWordBoundary(text, text.size()));
}

TEST(UnicodeText, AppendUtf8EncodesAllLengths)
{
    std::string out;
    ef::forge::appendUtf8(out, U'A');
    ef::forge::appendUtf8(out, U'\u00E9');
    ef::forge::appendUtf8(out, U'\u20AC');
    ef::forge::appendUtf8(out, U'\U0001F600');
    EXPECT_EQ(out, "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
}
