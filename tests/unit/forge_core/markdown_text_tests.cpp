#include <gtest/gtest.h>

#include "ef/forge/markdown_text.hpp"

#include <string>
#include <vector>

namespace
{

std::string fencedBlock(const std::string &language, int lines)
{
    std::string block = "```" + language + "\n";
    for (int i = 1; i <= lines; ++i)
        block += "line " + std::to_string(i) + "\n";
    block += "```";
    return block;
}

bool isAnchorCharacter(char ch)
{
    return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-';
}

} // namespace

TEST(MarkdownAnchor, LowercasesAndHyphenates)
{
    EXPECT_EQ(ef::forge::markdownAnchor("Turn 001 \xE2\x80\x94 James"), "turn-001-james");
    EXPECT_EQ(ef::forge::markdownAnchor("[Hello] World!"), "hello-world");
    EXPECT_EQ(ef::forge::markdownAnchor("  --Mixed  Case--  "), "mixed-case");
    EXPECT_EQ(ef::forge::markdownAnchor("Chat Transcript"), "chat-transcript");
    EXPECT_EQ(ef::forge::markdownAnchor("!!!"), "");
}

TEST(MarkdownAnchor, IsPureAndUsesOnlyAnchorCharacters)
{
    const std::vector<std::string> labels{"Turn 001 \xE2\x80\x94 James", "Caf\xC3\xA9 [draft] #2", "a\tb\xC2\xA0" "c",
                                          "Turns"};
    for (const auto &label : labels)
    {
        const std::string anchor = ef::forge::markdownAnchor(label);
        EXPECT_EQ(anchor, ef::forge::markdownAnchor(label));
        for (char ch : anchor)
            EXPECT_TRUE(isAnchorCharacter(ch)) << label << " -> " << anchor;
    }
    EXPECT_EQ(ef::forge::markdownAnchor("a\tb\xC2\xA0" "c"), "a-b-c");
}

TEST(ObsidianLinks, RewritesSameDocumentHeadingLinks)
{
    EXPECT_EQ(ef::forge::rewriteHeadingLinksToObsidian("See [Intro](#intro) and [x](http://a) [](#b)"),
              "See [[#intro|Intro]] and [x](http://a) [](#b)");
    EXPECT_EQ(ef::forge::obsidianHeadingLink("Turns", "Turns"), "[[#Turns|Turns]]");
    EXPECT_EQ(ef::forge::rewriteHeadingLinksToObsidian("[open (#no"), "[open (#no");
}

TEST(LabelArtifacts, RemovesSpeakerLabelsAndStrayBrackets)
{
    EXPECT_EQ(ef::forge::stripLabelArtifacts("You said:\nHello\nchatgpt said: <\n  <  \n\n\nWorld\n"),
              "Hello\n\nWorld");
    EXPECT_EQ(ef::forge::stripLabelArtifacts("You said: hi"), "You said: hi");
    EXPECT_EQ(ef::forge::stripLabelArtifacts("a < b"), "a < b");
}

TEST(FencedRegions, SplitsProseAndFences)
{
    auto regions = ef::forge::splitFencedRegions("a\n```x\ny\n```\nb");
    ASSERT_EQ(regions.size(), 3u);
    EXPECT_EQ(regions[0].text, "a\n");
    EXPECT_FALSE(regions[0].fenced);
    EXPECT_EQ(regions[1].text, "```x\ny\n```");
    EXPECT_TRUE(regions[1].fenced);
    EXPECT_EQ(regions[2].text, "\nb");

    auto open = ef::forge::splitFencedRegions("text ``` unterminated");
    ASSERT_EQ(open.size(), 1u);
    EXPECT_FALSE(open[0].fenced);
}

TEST(WrapText, WrapsWordsGreedily)
{
    EXPECT_EQ(ef::forge::wrapWords("the quick brown fox", 10), (std::vector<std::string>{"the quick", "brown fox"}));
    EXPECT_EQ(ef::forge::wrapWords("abcdefghijkl", 5), (std::vector<std::string>{"abcde", "fghij", "kl"}));
    EXPECT_EQ(ef::forge::wrapWords("caf\xC3\xA9 ol\xC3\xA9", 8), (std::vector<std::string>{"caf\xC3\xA9 ol\xC3\xA9"}));
    EXPECT_TRUE(ef::forge::wrapWords("   ", 4).empty());
}

TEST(WrapText, ListItemsGetAHangingIndent)
{
    EXPECT_EQ(ef::forge::wrapParagraph("- one two three four", 10), "- one two\n  three\n  four");
    EXPECT_EQ(ef::forge::wrapParagraph("1. alpha beta\ncontinued here\n2. gamma", 40),
              "1. alpha beta continued here\n2. gamma");
    EXPECT_EQ(ef::forge::wrapParagraph("plain\nlines join", 40), "plain lines join");
}

TEST(WrapText, NeverTouchesFencedCode)
{
    const std::string fence = "```py\nx = 'a very long line that must not be wrapped at all'\n```";
    const std::string text = "intro words here\n" + fence + "\noutro words";
    EXPECT_EQ(ef::forge::wrapNonCode(text, 10), "intro\nwords here\n" + fence + "\noutro\nwords");
    for (int width : {1, 5, 20, 200})
        EXPECT_NE(ef::forge::wrapNonCode(text, width).find(fence), std::string::npos) << width;
}

TEST(WrapText, KeepsParagraphBreaksAndSkipsWhenDisabled)
{
    EXPECT_EQ(ef::forge::wrapNonCode("one two\n\nthree four", 5), "one\ntwo\n\nthree\nfour");
    EXPECT_EQ(ef::forge::wrapNonCode("left   as   is", 0), "left   as   is");
}

TEST(LongCode, FourteenLinesStayOpen)
{
    const std::string text = "before\n" + fencedBlock("python", 14) + "\nafter";
    EXPECT_EQ(ef::forge::collapseLongCode(text), text);
}

TEST(LongCode, FifteenLinesCollapse)
{
    const std::string fence = fencedBlock("python", 15);
    EXPECT_EQ(ef::forge::collapseLongCode("before\n" + fence + "\nafter"),
              "before\n<details>\n<summary>View 15 lines of python</summary>\n\n" + fence + "\n</details>\n\nafter");
}

TEST(LongCode, UntaggedSummaryOmitsTheLanguage)
{
    const std::string fence = fencedBlock("", 20);
    EXPECT_EQ(ef::forge::collapseLongCode(fence, 15),
              "<details>\n<summary>View 20 lines</summary>\n\n" + fence + "\n</details>\n");
    EXPECT_EQ(ef::forge::collapseLongCode(fence, 21), fence);
}
