#include <gtest/gtest.h>

#include "ef/forge/code_fence.hpp"

#include <string>

TEST(CodeFence, RebuildsBlockUpToAHeading)
{
    EXPECT_EQ(ef::forge::applyCodeMarkdown("python\nCopy code\nprint(1)\n\n## Next\ntext"),
              "```python\nprint(1)\n```\n\n## Next\ntext");
}

TEST(CodeFence, OpeningIsCaseInsensitiveAndKeepsTheLanguageAsWritten)
{
    EXPECT_EQ(ef::forge::applyCodeMarkdown("Intro\nPython\n\n\nCopy code\nx = 1"),
              "Intro\n```Python\nx = 1\n```\n");
}

TEST(CodeFence, PayloadKeepsIndentationAndInnerBlankLines)
{
    EXPECT_EQ(ef::forge::applyCodeMarkdown("py\nCopy code\ndef f():\n\n    return 1\n"),
              "```py\ndef f():\n\n    return 1\n```\n");
}

TEST(CodeFence, NextLanguageHeaderEndsThePayload)
{
    EXPECT_EQ(ef::forge::applyCodeMarkdown("bash\nCopy code\nls -la\njson\nCopy code\n{}\n"),
              "```bash\nls -la\n```\n```json\n{}\n```\n");
}

TEST(CodeFence, BoundaryLanguageLinesAreCaseSensitive)
{
    EXPECT_EQ(ef::forge::applyCodeMarkdown("py\nCopy code\na\nPython\nb"), "```py\na\nPython\nb\n```\n");
}

TEST(CodeFence, TurnMarkersSpeakerLabelsAndProseMarkersEndThePayload)
{
    EXPECT_EQ(ef::forge::applyCodeMarkdown("js\nCopy code\nalert(1)\n--- 002 [ChatGPT] ---\nok"),
              "```js\nalert(1)\n```\n--- 002 [ChatGPT] ---\nok");
    EXPECT_EQ(ef::forge::applyCodeMarkdown("go\nCopy code\nfmt.Println()\nYou said:\nthanks"),
              "```go\nfmt.Println()\n```\nYou said:\nthanks");
    EXPECT_EQ(ef::forge::applyCodeMarkdown("go\nCopy code\nrun()\n  Quick extras: more"),
              "```go\nrun()\n```\n  Quick extras: more");
    EXPECT_EQ(ef::forge::applyCodeMarkdown("c\nCopy code\nint x;\n<details>\nmore"),
              "```c\nint x;\n```\n<details>\nmore");
}

TEST(CodeFence, ListItemRightAfterTheMarkerGivesAnEmptyPayload)
{
    EXPECT_EQ(ef::forge::applyCodeMarkdown("sql\nCopy code\n- item"), "```sql\n\n```\n- item");
}

TEST(CodeFence, TextWithoutAnOpeningIsUnchanged)
{
    const std::string text = "python is fun\nCopy code\nprint(1)";
    EXPECT_EQ(ef::forge::applyCodeMarkdown(text), text);
    EXPECT_EQ(ef::forge::applyCodeMarkdown("rust\nno marker here"), "rust\nno marker here");
    EXPECT_EQ(ef::forge::applyCodeMarkdown(""), "");
}

TEST(CodeFence, OpeningNeedsANewlineAfterTheMarker)
{
    EXPECT_FALSE(ef::forge::matchCodeOpening("bash\nCopy code", 0, ef::forge::CodeFencePatterns::defaults()));
    EXPECT_FALSE(ef::forge::matchCodeOpening("bash Copy code\nx", 0, ef::forge::CodeFencePatterns::defaults()));

    auto opening = ef::forge::matchCodeOpening("bash\nCopy code  \n\nx", 0, ef::forge::CodeFencePatterns::defaults());
    ASSERT_TRUE(opening);
    EXPECT_EQ(opening->language, "bash");
    EXPECT_EQ(opening->payload, 18u);
}

TEST(CodeFence, CustomPatternsAreHonoured)
{
    ef::forge::CodeFencePatterns patterns;
    patterns.languages = {"zig"};
    patterns.copyMarker = "Copy";
    EXPECT_EQ(ef::forge::applyCodeMarkdown("zig\nCopy\nconst x = 1;", patterns), "```zig\nconst x = 1;\n```\n");
    EXPECT_EQ(ef::forge::findCodeBoundary("a\nb", 0, patterns), 3u);
}
