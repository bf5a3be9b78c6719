#include <gtest/gtest.h>

#include "ef/forge/pipeline.hpp"

#include <string>

namespace
{

const std::string kDash = "\xE2\x80\x94";

const std::string kExport =
    R"(<html><body><main><div data-message-author-role="user" data-message-id="a1" class="turn"><p>Hi there</p></div>)"
    R"(<div data-message-author-role="assistant" id="m2" dir="auto"><p>Hello!</p></div></main></body></html>)";

ef::forge::ForgeOptions bySpeaker()
{
    ef::forge::ForgeOptions options;
    options.bySpeaker = true;
    return options;
}

} // namespace

TEST(ForgePipeline, MarkdownDestinations)
{
    EXPECT_TRUE(ef::forge::isMarkdownDestination("out.md"));
    EXPECT_TRUE(ef::forge::isMarkdownDestination("dir/OUT.MD"));
    EXPECT_FALSE(ef::forge::isMarkdownDestination("out.txt"));
    EXPECT_FALSE(ef::forge::isMarkdownDestination("md"));
    EXPECT_FALSE(ef::forge::isMarkdownDestination(""));
}

TEST(ForgePipeline, JsonlBySpeaker)
{
    auto options = bySpeaker();
    options.jsonl = true;
    EXPECT_EQ(ef::forge::forgeDocument(kExport, options, "chat.jsonl"),
              "{\"role\": \"User\", \"text\": \"Hi there\"}\n{\"role\": \"ChatGPT\", \"text\": \"Hello!\"}\n");
}

TEST(ForgePipeline, JsonlNeverGetsAFooter)
{
    auto options = bySpeaker();
    options.jsonl = true;
    EXPECT_EQ(ef::forge::forgeDocument(kExport, options, "chat.md").find("Generated by"), std::string::npos);
}

TEST(ForgePipeline, TurnDelimitedWithUserLabel)
{
    auto options = bySpeaker();
    options.userLabel = "James";
    EXPECT_EQ(ef::forge::forgeDocument(kExport, options, "chat.txt"),
              "--- 001 [James] ---\nHi there\n\n--- 002 [ChatGPT] ---\nHello!\n\n");
}

TEST(ForgePipeline, ForgeTurnsMatchesTheWrittenTurns)
{
    auto turns = ef::forge::forgeTurns(kExport, bySpeaker());
    ASSERT_EQ(turns.size(), 2u);
    EXPECT_EQ(turns[0].label, "User");
    EXPECT_EQ(turns[0].text, "Hi there");
    EXPECT_EQ(turns[1].label, "ChatGPT");
}

TEST(ForgePipeline, PlainTextFooterOnlyForMarkdownFiles)
{
    ef::forge::ForgeOptions options;
    EXPECT_EQ(ef::forge::forgeDocument("<p>Hello</p>", options, "out.txt"), "Hello");

    const std::string md = ef::forge::forgeDocument("<p>Hello</p>", options, "out.md");
    EXPECT_EQ(md.rfind("Hello\n---\n> Generated by [EchoForge v1.1.7]", 0), 0u);

    options.noSignature = true;
    EXPECT_EQ(ef::forge::forgeDocument("<p>Hello</p>", options, "out.md"), "Hello");
}

TEST(ForgePipeline, JsonlIsIgnoredWithoutBySpeaker)
{
    ef::forge::ForgeOptions options;
    options.jsonl = true;
    EXPECT_EQ(ef::forge::forgeDocument(kExport, options, "out.txt").find("\"role\""), std::string::npos);
}

TEST(ForgePipeline, PrettyWithoutBySpeakerIsOneUnknownTurn)
{
    ef::forge::ForgeOptions options;
    options.prettyMarkdown = true;
    const std::string doc = ef::forge::forgeDocument("<p>Hello</p>", options, "out.md");
    EXPECT_NE(doc.find("### Turn 001 " + kDash + " Unknown\n\nHello\n"), std::string::npos);
    EXPECT_EQ(doc.find("Turn 002"), std::string::npos);
}

TEST(ForgePipeline, PrettyBySpeakerJsonlStaysJsonl)
{
    auto options = bySpeaker();
    options.jsonl = true;
    options.prettyMarkdown = true;
    EXPECT_EQ(ef::forge::forgeDocument(kExport, options, "out.md").rfind("{\"role\": \"User\"", 0), 0u);
}

TEST(ForgePipeline, NoTocOverridesDepth)
{
    auto options = bySpeaker();
    options.prettyMarkdown = true;
    options.tocDepth = 3;
    EXPECT_NE(ef::forge::forgeDocument(kExport, options, "out.md").find("## Table of Contents"), std::string::npos);

    options.noToc = true;
    const std::string doc = ef::forge::forgeDocument(kExport, options, "out.md");
    EXPECT_EQ(doc.find("## Table of Contents"), std::string::npos);
    EXPECT_EQ(doc.find("## Turns"), std::string::npos);
    EXPECT_EQ(ef::forge::renderOptionsFor(options).tocDepth, 0);
}

TEST(ForgePipeline, CopyCodeBlocksBecomeFences)
{
    ef::forge::ForgeOptions options;
    const std::string html = "<p>python</p><p>Copy code</p><p>print(1)</p>";
    EXPECT_EQ(ef::forge::forgeDocument(html, options, "out.txt"), "```python\nprint(1)\n```");

    options.markdown = false;
    EXPECT_EQ(ef::forge::forgeDocument(html, options, "out.txt"), "python\n\nCopy code\n\nprint(1)");
}

TEST(ForgePipeline, PreformattedCodeSurvivesWrapping)
{
    ef::forge::ForgeOptions options;
    options.maxWidth = 4;
    const std::string html = "<pre><code class=\"language-py\">if ready:\n    launch(now=True)</code></pre>";
    EXPECT_EQ(ef::forge::forgeDocument(html, options, "out.txt"), "```py\nif ready:\n    launch(now=True)\n```");
}

TEST(ForgePipeline, CodeLanguageSurvivesSpeakerSplitting)
{
    const std::string html =
        R"(<div data-message-author-role="assistant"><pre><code class="language-python">print(1)</code></pre></div>)";
    ef::forge::ForgeOptions options;
    EXPECT_EQ(ef::forge::forgeDocument(html, options, "out.txt"), "```python\nprint(1)\n```");

    options.bySpeaker = true;
    EXPECT_EQ(ef::forge::forgeDocument(html, options, "out.txt"), "--- 001 [ChatGPT] ---\n```python\nprint(1)\n```\n\n");
}

TEST(ForgePipeline, ProseIsWrappedAroundFences)
{
    ef::forge::ForgeOptions options;
    options.maxWidth = 7;
    const std::string html = "<p>one two three</p><pre><code>keep this line whole</code></pre><p>four five</p>";
    EXPECT_EQ(ef::forge::forgeDocument(html, options, "out.txt"),
              "one two\nthree\n\n```\nkeep this line whole\n```\n\nfour\nfive");
}
