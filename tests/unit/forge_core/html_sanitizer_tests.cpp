#include <gtest/gtest.h>

#include "ef/forge/html_sanitizer.hpp"

#include <string>

TEST(HtmlSanitizer, PreCodeKeepsIndentation)
{
    EXPECT_EQ(ef::forge::cleanPlainText("<pre><code>line1\n    line2</code></pre>"), "```\nline1\n    line2\n```");
}

TEST(HtmlSanitizer, PreCodeDropsHighlightTagsAndDecodesEntities)
{
    const std::string html = "<p>Before</p><pre><code><span class=\"k\">if</span> (a &lt; b)\n\treturn;</code></pre>";
    EXPECT_EQ(ef::forge::cleanPlainText(html), "Before\n\n```\nif (a < b)\n\treturn;\n```");
}

TEST(HtmlSanitizer, PreCodeLanguageClassTagsTheFence)
{
    const std::string html = "<pre><code class=\"hljs language-Python\">def f():\n    return 1</code></pre>";
    EXPECT_EQ(ef::forge::cleanPlainText(html), "```python\ndef f():\n    return 1\n```");
}

TEST(HtmlSanitizer, PreCodeDecodesEveryNamedReference)
{
    EXPECT_EQ(ef::forge::cleanPlainText("<pre><code>if (a &lbrace; b) &NewLine;</code></pre>"), "```\nif (a { b) \n```");
}

TEST(HtmlSanitizer, PreCodeTrimsOnlyOuterBlankLines)
{
    const std::string html = "<pre><code>\r\n\r\na\r\n\r\nb\r\n\r\n</code></pre>";
    EXPECT_EQ(ef::forge::cleanPlainText(html), "```\na\n\nb\n```");
}

TEST(HtmlSanitizer, ExtractionIsCaseInsensitiveAndStoresBlocks)
{
    ef::forge::CodeBlockArena arena;
    std::string text = ef::forge::extractPreCodeBlocks("x<PRE class=y>\n  <CODE>code()</CODE>\n</PRE>z", arena);
    ASSERT_EQ(arena.size(), 1u);
    EXPECT_EQ(text, "x\n" + ef::forge::CodeBlockArena::placeholder(0) + "\nz");
    ASSERT_NE(arena.find(0), nullptr);
    EXPECT_EQ(arena.find(0)->content, "code()");
    EXPECT_FALSE(arena.find(0)->language.has_value());
}

TEST(HtmlSanitizer, PreWithoutCodeIsOrdinaryMarkup)
{
    ef::forge::CodeBlockArena arena;
    std::string text = ef::forge::extractPreCodeBlocks("<pre>plain</pre>", arena);
    EXPECT_TRUE(arena.empty());
    EXPECT_EQ(text, "<pre>plain</pre>");
}

TEST(HtmlSanitizer, ArenaLeavesUnknownPlaceholdersLiteral)
{
    ef::forge::CodeBlockArena arena;
    std::size_t handle = arena.add({std::string("sh"), "ls"});
    const std::string text =
        ef::forge::CodeBlockArena::placeholder(handle) + " " + ef::forge::CodeBlockArena::placeholder(7);
    EXPECT_EQ(arena.resolve(text), "```sh\nls\n``` " + ef::forge::CodeBlockArena::placeholder(7));
}

TEST(HtmlSanitizer, PlaceholdersNeverReachTheOutput)
{
    const std::string html = "<pre><code>a</code></pre><p>mid</p><pre><code>b</code></pre>";
    std::string cleaned = ef::forge::cleanPlainText(html);
    EXPECT_EQ(cleaned.find("CODEBLOCK"), std::string::npos);
    EXPECT_EQ(cleaned, "```\na\n```\n\nmid\n\n```\nb\n```");
}

TEST(HtmlSanitizer, BlockTagsBecomeLineBreaks)
{
    EXPECT_EQ(ef::forge::replaceBlockBreakers("a<br/>b<LI class=x>c</li><span>d</span>"),
              "a\nb\nc\n<span>d</span>");
    EXPECT_EQ(ef::forge::replaceBlockBreakers("<pre>x</pre><h2>t</h2>"), "<pre>x</pre>\nt\n");
}

TEST(HtmlSanitizer, HiddenBlocksDisappearWithTheirContents)
{
    EXPECT_EQ(ef::forge::removeHiddenBlocks("keep<script type=\"x\">var a = 1;</script><!-- note --> this"
                                            "<STYLE>p{}</STYLE>"),
              "keep this");
    EXPECT_EQ(ef::forge::removeHiddenBlocks("<scripted>x"), "<scripted>x");
}

TEST(HtmlSanitizer, StripTagsRemovesAnyTagLikeSpan)
{
    EXPECT_EQ(ef::forge::stripTags("<a href=\"#\">link</a> 1 <> 2 < 3"), "link 1 <> 2 < 3");
    EXPECT_EQ(ef::forge::stripTags("a < b > c"), "a  c");
}

TEST(HtmlSanitizer, LayoutKeywordsAreBlankedAsWholeWords)
{
    EXPECT_EQ(ef::forge::replaceLayoutKeywords("a DIV b divider main"), "a   b divider  ");
}

TEST(HtmlSanitizer, CollapsesRunsButKeepsLeadingIndent)
{
    EXPECT_EQ(ef::forge::collapseWhitespacePreservingIndent("    x   =  1\nfoo \t bar\n"), "    x = 1\nfoo bar");
}

TEST(HtmlSanitizer, CleansProseMarkup)
{
    const std::string html = "<div><p>Hello&nbsp;<b>world</b></p><p></p><p></p><p>Second   line &copy;</p></div>";
    EXPECT_EQ(ef::forge::cleanPlainText(html), "Hello\xC2\xA0world\n\nSecond line");
}

TEST(HtmlSanitizer, ProseDecodesLegacyAndHtml5References)
{
    EXPECT_EQ(ef::forge::cleanPlainText("<p>Caf&eacute; &copy 2024 &lbrace;x&rbrace; &hyphen; a&amp;b</p>"),
              "Caf\xC3\xA9 2024 {x} \xE2\x80\x90 a&b");
}

TEST(HtmlSanitizer, CleaningTwiceChangesNothing)
{
    const std::string html = "<div><p>Hello   <i>there</i></p><ul><li>one</li><li>two</li></ul></div>";
    const std::string once = ef::forge::cleanPlainText(html);
    EXPECT_EQ(once, "Hello there\n\none\n\ntwo");
    EXPECT_EQ(ef::forge::cleanPlainText(once), once);
}

TEST(HtmlSanitizer, CleaningAFenceAgainDropsTheBackticks)
{
    const std::string once = ef::forge::cleanPlainText("<pre><code>x = 1</code></pre>");
    ASSERT_EQ(once, "```\nx = 1\n```");
    const std::string twice = ef::forge::cleanPlainText(once);
    EXPECT_EQ(twice.find('`'), std::string::npos);
    EXPECT_NE(twice.find("x = 1"), std::string::npos);
}
