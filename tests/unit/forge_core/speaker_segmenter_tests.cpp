#include <gtest/gtest.h>

#include "ef/forge/speaker_segmenter.hpp"

#include <string>

namespace
{

const std::string kTwoTurnExport =
    R"(<main><div data-message-author-role="user" data-message-id="a1" class="turn"><p>Hi there</p></div>)"
    R"(<div data-message-author-role="assistant" id="m2" dir="auto"><p>Hello!</p></div></main>)";

} // namespace

TEST(SpeakerSegmenter, SplitsAtRoleMarkersInDocumentOrder)
{
    auto turns = ef::forge::segmentTranscript(kTwoTurnExport);
    ASSERT_EQ(turns.size(), 2u);
    EXPECT_EQ(turns[0].role, ef::forge::SpeakerRole::User);
    EXPECT_EQ(turns[0].roleName, "user");
    EXPECT_EQ(turns[0].text.rfind("Hi there", 0), 0u);
    EXPECT_EQ(turns[1].role, ef::forge::SpeakerRole::Assistant);
    EXPECT_EQ(turns[1].text, "Hello!");
}

TEST(SpeakerSegmenter, RoleValuesAreMatchedCaseInsensitively)
{
    auto turns = ef::forge::segmentTranscript(R"(<div DATA-MESSAGE-AUTHOR-ROLE="User">Question</div>)");
    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(turns[0].role, ef::forge::SpeakerRole::User);
    EXPECT_EQ(turns[0].roleName, "user");
}

TEST(SpeakerSegmenter, OtherRoleValuesAreNotMarkers)
{
    auto turns = ef::forge::segmentTranscript(R"(<div data-message-author-role="system">Setup</div>)");
    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(turns[0].role, ef::forge::SpeakerRole::Unknown);
}

TEST(SpeakerSegmenter, FallsBackToOneUnknownTurn)
{
    auto turns = ef::forge::segmentTranscript("<p>Just   text</p>");
    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(turns[0].role, ef::forge::SpeakerRole::Unknown);
    EXPECT_EQ(turns[0].roleName, "unknown");
    EXPECT_EQ(turns[0].text, "Just text");
}

TEST(SpeakerSegmenter, DropsTurnsThatCleanToNothing)
{
    auto turns = ef::forge::segmentTranscript(
        R"(data-message-author-role="user">   <!-- empty -->data-message-author-role="assistant">Answer)");
    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(turns[0].role, ef::forge::SpeakerRole::Assistant);
    EXPECT_EQ(turns[0].text, "Answer");
}

TEST(SpeakerSegmenter, StripsAttributeNoise)
{
    EXPECT_EQ(ef::forge::stripAttributeNoise(R"(<div class="x" data-id="7" aria-label="l" style="s">t</div>)"),
              "<div>t</div>");
    EXPECT_EQ(ef::forge::stripAttributeNoise(R"(<a xid="1" hidden="1" href="#">t</a>)"),
              R"(<a xid="1" hidden="1" href="#">t</a>)");
}

TEST(SpeakerSegmenter, KeepsTheLanguageClassOfCodeTags)
{
    EXPECT_EQ(ef::forge::stripAttributeNoise(R"(<pre class="p"><code class="language-go" data-x="1">x</code></pre>)"),
              R"(<pre><code class="language-go">x</code></pre>)");
    EXPECT_EQ(ef::forge::stripAttributeNoise(R"(<CODE class="hljs"><codex class="y">)"),
              R"(<CODE class="hljs"><codex>)");

    auto turns = ef::forge::segmentTranscript(R"(<div data-message-author-role="assistant">)"
                                              R"(<pre><code class="language-python">print(1)</code></pre></div>)");
    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(turns[0].text, "```python\nprint(1)\n```");
}

TEST(SpeakerSegmenter, RoleNamesRoundTrip)
{
    EXPECT_EQ(ef::forge::speakerRoleFromName("ASSISTANT"), ef::forge::SpeakerRole::Assistant);
    EXPECT_EQ(ef::forge::speakerRoleFromName("tool"), ef::forge::SpeakerRole::Other);
    EXPECT_EQ(ef::forge::speakerRoleName(ef::forge::SpeakerRole::User), "user");
    EXPECT_EQ(ef::forge::speakerRoleName(ef::forge::SpeakerRole::Unknown), "unknown");
}
