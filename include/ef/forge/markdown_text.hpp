#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ef::forge
{

// Fenced blocks with at least this many payload lines fold away.
inline constexpr std::size_t kLongCodeMinLines = 15;

// GitHub-style heading anchor: lowercase, only [a-z0-9 -] kept, whitespace
// runs become '-', outer '-' trimmed. Equal labels give equal anchors.
std::string markdownAnchor(std::string_view label);

// [[#target|text]]
std::string obsidianHeadingLink(std::string_view target, std::string_view text);

// [text](#anchor) -> [[#anchor|text]]
std::string rewriteHeadingLinksToObsidian(std::string_view text);

// Blanks lines that are only a speaker label ("You said:") or a lone '<',
// then collapses blank runs and trims.
std::string stripLabelArtifacts(std::string_view text);

struct TextRegion
{
    std::string_view text;
    bool fenced = false;
};

// Alternating prose / ```fenced``` regions; an unterminated fence is prose.
std::vector<TextRegion> splitFencedRegions(std::string_view text);

// Number of code points, used as the column width of a line.
std::size_t columnWidth(std::string_view text) noexcept;

// Greedy word wrap; words wider than the line are cut.
std::vector<std::string> wrapWords(std::string_view text, std::size_t width);

// Wraps one paragraph. List items ("- ", "* ", "+ ", "1. ") keep their
// marker and indent continuation lines under the item text.
std::string wrapParagraph(std::string_view paragraph, std::size_t width);

// Wraps prose paragraphs to width columns and leaves fenced regions alone.
// width <= 0 returns the text unchanged.
std::string wrapNonCode(std::string_view text, int width);

// Folds each fenced block of minLines or more payload lines into a
// <details> element summarizing its size and language.
std::string collapseLongCode(std::string_view text, std::size_t minLines = kLongCodeMinLines);

} // namespace ef::forge
