#pragma once

#include "ef/forge/speaker_segmenter.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ef::forge
{

enum class Theme
{
    Light,
    Dark,
    Auto,
    Obsidian,
};

std::optional<Theme> themeFromName(std::string_view name) noexcept;
std::string_view themeName(Theme theme) noexcept;

inline constexpr std::string_view kAssistantLabel = "ChatGPT";
inline constexpr std::string_view kDefaultTitle = "Chat Transcript";

struct RenderOptions
{
    std::string userLabel;
    bool codeMarkdown = true;
    bool obsidianLinks = false;
    int maxWidth = 0;
    int tocDepth = 0;
    std::string title{kDefaultTitle};
    Theme theme = Theme::Light;
    bool signature = true;
};

struct LabeledTurn
{
    std::string label;
    std::string text;
};

// Custom label for the user (when set), "ChatGPT" for the assistant,
// title-cased role name otherwise.
std::string displayLabel(const SpeakerTurn &turn, std::string_view userLabel);

// "Turn 001 — label"
std::string turnHeading(std::size_t index, std::string_view label);

// Code-fence reconstruction (when enabled), label artifact stripping and
// the optional Obsidian link rewrite. No wrapping.
std::string prepareTurnText(std::string_view text, const RenderOptions &options);

std::vector<LabeledTurn> labelTurns(const std::vector<SpeakerTurn> &turns, const RenderOptions &options);

// One {"role": ..., "text": ...} object per line.
std::string renderJsonl(const std::vector<LabeledTurn> &turns);

// "--- 001 [label] ---", text, blank line; prose wrapped at maxWidth > 0.
std::string renderTurnDelimited(const std::vector<LabeledTurn> &turns, int maxWidth);

std::string_view themeBlock(Theme theme) noexcept;
std::string signatureComment();
std::string footerSignature();

// Full Markdown document: theme block, signature comment, title, table of
// contents, one section per turn, long code folded, footer.
std::string renderMarkdownDocument(const std::vector<SpeakerTurn> &turns, const RenderOptions &options);

} // namespace ef::forge
