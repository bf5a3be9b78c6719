#pragma once

#include "ef/forge/transcript_renderer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ef::forge
{

struct ForgeOptions
{
    bool bySpeaker = false;
    bool jsonl = false; // only honoured together with bySpeaker
    std::string userLabel;
    bool markdown = true;
    bool prettyMarkdown = false;
    int maxWidth = 0;
    int tocDepth = 0;
    std::string title{kDefaultTitle};
    Theme theme = Theme::Light;
    bool obsidianLinks = false;
    bool noToc = false;
    bool noSignature = false;
};

// Output names ending in ".md" (any case).
bool isMarkdownDestination(std::string_view destinationName) noexcept;

RenderOptions renderOptionsFor(const ForgeOptions &options);

// Segmented and prepared turns, as written by the JSONL and plain turn
// renderers. Without bySpeaker the document is one "Unknown" turn.
std::vector<LabeledTurn> forgeTurns(std::string_view document, const ForgeOptions &options);

// Runs the whole pipeline on a raw document and returns the text to write
// to destinationName.
std::string forgeDocument(std::string_view document, const ForgeOptions &options,
                          std::string_view destinationName);

} // namespace ef::forge
