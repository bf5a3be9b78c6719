#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ef::forge
{

// Lines a chat UI leaves behind in front of each message.
inline constexpr std::array<std::string_view, 2> kSpeakerLabelArtifacts{"You said:", "ChatGPT said:"};

struct CodeFencePatterns
{
    // Language headers the UI prints above a code block.
    std::vector<std::string> languages;
    // Button text printed between the header and the code.
    std::string copyMarker;
    std::vector<std::string> speakerArtifacts;
    std::vector<std::string> proseMarkers;

    static const CodeFencePatterns &defaults();
};

struct CodeOpening
{
    std::string language;
    std::size_t begin = 0;   // start of the language line
    std::size_t payload = 0; // first byte after the copy marker line
};

// Opening at a line start: language line (any case), blank lines, copy
// marker line.
std::optional<CodeOpening> matchCodeOpening(std::string_view text, std::size_t lineStart,
                                            const CodeFencePatterns &patterns);

// Earliest line start at or after `from` where a reconstructed payload has
// to stop; text.size() when nothing matches.
std::size_t findCodeBoundary(std::string_view text, std::size_t from, const CodeFencePatterns &patterns);

// Rewrites "language / Copy code / payload" runs of plain text as fenced
// code blocks. Text without an opening comes back unchanged.
std::string applyCodeMarkdown(std::string_view text,
                              const CodeFencePatterns &patterns = CodeFencePatterns::defaults());

} // namespace ef::forge
