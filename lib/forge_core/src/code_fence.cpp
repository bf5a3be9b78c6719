#include "ef/forge/code_fence.hpp"

#include "text_scan.hpp"

#include <cctype>

namespace ef::forge
{
namespace
{
using namespace detail;

bool isDigit(char ch) noexcept
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

// Whitespace up to the end of the line (or text) follows pos.
bool restOfLineBlank(std::string_view text, std::size_t pos) noexcept
{
    while (pos < text.size() && text[pos] != '\n' && isAsciiSpace(text[pos]))
        ++pos;
    return pos == text.size() || text[pos] == '\n';
}

bool isExactLanguageLine(std::string_view text, std::size_t pos, const CodeFencePatterns &patterns)
{
    for (const std::string &language : patterns.languages)
    {
        if (startsWithAt(text, pos, language) && restOfLineBlank(text, pos + language.size()))
            return true;
    }
    return false;
}

// "--- 001 [Label] ---" delimiter written by the turn renderer.
bool isTurnMarker(std::string_view text, std::size_t pos) noexcept
{
    if (!startsWithAt(text, pos, "---"))
        return false;
    std::size_t cursor = skipWhitespace(text, pos + 3);
    std::size_t digits = cursor;
    while (cursor < text.size() && isDigit(text[cursor]))
        ++cursor;
    if (cursor == digits)
        return false;
    cursor = skipWhitespace(text, cursor);
    return cursor < text.size() && text[cursor] == '[';
}

bool isHeading(std::string_view text, std::size_t pos) noexcept
{
    std::size_t hashes = 0;
    while (pos + hashes < text.size() && text[pos + hashes] == '#')
        ++hashes;
    return hashes >= 1 && hashes <= 6 && pos + hashes < text.size() && isAsciiSpace(text[pos + hashes]);
}

bool isListItem(std::string_view text, std::size_t pos) noexcept
{
    if (pos >= text.size())
        return false;
    char ch = text[pos];
    if (ch == '-' || ch == '*' || ch == '+')
        return pos + 1 < text.size() && isAsciiSpace(text[pos + 1]);
    std::size_t cursor = pos;
    while (cursor < text.size() && isDigit(text[cursor]))
        ++cursor;
    if (cursor == pos || cursor + 1 >= text.size() || text[cursor] != '.')
        return false;
    return isAsciiSpace(text[cursor + 1]);
}

bool isBoundaryLine(std::string_view text, std::size_t pos, const CodeFencePatterns &patterns)
{
    if (isExactLanguageLine(text, pos, patterns) || isTurnMarker(text, pos))
        return true;
    for (const std::string &artifact : patterns.speakerArtifacts)
        if (startsWithAt(text, pos, artifact))
            return true;
    if (startsWithAt(text, pos, "<details>") || startsWithAt(text, pos, "</details>"))
        return true;
    if (startsWithAt(text, pos, "```"))
        return true;

    // These may sit behind blank or indented lines.
    std::size_t content = skipWhitespace(text, pos);
    if (isHeading(text, content) || isListItem(text, content))
        return true;
    for (const std::string &marker : patterns.proseMarkers)
        if (startsWithAt(text, content, marker))
            return true;
    return false;
}

} // namespace

const CodeFencePatterns &CodeFencePatterns::defaults()
{
    static const CodeFencePatterns patterns{
        {"kotlin", "sql", "scss", "pgsql", "bash", "vbnet", "python", "py", "javascript", "js",
         "typescript", "ts", "html", "css", "json", "xml", "yaml", "yml", "toml", "ini",
         "go", "rust", "c", "cpp", "java", "powershell", "ps1", "sh", "zsh", "dockerfile",
         "makefile", "perl", "r", "lua", "swift", "php", "objc", "objective-c"},
        "Copy code",
        {std::string(kSpeakerLabelArtifacts[0]), std::string(kSpeakerLabelArtifacts[1])},
        {"Quick extra:", "Quick extras:"},
    };
    return patterns;
}

std::optional<CodeOpening> matchCodeOpening(std::string_view text, std::size_t lineStart,
                                            const CodeFencePatterns &patterns)
{
    for (const std::string &language : patterns.languages)
    {
        if (!startsWithIgnoreCaseAt(text, lineStart, language))
            continue;
        std::size_t afterLanguage = lineStart + language.size();
        std::size_t markerStart = skipWhitespace(text, afterLanguage);
        if (markerStart == afterLanguage || text[markerStart - 1] != '\n')
            continue;
        if (!startsWithIgnoreCaseAt(text, markerStart, patterns.copyMarker))
            continue;

        std::size_t afterMarker = markerStart + patterns.copyMarker.size();
        std::size_t runEnd = skipWhitespace(text, afterMarker);
        std::size_t lastNewline = text.substr(0, runEnd).rfind('\n');
        if (lastNewline == std::string_view::npos || lastNewline < afterMarker)
            continue;

        CodeOpening opening;
        opening.language = std::string(text.substr(lineStart, language.size()));
        opening.begin = lineStart;
        opening.payload = lastNewline + 1;
        return opening;
    }
    return std::nullopt;
}

std::size_t findCodeBoundary(std::string_view text, std::size_t from, const CodeFencePatterns &patterns)
{
    std::size_t lineStart = from;
    while (lineStart < text.size())
    {
        if (isBoundaryLine(text, lineStart, patterns))
            return lineStart;
        std::size_t newline = text.find('\n', lineStart);
        if (newline == std::string_view::npos)
            break;
        lineStart = newline + 1;
    }
    return text.size();
}

std::string applyCodeMarkdown(std::string_view text, const CodeFencePatterns &patterns)
{
    std::string result;
    result.reserve(text.size() + 64);

    std::size_t copied = 0;
    std::size_t lineStart = 0;
    while (lineStart < text.size())
    {
        auto opening = matchCodeOpening(text, lineStart, patterns);
        if (!opening)
        {
            std::size_t newline = text.find('\n', lineStart);
            if (newline == std::string_view::npos)
                break;
            lineStart = newline + 1;
            continue;
        }

        std::size_t boundary = findCodeBoundary(text, opening->payload, patterns);
        std::string_view payload = trimTrailingNewlines(text.substr(opening->payload, boundary - opening->payload));

        result.append(text.substr(copied, opening->begin - copied));
        result.append("```");
        result.append(opening->language);
        result.push_back('\n');
        result.append(payload);
        result.append("\n```\n");

        copied = boundary;
        lineStart = boundary;
    }
    result.append(text.substr(copied));
    return result;
}

} // namespace ef::forge
