#include "ef/forge/markdown_text.hpp"

#include "ef/forge/code_fence.hpp"
#include "ef/forge/unicode_text.hpp"
#include "text_scan.hpp"

#include <algorithm>
#include <cctype>

namespace ef::forge
{
namespace
{
using namespace detail;

// Byte offset after advancing `columns` code points from offset.
std::size_t advanceColumns(std::string_view text, std::size_t offset, std::size_t columns) noexcept
{
    while (columns > 0 && offset < text.size())
    {
        offset = nextCodePointOffset(text, offset);
        --columns;
    }
    return offset;
}

// Length of a "  - " / "12. " list marker prefix including the one
// whitespace character after it, or 0.
std::size_t listPrefixLength(std::string_view line) noexcept
{
    std::size_t pos = 0;
    while (pos < line.size() && isHorizontalSpace(line[pos]))
        ++pos;
    if (pos >= line.size())
        return 0;
    if (line[pos] == '-' || line[pos] == '*' || line[pos] == '+')
    {
        ++pos;
    }
    else
    {
        std::size_t digits = pos;
        while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos])))
            ++pos;
        if (pos == digits || pos >= line.size() || line[pos] != '.')
            return 0;
        ++pos;
    }
    if (pos >= line.size() || !isHorizontalSpace(line[pos]))
        return 0;
    return pos + 1;
}

bool isLabelArtifactLine(std::string_view line) noexcept
{
    for (std::string_view artifact : kSpeakerLabelArtifacts)
    {
        if (!startsWithIgnoreCaseAt(line, 0, artifact))
            continue;
        std::size_t pos = artifact.size();
        while (pos < line.size() && isAsciiSpace(line[pos]))
            ++pos;
        if (pos < line.size() && line[pos] == '<')
            ++pos;
        while (pos < line.size() && isAsciiSpace(line[pos]))
            ++pos;
        if (pos == line.size())
            return true;
    }
    return false;
}

bool isLoneAngleBracket(std::string_view line) noexcept
{
    std::size_t begin = 0;
    while (begin < line.size() && isAsciiSpace(line[begin]))
        ++begin;
    std::size_t end = line.size();
    while (end > begin && isAsciiSpace(line[end - 1]))
        --end;
    return end - begin == 1 && line[begin] == '<';
}

std::string wrapProse(std::string_view text, std::size_t width)
{
    std::size_t leading = 0;
    while (leading < text.size() && text[leading] == '\n')
        ++leading;
    std::size_t trailing = 0;
    while (trailing < text.size() - leading && text[text.size() - 1 - trailing] == '\n')
        ++trailing;

    std::string result(leading, '\n');
    std::string_view body = text.substr(leading, text.size() - leading - trailing);
    std::size_t pos = 0;
    bool first = true;
    while (!body.empty())
    {
        std::size_t breakAt = body.find("\n\n", pos);
        std::string_view paragraph =
            body.substr(pos, breakAt == std::string_view::npos ? std::string_view::npos : breakAt - pos);
        if (!first)
            result.append("\n\n");
        result.append(wrapParagraph(paragraph, width));
        first = false;
        if (breakAt == std::string_view::npos)
            break;
        pos = breakAt + 2;
    }
    result.append(trailing, '\n');
    return result;
}

} // namespace

std::string markdownAnchor(std::string_view label)
{
    std::string anchor;
    anchor.reserve(label.size());
    bool pendingSpace = false;
    std::size_t pos = 0;
    while (pos < label.size())
    {
        char32_t cp = codePointAt(label, pos);
        pos = nextCodePointOffset(label, pos);
        if (isUnicodeWhitespace(cp))
        {
            pendingSpace = true;
            continue;
        }
        if (cp >= U'A' && cp <= U'Z')
            cp = cp - U'A' + U'a';
        bool kept = (cp >= U'a' && cp <= U'z') || (cp >= U'0' && cp <= U'9') || cp == U'-';
        if (!kept)
            continue;
        if (pendingSpace && !anchor.empty())
            anchor.push_back('-');
        pendingSpace = false;
        anchor.push_back(static_cast<char>(cp));
    }

    std::size_t begin = anchor.find_first_not_of('-');
    if (begin == std::string::npos)
        return std::string();
    std::size_t end = anchor.find_last_not_of('-');
    return anchor.substr(begin, end - begin + 1);
}

std::string obsidianHeadingLink(std::string_view target, std::string_view text)
{
    std::string link = "[[#";
    link.append(target);
    link.push_back('|');
    link.append(text);
    link.append("]]");
    return link;
}

std::string rewriteHeadingLinksToObsidian(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t open = text.find('[', pos);
        if (open == std::string_view::npos)
        {
            result.append(text.substr(pos));
            break;
        }
        result.append(text.substr(pos, open - pos));

        std::size_t closeBracket = text.find(']', open + 1);
        bool matched = closeBracket != std::string_view::npos && closeBracket > open + 1 &&
                       startsWithAt(text, closeBracket + 1, "(#");
        std::size_t closeParen = std::string_view::npos;
        if (matched)
        {
            closeParen = text.find(')', closeBracket + 3);
            matched = closeParen != std::string_view::npos && closeParen > closeBracket + 3;
        }
        if (!matched)
        {
            result.push_back('[');
            pos = open + 1;
            continue;
        }

        std::string_view label = text.substr(open + 1, closeBracket - open - 1);
        std::string_view target = text.substr(closeBracket + 3, closeParen - closeBracket - 3);
        result.append(obsidianHeadingLink(target, label));
        pos = closeParen + 1;
    }
    return result;
}

std::string stripLabelArtifacts(std::string_view text)
{
    std::vector<std::string> lines;
    for (std::string_view line : splitLines(text))
    {
        if (isLabelArtifactLine(line) || isLoneAngleBracket(line))
            lines.emplace_back();
        else
            lines.emplace_back(line);
    }
    std::string collapsed = collapseBlankLines(joinLines(lines));
    return std::string(trimUnicode(collapsed));
}

std::vector<TextRegion> splitFencedRegions(std::string_view text)
{
    std::vector<TextRegion> regions;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t open = text.find("```", pos);
        std::size_t close = open == std::string_view::npos ? std::string_view::npos : text.find("```", open + 3);
        if (close == std::string_view::npos)
        {
            regions.push_back(TextRegion{text.substr(pos), false});
            break;
        }
        if (open > pos)
            regions.push_back(TextRegion{text.substr(pos, open - pos), false});
        regions.push_back(TextRegion{text.substr(open, close + 3 - open), true});
        pos = close + 3;
    }
    return regions;
}

std::size_t columnWidth(std::string_view text) noexcept
{
    std::size_t columns = 0;
    for (char ch : text)
    {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
            ++columns;
    }
    return columns;
}

std::vector<std::string> wrapWords(std::string_view text, std::size_t width)
{
    std::vector<std::string> lines;
    if (width == 0)
    {
        if (!text.empty())
            lines.emplace_back(text);
        return lines;
    }

    std::string currentLine;
    std::size_t currentWidth = 0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        if (isAsciiSpace(text[pos]))
        {
            ++pos;
            continue;
        }

        std::size_t wordEnd = pos;
        while (wordEnd < text.size() && !isAsciiSpace(text[wordEnd]))
            ++wordEnd;

        std::string_view word = text.substr(pos, wordEnd - pos);
        std::size_t wordWidth = columnWidth(word);
        pos = wordEnd;

        if (currentLine.empty() && wordWidth <= width)
        {
            currentLine.assign(word);
            currentWidth = wordWidth;
        }
        else if (!currentLine.empty() && currentWidth + 1 + wordWidth <= width)
        {
            currentLine.push_back(' ');
            currentLine.append(word);
            currentWidth += 1 + wordWidth;
        }
        else if (wordWidth <= width)
        {
            lines.push_back(currentLine);
            currentLine.assign(word);
            currentWidth = wordWidth;
        }
        else
        {
            if (!currentLine.empty())
                lines.push_back(currentLine);
            std::size_t offset = 0;
            while (true)
            {
                std::size_t chunkEnd = advanceColumns(word, offset, width);
                std::string_view chunk = word.substr(offset, chunkEnd - offset);
                offset = chunkEnd;
                if (offset >= word.size())
                {
                    currentLine.assign(chunk);
                    currentWidth = columnWidth(chunk);
                    break;
                }
                lines.emplace_back(chunk);
            }
        }
    }

    if (!currentLine.empty())
        lines.push_back(currentLine);

    return lines;
}

std::string wrapParagraph(std::string_view paragraph, std::size_t width)
{
    struct Item
    {
        std::string marker;
        std::string body;
    };

    std::vector<Item> items;
    for (std::string_view line : splitLines(paragraph))
    {
        std::size_t prefix = listPrefixLength(line);
        if (prefix > 0)
        {
            items.push_back(Item{std::string(line.substr(0, prefix)), std::string(line.substr(prefix))});
            continue;
        }
        // Lines after a list item continue that item.
        if (items.empty())
            items.emplace_back();
        std::string &body = items.back().body;
        if (!body.empty())
            body.push_back(' ');
        body.append(line);
    }

    std::vector<std::string> out;
    for (const Item &item : items)
    {
        std::size_t indent = columnWidth(item.marker);
        std::size_t available = width > indent ? width - indent : 1;
        std::vector<std::string> lines = wrapWords(item.body, available);
        if (lines.empty())
        {
            if (!item.marker.empty())
                out.push_back(item.marker);
            continue;
        }
        out.push_back(item.marker + lines.front());
        for (std::size_t i = 1; i < lines.size(); ++i)
            out.push_back(std::string(indent, ' ') + lines[i]);
    }
    return joinLines(out);
}

std::string wrapNonCode(std::string_view text, int width)
{
    if (width <= 0)
        return std::string(text);

    std::string result;
    result.reserve(text.size() + text.size() / 8);
    for (const TextRegion &region : splitFencedRegions(text))
    {
        if (region.fenced)
            result.append(region.text);
        else
            result.append(wrapProse(region.text, static_cast<std::size_t>(width)));
    }
    return result;
}

std::string collapseLongCode(std::string_view text, std::size_t minLines)
{
    std::string result;
    result.reserve(text.size() + 128);
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t open = text.find("```", pos);
        if (open == std::string_view::npos)
            break;
        std::size_t newline = text.find('\n', open + 3);
        if (newline == std::string_view::npos)
            break;
        std::size_t close = text.find("```", newline + 1);
        if (close == std::string_view::npos)
            break;
        std::size_t end = close + 3;

        std::string_view payload = text.substr(newline + 1, close - newline - 1);
        if (!payload.empty() && payload.back() == '\n')
            payload.remove_suffix(1);
        std::size_t lineCount = 0;
        if (!payload.empty())
            lineCount = 1 + static_cast<std::size_t>(std::count(payload.begin(), payload.end(), '\n'));

        result.append(text.substr(pos, open - pos));
        std::string_view fence = text.substr(open, end - open);
        if (lineCount < minLines)
        {
            result.append(fence);
            pos = end;
            continue;
        }

        std::string language(trimUnicode(text.substr(open + 3, newline - open - 3)));
        std::string summary = "View " + std::to_string(lineCount) + " lines";
        if (!language.empty())
            summary += " of " + language;
        result.append("<details>\n<summary>");
        result.append(summary);
        result.append("</summary>\n\n");
        result.append(fence);
        result.append("\n</details>\n");
        pos = end;
    }
    if (pos < text.size())
        result.append(text.substr(pos));
    return result;
}

} // namespace ef::forge
