#include "ef/forge/html_sanitizer.hpp"

#include "ef/forge/html_entities.hpp"
#include "ef/forge/unicode_text.hpp"
#include "text_scan.hpp"

#include <array>
#include <cctype>
#include <optional>
#include <string>

namespace ef::forge
{
namespace
{
using namespace detail;

constexpr std::string_view kPlaceholderPrefix = "__EF_CODEBLOCK_";
constexpr std::string_view kPlaceholderSuffix = "__";

constexpr std::array<std::string_view, 16> kBreakerTags{
    "p", "br", "li", "div", "h1", "h2", "h3", "h4", "h5", "h6",
    "section", "article", "blockquote", "tr", "th", "td",
};

constexpr std::array<std::string_view, 8> kLayoutKeywords{
    "div", "span", "section", "article", "header", "footer", "main", "aside",
};

template <std::size_t N>
bool containsWord(const std::array<std::string_view, N> &words, std::string_view lowered) noexcept
{
    for (std::string_view word : words)
        if (word == lowered)
            return true;
    return false;
}

// Byte offset just past the run of word characters starting at pos.
std::size_t wordRunEnd(std::string_view text, std::size_t pos) noexcept
{
    while (pos < text.size())
    {
        if (!isWordCodePoint(codePointAt(text, pos)))
            break;
        pos = nextCodePointOffset(text, pos);
    }
    return pos;
}

// Matches "<name\b[^>]*>" at pos and returns the offset past '>', or npos.
std::size_t matchOpenTag(std::string_view text, std::size_t pos, std::string_view name) noexcept
{
    if (!startsWithIgnoreCaseAt(text, pos, "<") || !startsWithIgnoreCaseAt(text, pos + 1, name))
        return std::string_view::npos;
    std::size_t afterName = pos + 1 + name.size();
    if (afterName < text.size() && isWordCodePoint(codePointAt(text, afterName)))
        return std::string_view::npos;
    std::size_t close = text.find('>', afterName);
    if (close == std::string_view::npos)
        return std::string_view::npos;
    return close + 1;
}

std::optional<std::string> languageFromCodeTag(std::string_view tag)
{
    std::size_t pos = findIgnoreCase(tag, "language-");
    if (pos == std::string_view::npos)
        return std::nullopt;
    pos += 9;
    std::size_t end = pos;
    while (end < tag.size())
    {
        unsigned char ch = static_cast<unsigned char>(tag[end]);
        if (!std::isalnum(ch) && ch != '_' && ch != '+' && ch != '#' && ch != '.' && ch != '-')
            break;
        ++end;
    }
    if (end == pos)
        return std::nullopt;
    return toLowerAscii(tag.substr(pos, end - pos));
}

struct PreCodeMatch
{
    std::size_t end = 0;
    std::string_view codeTag;
    std::string_view payload;
};

std::optional<PreCodeMatch> matchPreCode(std::string_view html, std::size_t pos)
{
    std::size_t cursor = matchOpenTag(html, pos, "pre");
    if (cursor == std::string_view::npos)
        return std::nullopt;
    cursor = skipWhitespace(html, cursor);

    const std::size_t codeStart = cursor;
    std::size_t payloadStart = matchOpenTag(html, codeStart, "code");
    if (payloadStart == std::string_view::npos)
        return std::nullopt;

    std::size_t search = payloadStart;
    while (true)
    {
        std::size_t closeCode = findIgnoreCase(html, "</code>", search);
        if (closeCode == std::string_view::npos)
            return std::nullopt;
        std::size_t afterCode = skipWhitespace(html, closeCode + 7);
        if (startsWithIgnoreCaseAt(html, afterCode, "</pre>"))
        {
            PreCodeMatch match;
            match.end = afterCode + 6;
            match.codeTag = html.substr(codeStart, payloadStart - codeStart);
            match.payload = html.substr(payloadStart, closeCode - payloadStart);
            return match;
        }
        search = closeCode + 1;
    }
}

std::string normalizeLineEndings(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\r')
        {
            result.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            continue;
        }
        result.push_back(text[i]);
    }
    return result;
}

std::string collapseHorizontalRuns(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    bool inRun = false;
    for (char ch : text)
    {
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\f' || ch == '\v')
        {
            if (!inRun)
                result.push_back(' ');
            inRun = true;
            continue;
        }
        inRun = false;
        result.push_back(ch);
    }
    return result;
}

} // namespace

std::size_t CodeBlockArena::add(CodeBlock block)
{
    blocks.push_back(std::move(block));
    return blocks.size() - 1;
}

const CodeBlock *CodeBlockArena::find(std::size_t handle) const noexcept
{
    if (handle >= blocks.size())
        return nullptr;
    return &blocks[handle];
}

std::string CodeBlockArena::placeholder(std::size_t handle)
{
    return std::string(kPlaceholderPrefix) + std::to_string(handle) + std::string(kPlaceholderSuffix);
}

std::string CodeBlockArena::fence(const CodeBlock &block)
{
    std::string result = "```";
    if (block.language)
        result.append(*block.language);
    result.push_back('\n');
    result.append(block.content);
    result.append("\n```");
    return result;
}

std::string CodeBlockArena::resolve(std::string_view text) const
{
    std::string result;
    result.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t found = text.find(kPlaceholderPrefix, pos);
        if (found == std::string_view::npos)
        {
            result.append(text.substr(pos));
            break;
        }
        result.append(text.substr(pos, found - pos));

        std::size_t digits = found + kPlaceholderPrefix.size();
        std::size_t digitsEnd = digits;
        while (digitsEnd < text.size() && std::isdigit(static_cast<unsigned char>(text[digitsEnd])))
            ++digitsEnd;
        if (digitsEnd == digits || !startsWithAt(text, digitsEnd, kPlaceholderSuffix))
        {
            result.append(kPlaceholderPrefix);
            pos = digits;
            continue;
        }

        std::size_t tokenEnd = digitsEnd + kPlaceholderSuffix.size();
        const CodeBlock *block = nullptr;
        if (digitsEnd - digits < 10)
            block = find(static_cast<std::size_t>(std::stoull(std::string(text.substr(digits, digitsEnd - digits)))));
        if (block)
            result.append(fence(*block));
        else
            result.append(text.substr(found, tokenEnd - found));
        pos = tokenEnd;
    }
    return result;
}

std::string extractPreCodeBlocks(std::string_view html, CodeBlockArena &arena)
{
    std::string result;
    result.reserve(html.size());
    std::size_t pos = 0;
    std::size_t search = 0;
    while (true)
    {
        std::size_t open = findIgnoreCase(html, "<pre", search);
        if (open == std::string_view::npos)
            break;
        auto match = matchPreCode(html, open);
        if (!match)
        {
            search = open + 1;
            continue;
        }

        std::string payload = stripTags(match->payload);
        payload = decodeHtmlEntities(payload);
        payload = normalizeNfc(payload);
        payload = normalizeLineEndings(payload);

        CodeBlock block;
        block.language = languageFromCodeTag(match->codeTag);
        block.content = std::string(trimNewlines(payload));
        std::size_t handle = arena.add(std::move(block));

        result.append(html.substr(pos, open - pos));
        result.push_back('\n');
        result.append(CodeBlockArena::placeholder(handle));
        result.push_back('\n');
        pos = match->end;
        search = match->end;
    }
    result.append(html.substr(pos));
    return result;
}

std::string replaceBlockBreakers(std::string_view html)
{
    std::string result;
    result.reserve(html.size());
    std::size_t pos = 0;
    while (pos < html.size())
    {
        std::size_t lt = html.find('<', pos);
        if (lt == std::string_view::npos)
        {
            result.append(html.substr(pos));
            break;
        }
        result.append(html.substr(pos, lt - pos));

        std::size_t nameStart = lt + 1;
        if (nameStart < html.size() && html[nameStart] == '/')
            ++nameStart;
        std::size_t nameEnd = wordRunEnd(html, nameStart);
        if (nameEnd > nameStart && containsWord(kBreakerTags, toLowerAscii(html.substr(nameStart, nameEnd - nameStart))))
        {
            std::size_t close = html.find('>', nameEnd);
            if (close != std::string_view::npos)
            {
                result.push_back('\n');
                pos = close + 1;
                continue;
            }
        }
        result.push_back('<');
        pos = lt + 1;
    }
    return result;
}

std::string removeHiddenBlocks(std::string_view html)
{
    std::string result;
    result.reserve(html.size());
    std::size_t pos = 0;
    while (pos < html.size())
    {
        std::size_t lt = html.find('<', pos);
        if (lt == std::string_view::npos)
        {
            result.append(html.substr(pos));
            break;
        }
        result.append(html.substr(pos, lt - pos));

        std::size_t end = std::string_view::npos;
        if (startsWithAt(html, lt, "<!--"))
        {
            std::size_t close = html.find("-->", lt + 4);
            if (close != std::string_view::npos)
                end = close + 3;
        }
        else
        {
            for (std::string_view element : {std::string_view("script"), std::string_view("style")})
            {
                std::size_t bodyStart = matchOpenTag(html, lt, element);
                if (bodyStart == std::string_view::npos)
                    continue;
                std::string closeTag = "</" + std::string(element) + ">";
                std::size_t close = findIgnoreCase(html, closeTag, bodyStart);
                if (close != std::string_view::npos)
                    end = close + closeTag.size();
                break;
            }
        }

        if (end != std::string_view::npos)
        {
            pos = end;
            continue;
        }
        result.push_back('<');
        pos = lt + 1;
    }
    return result;
}

std::string stripTags(std::string_view html)
{
    std::string result;
    result.reserve(html.size());
    std::size_t pos = 0;
    while (pos < html.size())
    {
        std::size_t lt = html.find('<', pos);
        if (lt == std::string_view::npos)
        {
            result.append(html.substr(pos));
            break;
        }
        result.append(html.substr(pos, lt - pos));
        std::size_t close = std::string_view::npos;
        if (lt + 1 < html.size() && html[lt + 1] != '>')
            close = html.find('>', lt + 1);
        if (close == std::string_view::npos)
        {
            result.push_back('<');
            pos = lt + 1;
            continue;
        }
        pos = close + 1;
    }
    return result;
}

std::string replaceLayoutKeywords(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size())
    {
        if (!isWordCodePoint(codePointAt(text, pos)))
        {
            result.push_back(text[pos]);
            ++pos;
            continue;
        }
        std::size_t end = wordRunEnd(text, pos);
        std::string_view word = text.substr(pos, end - pos);
        if (word.size() <= 7 && containsWord(kLayoutKeywords, toLowerAscii(word)))
            result.push_back(' ');
        else
            result.append(word);
        pos = end;
    }
    return result;
}

std::string collapseWhitespacePreservingIndent(std::string_view text)
{
    std::string normalized = normalizeLineEndings(text);
    std::string_view view = normalized;
    if (!view.empty() && view.back() == '\n')
        view.remove_suffix(1);

    std::vector<std::string> lines;
    if (!normalized.empty())
    {
        for (std::string_view line : splitLines(view))
        {
            std::size_t indent = 0;
            while (indent < line.size() && isHorizontalSpace(line[indent]))
                ++indent;
            std::string collapsed(line.substr(0, indent));
            collapsed.append(collapseHorizontalRuns(line.substr(indent)));
            lines.push_back(std::move(collapsed));
        }
    }
    return joinLines(lines);
}

std::string cleanPlainText(std::string_view html)
{
    CodeBlockArena arena;
    std::string text = extractPreCodeBlocks(html, arena);

    text = replaceBlockBreakers(text);
    text = removeHiddenBlocks(text);
    text = stripTags(text);
    text = decodeHtmlEntities(text);
    text = normalizeNfc(text);
    text = replaceLayoutKeywords(text);
    text = filterCodePoints(text);
    text = collapseWhitespacePreservingIndent(text);
    text = collapseBlankLines(text);

    std::string trimmed(trimUnicode(text));
    return std::string(trimUnicode(arena.resolve(trimmed)));
}

} // namespace ef::forge
