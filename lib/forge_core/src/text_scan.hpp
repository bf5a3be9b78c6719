#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace ef::forge::detail
{

inline bool isAsciiSpace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

inline bool isHorizontalSpace(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

inline char lowerAscii(char ch) noexcept
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

inline std::string toLowerAscii(std::string_view view)
{
    std::string result(view.begin(), view.end());
    for (char &ch : result)
        ch = lowerAscii(ch);
    return result;
}

inline bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (lowerAscii(a[i]) != lowerAscii(b[i]))
            return false;
    return true;
}

inline bool startsWithAt(std::string_view text, std::size_t pos, std::string_view prefix) noexcept
{
    return pos <= text.size() && text.size() - pos >= prefix.size() && text.compare(pos, prefix.size(), prefix) == 0;
}

inline bool startsWithIgnoreCaseAt(std::string_view text, std::size_t pos, std::string_view prefix) noexcept
{
    if (pos > text.size() || text.size() - pos < prefix.size())
        return false;
    return equalsIgnoreCase(text.substr(pos, prefix.size()), prefix);
}

inline std::size_t findIgnoreCase(std::string_view text, std::string_view needle, std::size_t from = 0) noexcept
{
    if (needle.empty())
        return from <= text.size() ? from : std::string_view::npos;
    const char first = lowerAscii(needle.front());
    for (std::size_t pos = from; pos + needle.size() <= text.size(); ++pos)
    {
        if (lowerAscii(text[pos]) == first && startsWithIgnoreCaseAt(text, pos, needle))
            return pos;
    }
    return std::string_view::npos;
}

inline std::size_t skipWhitespace(std::string_view text, std::size_t pos) noexcept
{
    while (pos < text.size() && isAsciiSpace(text[pos]))
        ++pos;
    return pos;
}

inline std::string_view trimNewlines(std::string_view view) noexcept
{
    while (!view.empty() && view.front() == '\n')
        view.remove_prefix(1);
    while (!view.empty() && view.back() == '\n')
        view.remove_suffix(1);
    return view;
}

inline std::string_view trimTrailingNewlines(std::string_view view) noexcept
{
    while (!view.empty() && view.back() == '\n')
        view.remove_suffix(1);
    return view;
}

// Splits on '\n' only; a trailing newline yields a trailing empty line.
inline std::vector<std::string_view> splitLines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t offset = 0;
    while (true)
    {
        std::size_t end = text.find('\n', offset);
        if (end == std::string_view::npos)
        {
            lines.push_back(text.substr(offset));
            break;
        }
        lines.push_back(text.substr(offset, end - offset));
        offset = end + 1;
    }
    return lines;
}

inline std::string joinLines(const std::vector<std::string> &lines, std::string_view separator = "\n")
{
    std::string result;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            result.append(separator);
        result.append(lines[i]);
    }
    return result;
}

// Runs of three or more newlines become exactly one blank line.
inline std::string collapseBlankLines(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    std::size_t run = 0;
    for (char ch : text)
    {
        if (ch == '\n')
        {
            ++run;
            if (run <= 2)
                result.push_back(ch);
            continue;
        }
        run = 0;
        result.push_back(ch);
    }
    return result;
}

} // namespace ef::forge::detail
