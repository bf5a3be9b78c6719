#include "ef/forge/html_entities.hpp"

#include "ef/forge/unicode_text.hpp"
#include "html_entity_table.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

namespace ef::forge
{
namespace
{
using detail::NamedEntity;

// windows-1252 meaning of the C1 range, as browsers decode &#128; .. &#159;.
constexpr std::array<char32_t, 32> kWindows1252C1{
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021, 0x02C6, 0x2030, 0x0160,
    0x2039, 0x0152, 0x008D, 0x017D, 0x008F, 0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022,
    0x2013, 0x2014, 0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178,
};

constexpr std::size_t kMaxEntityNameLength = 32;

// Control characters and noncharacters are dropped.
bool isDroppedReference(char32_t cp) noexcept
{
    return (cp >= 0x01 && cp <= 0x08) || cp == 0x0B || (cp >= 0x0E && cp <= 0x1F) || cp == 0x7F ||
           (cp >= 0xFDD0 && cp <= 0xFDEF) || (cp & 0xFFFE) == 0xFFFE;
}

bool isNameTerminator(char ch) noexcept
{
    return ch == '\t' || ch == '\n' || ch == '\f' || ch == ' ' || ch == '<' || ch == '&' || ch == '#' || ch == ';';
}

const NamedEntity *findEntity(std::string_view name) noexcept
{
    auto table = detail::namedEntities();
    auto it = std::lower_bound(table.begin(), table.end(), name,
                               [](const NamedEntity &entry, std::string_view key) { return entry.name < key; });
    if (it == table.end() || it->name != name)
        return nullptr;
    return &*it;
}

// Decodes the named reference after text[pos] == '&'. A name that is not
// known as a whole may still start with a legacy unterminated name
// ("&copy2024"); the longest such prefix wins. Returns the bytes consumed.
std::size_t decodeNamedReference(std::string_view text, std::size_t pos, std::string &out)
{
    std::size_t end = pos + 1;
    while (end < text.size() && end - pos - 1 < kMaxEntityNameLength && !isNameTerminator(text[end]))
        ++end;
    if (end == pos + 1)
        return 0;
    if (end < text.size() && text[end] == ';')
        ++end;

    std::string_view name = text.substr(pos + 1, end - pos - 1);
    if (const NamedEntity *entity = findEntity(name))
    {
        out.append(entity->text);
        return end - pos;
    }
    for (std::size_t length = name.size() - 1; length >= 2; --length)
    {
        if (const NamedEntity *entity = findEntity(name.substr(0, length)))
        {
            out.append(entity->text);
            return length + 1;
        }
    }
    return 0;
}

// Parses "&#..." starting at text[pos] == '&'. Returns the number of bytes
// consumed, or 0 when the reference is not numeric.
std::size_t decodeNumericReference(std::string_view text, std::size_t pos, std::string &out)
{
    std::size_t cursor = pos + 2;
    bool hex = false;
    if (cursor < text.size() && (text[cursor] == 'x' || text[cursor] == 'X'))
    {
        hex = true;
        ++cursor;
    }

    const std::size_t digitsStart = cursor;
    std::uint32_t value = 0;
    bool overflow = false;
    while (cursor < text.size())
    {
        unsigned char ch = static_cast<unsigned char>(text[cursor]);
        int digit = -1;
        if (std::isdigit(ch))
            digit = ch - '0';
        else if (hex && std::isxdigit(ch))
            digit = std::tolower(ch) - 'a' + 10;
        if (digit < 0)
            break;
        if (!overflow)
        {
            value = value * (hex ? 16u : 10u) + static_cast<std::uint32_t>(digit);
            if (value > 0x10FFFF)
                overflow = true;
        }
        ++cursor;
    }
    if (cursor == digitsStart)
        return 0;
    if (cursor < text.size() && text[cursor] == ';')
        ++cursor;

    char32_t cp = overflow ? 0x110000 : static_cast<char32_t>(value);
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        appendUtf8(out, 0xFFFD);
    else if (cp >= 0x80 && cp <= 0x9F)
        appendUtf8(out, kWindows1252C1[cp - 0x80]);
    else if (!isDroppedReference(cp))
        appendUtf8(out, cp);
    return cursor - pos;
}

} // namespace

std::optional<std::string_view> lookupNamedEntity(std::string_view name)
{
    const NamedEntity *entity = findEntity(std::string(name) + ";");
    if (entity == nullptr)
        return std::nullopt;
    return entity->text;
}

std::string decodeHtmlEntities(std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t amp = text.find('&', pos);
        if (amp == std::string_view::npos)
        {
            result.append(text.substr(pos));
            break;
        }
        result.append(text.substr(pos, amp - pos));
        pos = amp;

        if (amp + 1 < text.size() && text[amp + 1] == '#')
        {
            std::size_t consumed = decodeNumericReference(text, amp, result);
            if (consumed > 0)
            {
                pos += consumed;
                continue;
            }
        }
        else
        {
            std::size_t consumed = decodeNamedReference(text, amp, result);
            if (consumed > 0)
            {
                pos += consumed;
                continue;
            }
        }

        result.push_back('&');
        ++pos;
    }
    return result;
}

} // namespace ef::forge
