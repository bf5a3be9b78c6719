#include "ef/forge/unicode_text.hpp"

#include "ef/forge/char_filter.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <cctype>
#include <cstdint>

namespace ef::forge
{

void appendUtf8(std::string &out, char32_t cp)
{
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = 0xFFFD;
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string normalizeNfc(std::string_view text)
{
    if (text.empty())
        return std::string();

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2 *nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status) || !nfc)
        return std::string(text);

    icu::UnicodeString source =
        icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    icu::UnicodeString composed = nfc->normalize(source, status);
    if (U_FAILURE(status))
        return std::string(text);

    std::string result;
    composed.toUTF8String(result);
    return result;
}

std::string filterCodePoints(std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    const auto *bytes = reinterpret_cast<const std::uint8_t *>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t offset = 0;
    while (offset < length)
    {
        const int32_t start = offset;
        UChar32 cp = 0;
        U8_NEXT(bytes, offset, length, cp);
        if (cp < 0 || !isAllowedCodePoint(static_cast<char32_t>(cp)))
        {
            result.push_back(' ');
            continue;
        }
        result.append(text.data() + start, static_cast<std::size_t>(offset - start));
    }
    return result;
}

bool isUnicodeWhitespace(char32_t cp) noexcept
{
    if (cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\f' || cp == U'\v')
        return true;
    if (cp > 0x10FFFF)
        return false;
    return u_isUWhiteSpace(static_cast<UChar32>(cp)) != 0;
}

bool isWordCodePoint(char32_t cp) noexcept
{
    if (cp < 0x80)
        return std::isalnum(static_cast<unsigned char>(cp)) != 0 || cp == U'_';
    if (cp > 0x10FFFF)
        return false;
    return (U_GET_GC_MASK(static_cast<UChar32>(cp)) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
}

char32_t codePointAt(std::string_view text, std::size_t offset) noexcept
{
    if (offset >= text.size())
        return 0;
    const auto *bytes = reinterpret_cast<const std::uint8_t *>(text.data());
    auto index = static_cast<int32_t>(offset);
    UChar32 cp = 0;
    U8_NEXT(bytes, index, static_cast<int32_t>(text.size()), cp);
    return cp < 0 ? char32_t{0xFFFD} : static_cast<char32_t>(cp);
}

char32_t codePointBefore(std::string_view text, std::size_t offset) noexcept
{
    if (offset == 0 || offset > text.size())
        return 0;
    const auto *bytes = reinterpret_cast<const std::uint8_t *>(text.data());
    auto index = static_cast<int32_t>(offset);
    UChar32 cp = 0;
    U8_PREV(bytes, 0, index, cp);
    return cp < 0 ? char32_t{0xFFFD} : static_cast<char32_t>(cp);
}

std::size_t nextCodePointOffset(std::string_view text, std::size_t offset) noexcept
{
    if (offset >= text.size())
        return text.size();
    const auto *bytes = reinterpret_cast<const std::uint8_t *>(text.data());
    auto index = static_cast<int32_t>(offset);
    UChar32 cp = 0;
    U8_NEXT(bytes, index, static_cast<int32_t>(text.size()), cp);
    (void)cp;
    return static_cast<std::size_t>(index);
}

bool isWordBoundary(std::string_view text, std::size_t offset) noexcept
{
    bool before = offset > 0 && isWordCodePoint(codePointBefore(text, offset));
    bool after = offset < text.size() && isWordCodePoint(codePointAt(text, offset));
    return before != after;
}

std::string_view trimUnicode(std::string_view text) noexcept
{
    std::size_t begin = 0;
    while (begin < text.size())
    {
        char32_t cp = codePointAt(text, begin);
        if (!isUnicodeWhitespace(cp))
            break;
        begin += static_cast<std::size_t>(U8_LENGTH(static_cast<UChar32>(cp)));
    }
    std::size_t end = text.size();
    while (end > begin)
    {
        char32_t cp = codePointBefore(text, end);
        if (!isUnicodeWhitespace(cp))
            break;
        end -= static_cast<std::size_t>(U8_LENGTH(static_cast<UChar32>(cp)));
    }
    return text.substr(begin, end - begin);
}

} // namespace ef::forge
