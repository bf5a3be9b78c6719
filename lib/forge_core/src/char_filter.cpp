#include "ef/forge/char_filter.hpp"

#include <unicode/uchar.h>

#include <algorithm>
#include <array>
#include <cstdint>

namespace ef::forge
{
namespace
{
struct CodePointRange
{
    char32_t first;
    char32_t last;
};

constexpr std::array<CodePointRange, 12> kEmojiRanges{{
    {0x1F600, 0x1F64F}, // emoticons
    {0x1F300, 0x1F5FF}, // symbols & pictographs
    {0x1F680, 0x1F6FF}, // transport & map
    {0x1F700, 0x1F77F}, // alchemical
    {0x1F780, 0x1F7FF}, // geometric shapes extended
    {0x1F800, 0x1F8FF}, // supplemental arrows-c
    {0x1F900, 0x1F9FF}, // supplemental symbols & pictographs
    {0x1FA70, 0x1FAFF}, // symbols & pictographs extended-a
    {0x2600, 0x26FF},   // misc symbols
    {0x2700, 0x27BF},   // dingbats
    {0x1F1E6, 0x1F1FF}, // regional indicators
    {0x1F3FB, 0x1F3FF}, // skin tones
}};

constexpr std::array<char32_t, 4> kEmojiJoiners{0x200D, 0xFE0E, 0xFE0F, 0x20E3};

// Arrows and dashes kept even where their category would drop them.
constexpr std::array<char32_t, 10> kExtraKeep{
    0x2192, 0x2190, 0x2194, 0x21A0, 0x21A9, 0x21D2, 0x21D4, 0x2013, 0x2014, 0x2015,
};

// Degree, per-mille, per-ten-mille.
constexpr std::array<char32_t, 3> kMathySymbols{0x00B0, 0x2030, 0x2031};

constexpr std::uint32_t kAllowedCategories = U_GC_L_MASK | U_GC_N_MASK | U_GC_P_MASK | U_GC_ZS_MASK |
                                             U_GC_SM_MASK | U_GC_SC_MASK;

template <std::size_t N>
bool contains(const std::array<char32_t, N> &set, char32_t cp) noexcept
{
    return std::find(set.begin(), set.end(), cp) != set.end();
}

} // namespace

bool isEmojiCodePoint(char32_t cp) noexcept
{
    return std::any_of(kEmojiRanges.begin(), kEmojiRanges.end(), [cp](const CodePointRange &range) {
        return cp >= range.first && cp <= range.last;
    });
}

bool isEmojiJoiner(char32_t cp) noexcept
{
    return contains(kEmojiJoiners, cp);
}

bool isAllowedCodePoint(char32_t cp) noexcept
{
    if (cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r')
        return true;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return false;
    if (contains(kExtraKeep, cp))
        return true;
    if (isEmojiJoiner(cp) || isEmojiCodePoint(cp))
        return true;
    if ((U_GET_GC_MASK(static_cast<UChar32>(cp)) & kAllowedCategories) != 0)
        return true;
    return contains(kMathySymbols, cp);
}

} // namespace ef::forge
