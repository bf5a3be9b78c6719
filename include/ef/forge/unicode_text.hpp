#pragma once

#include <string>
#include <string_view>

namespace ef::forge
{

void appendUtf8(std::string &out, char32_t cp);

// Canonical composition (NFC). Ill-formed UTF-8 comes back with U+FFFD in
// place of the broken sequence.
std::string normalizeNfc(std::string_view text);

// Replaces every code point rejected by isAllowedCodePoint (and every
// ill-formed byte sequence) with a single ASCII space.
std::string filterCodePoints(std::string_view text);

bool isUnicodeWhitespace(char32_t cp) noexcept;

// Letters, digits and the underscore: what a regex engine treats as \w.
bool isWordCodePoint(char32_t cp) noexcept;

// Decodes the code point starting at / ending just before a byte offset.
// Returns U+FFFD for ill-formed input and 0 when out of range.
char32_t codePointAt(std::string_view text, std::size_t offset) noexcept;
char32_t codePointBefore(std::string_view text, std::size_t offset) noexcept;
std::size_t nextCodePointOffset(std::string_view text, std::size_t offset) noexcept;

// True when offset sits on a word boundary (\b).
bool isWordBoundary(std::string_view text, std::size_t offset) noexcept;

// Strips leading and trailing Unicode whitespace.
std::string_view trimUnicode(std::string_view text) noexcept;

} // namespace ef::forge
