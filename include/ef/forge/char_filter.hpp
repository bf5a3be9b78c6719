#pragma once

namespace ef::forge
{

// Code points from the emoji blocks (faces, pictographs, transport, dingbats,
// flags, skin-tone modifiers).
bool isEmojiCodePoint(char32_t cp) noexcept;

// Joiners that glue emoji sequences together: ZWJ, variation selectors and
// the keycap combiner.
bool isEmojiJoiner(char32_t cp) noexcept;

// True when the code point survives sanitization. Total over the whole
// code point range; anything outside it (and surrogates) is rejected.
bool isAllowedCodePoint(char32_t cp) noexcept;

} // namespace ef::forge
