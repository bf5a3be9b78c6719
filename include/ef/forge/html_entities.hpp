#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ef::forge
{

// UTF-8 text of a named character reference ("amp" -> "&"), if known.
std::optional<std::string_view> lookupNamedEntity(std::string_view name);

// Decodes named and numeric character references the way HTML5 parsers do:
// the full named-reference set, legacy names such as "&copy" also without a
// ';'. Unknown names are kept verbatim; numeric references outside the
// Unicode range, surrogates and NUL decode to U+FFFD, C1 values use their
// windows-1252 meaning, other controls and noncharacters are dropped.
std::string decodeHtmlEntities(std::string_view text);

} // namespace ef::forge
