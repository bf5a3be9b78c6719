#pragma once

#include <span>
#include <string_view>

namespace ef::forge::detail
{

struct NamedEntity
{
    std::string_view name; // with its ';' unless it is a legacy unterminated form
    std::string_view text; // UTF-8
};

// Sorted by name. Legacy names ("amp", "copy", "eacute", ...) appear both with
// and without the ';'.
std::span<const NamedEntity> namedEntities() noexcept;

} // namespace ef::forge::detail
