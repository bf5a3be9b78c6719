#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ef::forge
{

enum class SpeakerRole
{
    User,
    Assistant,
    Unknown,
    Other,
};

struct SpeakerTurn
{
    SpeakerRole role = SpeakerRole::Unknown;
    std::string roleName; // lowercase, as found in the document
    std::string text;
};

SpeakerRole speakerRoleFromName(std::string_view name) noexcept;
std::string_view speakerRoleName(SpeakerRole role) noexcept;

// Removes data-*, aria-*, class, dir, id and style attributes (with the
// whitespace in front of them) from an HTML fragment. The class of a <code>
// tag is kept so its language-X hint survives.
std::string stripAttributeNoise(std::string_view html);

// Splits an export into turns at each data-message-author-role="user" or
// "assistant" marker, in document order. Turns that clean to nothing are
// dropped. Without any marker the whole document is one Unknown turn.
std::vector<SpeakerTurn> segmentTranscript(std::string_view html);

} // namespace ef::forge
