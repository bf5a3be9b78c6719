#include "ef/forge/speaker_segmenter.hpp"

#include "ef/forge/html_sanitizer.hpp"
#include "ef/forge/unicode_text.hpp"
#include "text_scan.hpp"

#include <array>

namespace ef::forge
{
namespace
{
using namespace detail;

constexpr std::string_view kRoleAttribute = "data-message-author-role=\"";

struct RoleMarker
{
    std::size_t offset = 0;
    SpeakerRole role = SpeakerRole::Unknown;
    std::string roleName;
};

std::vector<RoleMarker> findRoleMarkers(std::string_view html)
{
    std::vector<RoleMarker> markers;
    std::size_t pos = 0;
    while (true)
    {
        std::size_t found = findIgnoreCase(html, kRoleAttribute, pos);
        if (found == std::string_view::npos)
            break;
        std::size_t value = found + kRoleAttribute.size();
        for (std::string_view candidate : {std::string_view("user"), std::string_view("assistant")})
        {
            if (startsWithIgnoreCaseAt(html, value, candidate) && startsWithAt(html, value + candidate.size(), "\""))
            {
                markers.push_back(RoleMarker{found, speakerRoleFromName(candidate), std::string(candidate)});
                break;
            }
        }
        pos = found + 1;
    }
    return markers;
}

bool isAttributeNameChar(char ch) noexcept
{
    return !isAsciiSpace(ch) && ch != '"' && ch != '\'' && ch != '<' && ch != '>' && ch != '/' && ch != '=';
}

// Length of a noise attribute (name="value") starting at pos, or 0.
// keepClass spares class="..." (the language-X hint of a <code> tag).
std::size_t matchNoiseAttribute(std::string_view html, std::size_t pos, bool keepClass) noexcept
{
    std::size_t nameEnd = std::string_view::npos;
    if (startsWithAt(html, pos, "data-") || startsWithAt(html, pos, "aria-"))
    {
        std::size_t end = pos + 5;
        while (end < html.size() && isAttributeNameChar(html[end]))
            ++end;
        if (end > pos + 5)
            nameEnd = end;
    }
    else
    {
        constexpr std::array<std::string_view, 4> kPlainNames{"class", "dir", "id", "style"};
        for (std::string_view name : kPlainNames)
        {
            if (keepClass && name == "class")
                continue;
            if (startsWithAt(html, pos, name))
            {
                nameEnd = pos + name.size();
                break;
            }
        }
    }
    if (nameEnd == std::string_view::npos || !startsWithAt(html, nameEnd, "=\""))
        return 0;
    std::size_t closeQuote = html.find('"', nameEnd + 2);
    if (closeQuote == std::string_view::npos)
        return 0;
    return closeQuote + 1 - pos;
}

} // namespace

SpeakerRole speakerRoleFromName(std::string_view name) noexcept
{
    if (equalsIgnoreCase(name, "user"))
        return SpeakerRole::User;
    if (equalsIgnoreCase(name, "assistant"))
        return SpeakerRole::Assistant;
    if (equalsIgnoreCase(name, "unknown"))
        return SpeakerRole::Unknown;
    return SpeakerRole::Other;
}

std::string_view speakerRoleName(SpeakerRole role) noexcept
{
    switch (role)
    {
    case SpeakerRole::User:
        return "user";
    case SpeakerRole::Assistant:
        return "assistant";
    case SpeakerRole::Unknown:
        return "unknown";
    case SpeakerRole::Other:
        break;
    }
    return "other";
}

std::string stripAttributeNoise(std::string_view html)
{
    std::string result;
    result.reserve(html.size());
    std::size_t pos = 0;
    std::size_t lastMatchEnd = 0;
    bool inCodeTag = false;
    while (pos < html.size())
    {
        if (html[pos] == '<')
        {
            inCodeTag = startsWithIgnoreCaseAt(html, pos + 1, "code") &&
                        (pos + 5 >= html.size() || !isAttributeNameChar(html[pos + 5]));
        }
        else if (html[pos] == '>')
        {
            inCodeTag = false;
        }

        std::size_t length = isWordBoundary(html, pos) ? matchNoiseAttribute(html, pos, inCodeTag) : 0;
        if (length == 0)
        {
            result.push_back(html[pos]);
            ++pos;
            continue;
        }

        std::size_t spaceStart = pos;
        while (spaceStart > lastMatchEnd && isAsciiSpace(html[spaceStart - 1]))
            --spaceStart;
        result.resize(result.size() - (pos - spaceStart));
        pos += length;
        lastMatchEnd = pos;
    }
    return result;
}

std::vector<SpeakerTurn> segmentTranscript(std::string_view html)
{
    std::vector<RoleMarker> markers = findRoleMarkers(html);
    if (markers.empty())
        return {SpeakerTurn{SpeakerRole::Unknown, "unknown", cleanPlainText(html)}};

    std::vector<SpeakerTurn> turns;
    turns.reserve(markers.size());
    for (std::size_t i = 0; i < markers.size(); ++i)
    {
        std::size_t begin = markers[i].offset;
        std::size_t end = i + 1 < markers.size() ? markers[i + 1].offset : html.size();
        std::string_view chunk = html.substr(begin, end - begin);

        // Rest of the tag that carried the marker.
        std::size_t tagClose = chunk.find('>');
        if (tagClose != std::string_view::npos)
            chunk.remove_prefix(tagClose + 1);

        std::string text = cleanPlainText(stripAttributeNoise(chunk));
        std::string_view trimmed = trimUnicode(text);
        if (trimmed.empty())
            continue;
        turns.push_back(SpeakerTurn{markers[i].role, markers[i].roleName, std::string(trimmed)});
    }
    return turns;
}

} // namespace ef::forge
