#include "ef/app_info.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace ef::appinfo
{
    namespace
    {

        constexpr std::array<ToolInfo, 1> kTools{{
            ToolInfo{
                "echoforge",
                "echoforge",
                "EchoForge",
                "Forge chat transcript exports into clean text or polished Markdown.",
                "echoforge [options] INPUT OUTPUT",
                "EchoForge reads a saved chat transcript page (or text already copied out of one) and writes it back as plain text, one JSON object per speaker turn, or a themed Markdown document with headings, a table of contents and collapsible long code. Code pasted inside <pre><code> keeps its indentation, and code that lost its fences to a \"Copy code\" button is fenced again."},
        }};

    } // namespace

    std::span<const ToolInfo> tools() noexcept
    {
        return std::span<const ToolInfo>{kTools};
    }

    const ToolInfo *findTool(std::string_view id) noexcept
    {
        auto it = std::find_if(kTools.begin(), kTools.end(), [&](const ToolInfo &info)
                               { return info.id == id; });
        if (it == kTools.end())
            return nullptr;
        return &*it;
    }

    const ToolInfo &requireTool(std::string_view id)
    {
        if (const ToolInfo *info = findTool(id))
            return *info;
        throw std::runtime_error("Unknown tool id: " + std::string{id});
    }

    std::string versionLabel()
    {
        const ToolInfo &info = requireTool("echoforge");
        return std::string(info.displayName) + " v" + std::string(kVersion);
    }

} // namespace ef::appinfo
