#pragma once

#include <span>
#include <string>
#include <string_view>

namespace ef::appinfo
{

struct ToolInfo
{
    std::string_view id;
    std::string_view executable;
    std::string_view displayName;
    std::string_view shortDescription;
    std::string_view usageSummary;
    std::string_view longDescription;
};

inline constexpr std::string_view kVersion = "1.1.7";
inline constexpr std::string_view kProjectUrl = "https://github.com/noct-ml/echo-forge";
inline constexpr std::string_view kTagline = "Forging echoes into clarity.";

std::span<const ToolInfo> tools() noexcept;
const ToolInfo *findTool(std::string_view id) noexcept;
const ToolInfo &requireTool(std::string_view id);

// "EchoForge v1.1.7"
std::string versionLabel();

} // namespace ef::appinfo
