#pragma once

#include "ef/forge/pipeline.hpp"
#include "ef/options.hpp"

namespace ef::forge
{

inline constexpr char kOptionBySpeaker[] = "bySpeaker";
inline constexpr char kOptionJsonl[] = "jsonl";
inline constexpr char kOptionUserLabel[] = "userLabel";
inline constexpr char kOptionMarkdown[] = "markdown";
inline constexpr char kOptionPrettyMarkdown[] = "prettyMarkdown";
inline constexpr char kOptionMaxWidth[] = "maxWidth";
inline constexpr char kOptionTocDepth[] = "tocDepth";
inline constexpr char kOptionTitle[] = "title";
inline constexpr char kOptionTheme[] = "theme";
inline constexpr char kOptionObsidianLinks[] = "obsidianLinks";
inline constexpr char kOptionToc[] = "toc";
inline constexpr char kOptionSignature[] = "signature";

void registerForgeOptions(config::OptionRegistry &registry);

ForgeOptions optionsFromRegistry(const config::OptionRegistry &registry);

// Writes every field of options back into the registry.
void storeForgeOptions(config::OptionRegistry &registry, const ForgeOptions &options);

} // namespace ef::forge
