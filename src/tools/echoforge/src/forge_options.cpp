#include "forge_options.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace ef::forge
{

void registerForgeOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionBySpeaker, config::OptionKind::Boolean, config::OptionValue(false), "Split By Speaker",
                             "Split the transcript into user and assistant turns."});
    registry.registerOption({kOptionJsonl, config::OptionKind::Boolean, config::OptionValue(false), "JSONL Output",
                             "Write one JSON object per turn (needs speaker splitting)."});
    registry.registerOption({kOptionUserLabel, config::OptionKind::String, config::OptionValue(std::string()),
                             "User Label", "Display label for the user role."});
    registry.registerOption({kOptionMarkdown, config::OptionKind::Boolean, config::OptionValue(true),
                             "Reconstruct Code Fences",
                             "Turn \"language / Copy code\" runs back into fenced code blocks."});
    registry.registerOption({kOptionPrettyMarkdown, config::OptionKind::Boolean, config::OptionValue(false),
                             "Pretty Markdown", "Write a full Markdown document with headings and a table of contents."});
    registry.registerOption({kOptionMaxWidth, config::OptionKind::Integer, config::OptionValue(std::int64_t{0}),
                             "Maximum Width", "Wrap prose outside code at this column (0 disables wrapping).",
                             std::int64_t{0}, std::int64_t{std::numeric_limits<int>::max()}});
    registry.registerOption({kOptionTocDepth, config::OptionKind::Integer, config::OptionValue(std::int64_t{0}),
                             "Table of Contents Depth", "0 = none, 1 = title, 2 = +Turns, 3 = +one entry per turn.",
                             std::int64_t{0}, std::int64_t{3}});
    registry.registerOption({kOptionTitle, config::OptionKind::String, config::OptionValue(std::string(kDefaultTitle)),
                             "Title", "Markdown document title."});
    registry.registerOption({kOptionTheme, config::OptionKind::Choice, config::OptionValue("light"), "Theme",
                             "Markdown theme: light, dark, auto or obsidian.", std::nullopt, std::nullopt,
                             {"light", "dark", "auto", "obsidian"}});
    registry.registerOption({kOptionObsidianLinks, config::OptionKind::Boolean, config::OptionValue(false),
                             "Obsidian Links", "Rewrite [text](#anchor) links as [[#anchor|text]]."});
    registry.registerOption({kOptionToc, config::OptionKind::Boolean, config::OptionValue(true), "Table of Contents",
                             "Allow the table of contents; off forces depth 0."});
    registry.registerOption({kOptionSignature, config::OptionKind::Boolean, config::OptionValue(true), "Signature",
                             "Append the generator footer to Markdown output."});
}

ForgeOptions optionsFromRegistry(const config::OptionRegistry &registry)
{
    ForgeOptions options;
    options.bySpeaker = registry.getBool(kOptionBySpeaker, options.bySpeaker);
    options.jsonl = registry.getBool(kOptionJsonl, options.jsonl);
    options.userLabel = registry.getString(kOptionUserLabel);
    options.markdown = registry.getBool(kOptionMarkdown, options.markdown);
    options.prettyMarkdown = registry.getBool(kOptionPrettyMarkdown, options.prettyMarkdown);
    options.maxWidth = static_cast<int>(registry.getInteger(kOptionMaxWidth));
    options.tocDepth = static_cast<int>(registry.getInteger(kOptionTocDepth));
    options.title = registry.getString(kOptionTitle, options.title);
    if (auto theme = themeFromName(registry.getString(kOptionTheme)))
        options.theme = *theme;
    options.obsidianLinks = registry.getBool(kOptionObsidianLinks, options.obsidianLinks);
    options.noToc = !registry.getBool(kOptionToc, true);
    options.noSignature = !registry.getBool(kOptionSignature, true);
    return options;
}

void storeForgeOptions(config::OptionRegistry &registry, const ForgeOptions &options)
{
    registry.set(kOptionBySpeaker, config::OptionValue(options.bySpeaker));
    registry.set(kOptionJsonl, config::OptionValue(options.jsonl));
    registry.set(kOptionUserLabel, config::OptionValue(options.userLabel));
    registry.set(kOptionMarkdown, config::OptionValue(options.markdown));
    registry.set(kOptionPrettyMarkdown, config::OptionValue(options.prettyMarkdown));
    registry.set(kOptionMaxWidth, config::OptionValue(static_cast<std::int64_t>(options.maxWidth)));
    registry.set(kOptionTocDepth, config::OptionValue(static_cast<std::int64_t>(options.tocDepth)));
    registry.set(kOptionTitle, config::OptionValue(options.title));
    registry.set(kOptionTheme, config::OptionValue(std::string(themeName(options.theme))));
    registry.set(kOptionObsidianLinks, config::OptionValue(options.obsidianLinks));
    registry.set(kOptionToc, config::OptionValue(!options.noToc));
    registry.set(kOptionSignature, config::OptionValue(!options.noSignature));
}

} // namespace ef::forge
