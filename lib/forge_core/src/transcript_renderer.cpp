#include "ef/forge/transcript_renderer.hpp"

#include "ef/app_info.hpp"
#include "ef/forge/code_fence.hpp"
#include "ef/forge/markdown_text.hpp"
#include "ef/forge/unicode_text.hpp"
#include "text_scan.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <nlohmann/json.hpp>

namespace ef::forge
{
namespace
{

struct ThemeEntry
{
    Theme theme;
    std::string_view name;
};

constexpr std::array<ThemeEntry, 4> kThemes{{
    {Theme::Light, "light"},
    {Theme::Dark, "dark"},
    {Theme::Auto, "auto"},
    {Theme::Obsidian, "obsidian"},
}};

constexpr std::string_view kDarkStyle = "<style>\n"
                                        "body { background-color: #0d1117; color: #c9d1d9; }\n"
                                        "code, pre { background-color: #161b22; color: #58a6ff; }\n"
                                        "a { color: #58a6ff; }\n"
                                        "h1, h2, h3, h4 { color: #e6edf3; }\n"
                                        "details > summary { cursor: pointer; }\n"
                                        "</style>\n";

constexpr std::string_view kAutoStyle = "<style>\n"
                                        "@media (prefers-color-scheme: dark) {\n"
                                        "  body { background-color: #0d1117; color: #c9d1d9; }\n"
                                        "  code, pre { background-color: #161b22; color: #58a6ff; }\n"
                                        "  a { color: #58a6ff; }\n"
                                        "  h1, h2, h3, h4 { color: #e6edf3; }\n"
                                        "  details > summary { cursor: pointer; }\n"
                                        "}\n"
                                        "</style>\n";

constexpr std::string_view kObsidianFrontMatter = "---\ncssclass: dark-theme\n---\n";

std::string titleCase(std::string_view word)
{
    std::string result;
    result.reserve(word.size());
    bool atWordStart = true;
    for (char ch : word)
    {
        unsigned char uch = static_cast<unsigned char>(ch);
        if (std::isalpha(uch))
        {
            result.push_back(static_cast<char>(atWordStart ? std::toupper(uch) : std::tolower(uch)));
            atWordStart = false;
        }
        else
        {
            result.push_back(ch);
            atWordStart = true;
        }
    }
    return result;
}

// Quoted JSON string; invalid UTF-8 becomes U+FFFD.
std::string jsonString(const std::string &value)
{
    return nlohmann::json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string tocLink(std::string_view label, Theme theme)
{
    if (theme == Theme::Obsidian)
        return obsidianHeadingLink(label, label);
    std::string link = "[";
    link.append(label);
    link.append("](#");
    link.append(markdownAnchor(label));
    link.push_back(')');
    return link;
}

} // namespace

std::optional<Theme> themeFromName(std::string_view name) noexcept
{
    for (const ThemeEntry &entry : kThemes)
    {
        if (entry.name == name)
            return entry.theme;
    }
    return std::nullopt;
}

std::string_view themeName(Theme theme) noexcept
{
    for (const ThemeEntry &entry : kThemes)
    {
        if (entry.theme == theme)
            return entry.name;
    }
    return "light";
}

std::string displayLabel(const SpeakerTurn &turn, std::string_view userLabel)
{
    if (turn.role == SpeakerRole::User && !userLabel.empty())
        return std::string(userLabel);
    if (turn.role == SpeakerRole::Assistant)
        return std::string(kAssistantLabel);
    std::string_view name = turn.roleName.empty() ? speakerRoleName(turn.role) : std::string_view(turn.roleName);
    return titleCase(name);
}

std::string turnHeading(std::size_t index, std::string_view label)
{
    char number[24];
    std::snprintf(number, sizeof(number), "%03zu", index);
    std::string heading = "Turn ";
    heading.append(number);
    heading.append(" \xE2\x80\x94 ");
    heading.append(label);
    return heading;
}

std::string prepareTurnText(std::string_view text, const RenderOptions &options)
{
    std::string prepared = options.codeMarkdown ? applyCodeMarkdown(text) : std::string(text);
    prepared = stripLabelArtifacts(prepared);
    if (options.obsidianLinks)
        prepared = rewriteHeadingLinksToObsidian(prepared);
    return prepared;
}

std::vector<LabeledTurn> labelTurns(const std::vector<SpeakerTurn> &turns, const RenderOptions &options)
{
    std::vector<LabeledTurn> labeled;
    labeled.reserve(turns.size());
    for (const SpeakerTurn &turn : turns)
        labeled.push_back(LabeledTurn{displayLabel(turn, options.userLabel), prepareTurnText(turn.text, options)});
    return labeled;
}

std::string renderJsonl(const std::vector<LabeledTurn> &turns)
{
    std::string out;
    for (const LabeledTurn &turn : turns)
    {
        out.append("{\"role\": ");
        out.append(jsonString(turn.label));
        out.append(", \"text\": ");
        out.append(jsonString(turn.text));
        out.append("}\n");
    }
    return out;
}

std::string renderTurnDelimited(const std::vector<LabeledTurn> &turns, int maxWidth)
{
    std::string out;
    char number[24];
    for (std::size_t i = 0; i < turns.size(); ++i)
    {
        std::snprintf(number, sizeof(number), "%03zu", i + 1);
        out.append("--- ");
        out.append(number);
        out.append(" [");
        out.append(turns[i].label);
        out.append("] ---\n");
        out.append(wrapNonCode(turns[i].text, maxWidth));
        out.append("\n\n");
    }
    return out;
}

std::string_view themeBlock(Theme theme) noexcept
{
    switch (theme)
    {
    case Theme::Dark:
        return kDarkStyle;
    case Theme::Auto:
        return kAutoStyle;
    case Theme::Obsidian:
        return kObsidianFrontMatter;
    case Theme::Light:
        break;
    }
    return {};
}

std::string signatureComment()
{
    return "<!-- Generated by " + appinfo::versionLabel() + " -->\n";
}

std::string footerSignature()
{
    std::string footer = "\n---\n> Generated by [";
    footer.append(appinfo::versionLabel());
    footer.append("](");
    footer.append(appinfo::kProjectUrl);
    footer.append(") \xE2\x80\x94 \"");
    footer.append(appinfo::kTagline);
    footer.append("\"\n");
    return footer;
}

std::string renderMarkdownDocument(const std::vector<SpeakerTurn> &turns, const RenderOptions &options)
{
    std::vector<std::string> parts;
    std::string_view theme = themeBlock(options.theme);
    if (!theme.empty())
        parts.emplace_back(theme);
    parts.push_back(signatureComment());
    parts.push_back("# " + options.title + "\n");

    std::vector<std::string> labels;
    labels.reserve(turns.size());
    for (const SpeakerTurn &turn : turns)
        labels.push_back(displayLabel(turn, options.userLabel));

    if (options.tocDepth > 0)
    {
        parts.emplace_back("## Table of Contents\n");
        parts.push_back("- " + tocLink(options.title, options.theme));
        if (options.tocDepth >= 2)
            parts.push_back("- " + tocLink("Turns", options.theme));
        if (options.tocDepth >= 3)
        {
            for (std::size_t i = 0; i < labels.size(); ++i)
                parts.push_back("  - " + tocLink(turnHeading(i + 1, labels[i]), options.theme));
        }
        parts.emplace_back();
    }

    if (options.tocDepth >= 2)
    {
        parts.emplace_back("## Turns");
        parts.emplace_back();
    }

    for (std::size_t i = 0; i < turns.size(); ++i)
    {
        parts.push_back("### " + turnHeading(i + 1, labels[i]));
        parts.emplace_back();
        parts.push_back(wrapNonCode(prepareTurnText(turns[i].text, options), options.maxWidth));
        parts.emplace_back();
    }

    std::string document(trimUnicode(detail::joinLines(parts)));
    document.push_back('\n');
    document = collapseLongCode(document);

    if (options.signature)
        document.append(footerSignature());
    return document;
}

} // namespace ef::forge
