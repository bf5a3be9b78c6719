#include "ef/forge/pipeline.hpp"

#include "ef/forge/html_sanitizer.hpp"
#include "ef/forge/markdown_text.hpp"
#include "ef/forge/speaker_segmenter.hpp"
#include "text_scan.hpp"

namespace ef::forge
{
namespace
{

std::vector<SpeakerTurn> collectTurns(std::string_view document, const ForgeOptions &options)
{
    if (options.bySpeaker)
        return segmentTranscript(document);
    return {SpeakerTurn{SpeakerRole::Unknown, std::string(speakerRoleName(SpeakerRole::Unknown)),
                        cleanPlainText(document)}};
}

} // namespace

bool isMarkdownDestination(std::string_view destinationName) noexcept
{
    constexpr std::string_view extension = ".md";
    if (destinationName.size() < extension.size())
        return false;
    return detail::equalsIgnoreCase(destinationName.substr(destinationName.size() - extension.size()), extension);
}

RenderOptions renderOptionsFor(const ForgeOptions &options)
{
    RenderOptions render;
    render.userLabel = options.userLabel;
    render.codeMarkdown = options.markdown;
    render.obsidianLinks = options.obsidianLinks;
    render.maxWidth = options.maxWidth;
    render.tocDepth = options.noToc ? 0 : options.tocDepth;
    render.title = options.title;
    render.theme = options.theme;
    render.signature = !options.noSignature;
    return render;
}

std::vector<LabeledTurn> forgeTurns(std::string_view document, const ForgeOptions &options)
{
    return labelTurns(collectTurns(document, options), renderOptionsFor(options));
}

std::string forgeDocument(std::string_view document, const ForgeOptions &options,
                          std::string_view destinationName)
{
    const RenderOptions render = renderOptionsFor(options);
    std::vector<SpeakerTurn> turns = collectTurns(document, options);

    if (options.prettyMarkdown && !(options.bySpeaker && options.jsonl))
        return renderMarkdownDocument(turns, render);

    std::string output;
    if (options.bySpeaker)
    {
        std::vector<LabeledTurn> labeled = labelTurns(turns, render);
        if (options.jsonl)
            return renderJsonl(labeled);
        output = renderTurnDelimited(labeled, render.maxWidth);
    }
    else
    {
        output = wrapNonCode(prepareTurnText(turns.front().text, render), render.maxWidth);
    }

    if (render.signature && isMarkdownDestination(destinationName))
        output.append(footerSignature());
    return output;
}

} // namespace ef::forge
