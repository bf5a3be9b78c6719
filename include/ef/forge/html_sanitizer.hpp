#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ef::forge
{

struct CodeBlock
{
    std::optional<std::string> language;
    std::string content;
};

// Code blocks lifted out of a document while it is cleaned. The cleaned text
// refers to each block through a numbered placeholder line; resolve() swaps
// every placeholder back for its block as a fenced region. One arena per
// clean call.
class CodeBlockArena
{
public:
    std::size_t add(CodeBlock block);
    const CodeBlock *find(std::size_t handle) const noexcept;

    std::size_t size() const noexcept { return blocks.size(); }
    bool empty() const noexcept { return blocks.empty(); }

    static std::string placeholder(std::size_t handle);
    static std::string fence(const CodeBlock &block);

    // Placeholders with an unknown handle are left as they are.
    std::string resolve(std::string_view text) const;

private:
    std::vector<CodeBlock> blocks;
};

// Replaces every <pre><code>...</code></pre> region with a placeholder line
// and stores its payload (tags stripped, entities decoded, NFC, LF line
// endings, outer blank lines dropped) in the arena.
std::string extractPreCodeBlocks(std::string_view html, CodeBlockArena &arena);

// Block-level tags (p, br, li, div, h1-h6, section, article, blockquote,
// tr, th, td) become line breaks.
std::string replaceBlockBreakers(std::string_view html);

// Drops comments and script/style elements together with their contents.
std::string removeHiddenBlocks(std::string_view html);

std::string stripTags(std::string_view html);

// Stray layout keywords (div, span, section, ...) left behind by broken
// markup are blanked out as whole words.
std::string replaceLayoutKeywords(std::string_view text);

// Collapses horizontal whitespace runs to one space, except for the leading
// indentation of a line.
std::string collapseWhitespacePreservingIndent(std::string_view text);

// HTML-ish fragment to normalized plain text. Code from <pre><code> comes
// back fenced with its indentation intact.
std::string cleanPlainText(std::string_view html);

} // namespace ef::forge
