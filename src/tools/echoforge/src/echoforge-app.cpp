#include "document_io.hpp"
#include "forge_options.hpp"

#include "ef/app_info.hpp"
#include "ef/forge/pipeline.hpp"
#include "ef/options.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace
{

const ef::appinfo::ToolInfo &toolInfo()
{
    return ef::appinfo::requireTool("echoforge");
}

void printUsage()
{
    const auto &info = toolInfo();
    std::cout << info.executable << " - " << info.shortDescription << "\n\n"
              << "Usage: " << info.usageSummary << "\n\n"
              << info.longDescription << "\n\n"
              << "  --by-speaker           Split into user/assistant turns\n"
              << "  --jsonl                One JSON object per turn (with --by-speaker)\n"
              << "  --user-label NAME      Display label for the user role\n"
              << "  --no-markdown          Do not rebuild fenced code blocks\n"
              << "  --pretty-md            Write a full Markdown document\n"
              << "  --max-width N          Wrap prose outside code at N columns (0 = off)\n"
              << "  --toc-depth N          0=off, 1=title, 2=+Turns, 3=+per turn\n"
              << "  --title TEXT           Markdown document title\n"
              << "  --theme NAME           light, dark, auto or obsidian\n"
              << "  --obsidian-links       Rewrite [text](#anchor) as [[#anchor|text]]\n"
              << "  --no-toc               Never write a table of contents\n"
              << "  --no-signature         Do not append the generator footer\n"
              << "  --load-options FILE    Load options from FILE\n"
              << "  --no-default-options   Do not load saved defaults\n"
              << "  --save-defaults        Save the effective options as defaults\n"
              << "  --clear-defaults       Remove the saved defaults\n"
              << "  --quiet                Do not report the written file\n"
              << "  --version              Print the version and exit\n"
              << "  --help                 Show this help message" << std::endl;
}

// Matches "--name VALUE" and "--name=VALUE". Returns false when arg is not
// this flag; reports a missing value through missing.
bool takeValue(const std::string &arg, const std::string &name, int argc, char **argv, int &index,
               std::string &value, bool &missing)
{
    const std::string prefix = name + "=";
    if (arg == name)
    {
        if (index + 1 >= argc)
        {
            missing = true;
            return true;
        }
        value = argv[++index];
        return true;
    }
    if (arg.rfind(prefix, 0) == 0)
    {
        value = arg.substr(prefix.size());
        return true;
    }
    return false;
}

std::optional<int> parseCount(const std::string &value)
{
    if (value.empty())
        return std::nullopt;
    std::int64_t parsed = 0;
    for (char ch : value)
    {
        if (ch < '0' || ch > '9')
            return std::nullopt;
        parsed = parsed * 10 + (ch - '0');
        if (parsed > 1000000)
            return std::nullopt;
    }
    return static_cast<int>(parsed);
}

} // namespace

int main(int argc, char **argv)
{
    using namespace ef;

    config::OptionRegistry registry("echoforge");
    forge::registerForgeOptions(registry);

    bool loadDefaults = true;
    bool saveDefaults = false;
    bool clearDefaults = false;
    bool quiet = false;
    std::vector<std::filesystem::path> optionFiles;
    std::vector<std::string> positional;

    std::optional<bool> bySpeaker;
    std::optional<bool> jsonl;
    std::optional<std::string> userLabel;
    std::optional<bool> markdown;
    std::optional<bool> prettyMarkdown;
    std::optional<int> maxWidth;
    std::optional<int> tocDepth;
    std::optional<std::string> title;
    std::optional<forge::Theme> theme;
    std::optional<bool> obsidianLinks;
    std::optional<bool> noToc;
    std::optional<bool> noSignature;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        std::string value;
        bool missing = false;

        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--version")
        {
            std::cout << appinfo::versionLabel() << std::endl;
            return 0;
        }
        else if (arg == "--by-speaker")
            bySpeaker = true;
        else if (arg == "--jsonl")
            jsonl = true;
        else if (arg == "--no-markdown")
            markdown = false;
        else if (arg == "--pretty-md")
            prettyMarkdown = true;
        else if (arg == "--obsidian-links")
            obsidianLinks = true;
        else if (arg == "--no-toc")
            noToc = true;
        else if (arg == "--no-signature")
            noSignature = true;
        else if (arg == "--no-default-options")
            loadDefaults = false;
        else if (arg == "--save-defaults")
            saveDefaults = true;
        else if (arg == "--clear-defaults")
            clearDefaults = true;
        else if (arg == "--quiet" || arg == "-q")
            quiet = true;
        else if (takeValue(arg, "--load-options", argc, argv, i, value, missing))
        {
            if (missing || value.empty())
            {
                std::cerr << "echoforge: --load-options requires a file path" << std::endl;
                return 1;
            }
            optionFiles.emplace_back(value);
        }
        else if (takeValue(arg, "--user-label", argc, argv, i, value, missing))
        {
            if (missing)
            {
                std::cerr << "echoforge: --user-label requires a name" << std::endl;
                return 1;
            }
            userLabel = value;
        }
        else if (takeValue(arg, "--title", argc, argv, i, value, missing))
        {
            if (missing)
            {
                std::cerr << "echoforge: --title requires a value" << std::endl;
                return 1;
            }
            title = value;
        }
        else if (takeValue(arg, "--max-width", argc, argv, i, value, missing) ||
                 takeValue(arg, "--toc-depth", argc, argv, i, value, missing))
        {
            const bool isWidth = arg.rfind("--max-width", 0) == 0;
            const char *flag = isWidth ? "--max-width" : "--toc-depth";
            if (missing)
            {
                std::cerr << "echoforge: " << flag << " requires a value" << std::endl;
                return 1;
            }
            auto parsed = parseCount(value);
            if (!parsed || (!isWidth && *parsed > 3))
            {
                std::cerr << "echoforge: invalid " << flag << " value '" << value << "'" << std::endl;
                return 1;
            }
            (isWidth ? maxWidth : tocDepth) = *parsed;
        }
        else if (takeValue(arg, "--theme", argc, argv, i, value, missing))
        {
            if (missing)
            {
                std::cerr << "echoforge: --theme requires a value" << std::endl;
                return 1;
            }
            theme = forge::themeFromName(value);
            if (!theme)
            {
                std::cerr << "echoforge: unknown theme '" << value << "' (expected light, dark, auto or obsidian)"
                          << std::endl;
                return 1;
            }
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            std::cerr << "echoforge: unknown option '" << arg << "'" << std::endl;
            return 1;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (clearDefaults)
    {
        if (!registry.clearDefaults())
        {
            std::cerr << "echoforge: failed to remove defaults '" << registry.defaultOptionsPath().string() << "'"
                      << std::endl;
            return 1;
        }
        // Without paths this is a maintenance run.
        if (positional.empty())
            return 0;
        loadDefaults = false;
    }

    if (positional.size() != 2)
    {
        std::cerr << "echoforge: expected INPUT and OUTPUT paths (see --help)" << std::endl;
        return 1;
    }

    std::error_code ec;
    if (loadDefaults && !registry.loadDefaults() && std::filesystem::exists(registry.defaultOptionsPath(), ec))
    {
        std::cerr << "echoforge: ignoring unreadable defaults '" << registry.defaultOptionsPath().string() << "'"
                  << std::endl;
    }
    for (const auto &file : optionFiles)
    {
        if (!registry.loadFromFile(file))
        {
            std::cerr << "echoforge: failed to load options from '" << file.string() << "'" << std::endl;
            return 1;
        }
    }

    forge::ForgeOptions options = forge::optionsFromRegistry(registry);
    if (bySpeaker)
        options.bySpeaker = *bySpeaker;
    if (jsonl)
        options.jsonl = *jsonl;
    if (userLabel)
        options.userLabel = *userLabel;
    if (markdown)
        options.markdown = *markdown;
    if (prettyMarkdown)
        options.prettyMarkdown = *prettyMarkdown;
    if (maxWidth)
        options.maxWidth = *maxWidth;
    if (tocDepth)
        options.tocDepth = *tocDepth;
    if (title)
        options.title = *title;
    if (theme)
        options.theme = *theme;
    if (obsidianLinks)
        options.obsidianLinks = *obsidianLinks;
    if (noToc)
        options.noToc = *noToc;
    if (noSignature)
        options.noSignature = *noSignature;

    if (saveDefaults)
    {
        forge::storeForgeOptions(registry, options);
        if (!registry.saveDefaults())
        {
            std::cerr << "echoforge: failed to save defaults to '" << registry.defaultOptionsPath().string() << "'"
                      << std::endl;
            return 1;
        }
    }

    if (options.jsonl && !options.bySpeaker)
        std::cerr << "echoforge: --jsonl needs --by-speaker; writing plain output" << std::endl;

    const std::filesystem::path inputPath(positional[0]);
    const std::filesystem::path outputPath(positional[1]);

    std::string document;
    std::string error;
    if (!forge::readDocument(inputPath, document, error))
    {
        std::cerr << "echoforge: " << error << std::endl;
        return 1;
    }

    const std::string output = forge::forgeDocument(document, options, outputPath.filename().string());
    if (!forge::writeDocument(outputPath, output, error))
    {
        std::cerr << "echoforge: " << error << std::endl;
        return 1;
    }

    if (!quiet)
        std::cout << "echoforge: wrote '" << outputPath.string() << "'" << std::endl;
    return 0;
}
