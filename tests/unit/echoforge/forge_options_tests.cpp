#include <gtest/gtest.h>

#include "forge_options.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>

namespace
{

std::filesystem::path makeTempFilePath()
{
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    return std::filesystem::temp_directory_path() / ("ef_forge_options_" + std::to_string(dist(rng)) + ".json");
}

} // namespace

TEST(ForgeOptions, RegisteredDefaultsMatchPipelineDefaults)
{
    ef::config::OptionRegistry registry("echoforge");
    ef::forge::registerForgeOptions(registry);

    ef::forge::ForgeOptions options = ef::forge::optionsFromRegistry(registry);
    EXPECT_FALSE(options.bySpeaker);
    EXPECT_FALSE(options.jsonl);
    EXPECT_TRUE(options.userLabel.empty());
    EXPECT_TRUE(options.markdown);
    EXPECT_FALSE(options.prettyMarkdown);
    EXPECT_EQ(options.maxWidth, 0);
    EXPECT_EQ(options.tocDepth, 0);
    EXPECT_EQ(options.title, "Chat Transcript");
    EXPECT_EQ(options.theme, ef::forge::Theme::Light);
    EXPECT_FALSE(options.obsidianLinks);
    EXPECT_FALSE(options.noToc);
    EXPECT_FALSE(options.noSignature);
}

TEST(ForgeOptions, RegistryValuesAreBoundAndClamped)
{
    ef::config::OptionRegistry registry("echoforge");
    ef::forge::registerForgeOptions(registry);

    registry.set(ef::forge::kOptionTocDepth, ef::config::OptionValue(std::int64_t{9}));
    registry.set(ef::forge::kOptionTheme, ef::config::OptionValue("obsidian"));
    registry.set(ef::forge::kOptionToc, ef::config::OptionValue(false));
    registry.set(ef::forge::kOptionSignature, ef::config::OptionValue(false));
    registry.set(ef::forge::kOptionUserLabel, ef::config::OptionValue("James"));

    ef::forge::ForgeOptions options = ef::forge::optionsFromRegistry(registry);
    EXPECT_EQ(options.tocDepth, 3);
    EXPECT_EQ(options.theme, ef::forge::Theme::Obsidian);
    EXPECT_TRUE(options.noToc);
    EXPECT_TRUE(options.noSignature);
    EXPECT_EQ(options.userLabel, "James");
}

TEST(ForgeOptions, LoadedFileOverridesDefaults)
{
    ef::config::OptionRegistry registry("echoforge");
    ef::forge::registerForgeOptions(registry);

    const auto path = makeTempFilePath();
    {
        std::ofstream out(path);
        out << R"({"bySpeaker": true, "maxWidth": 72, "theme": "neon", "unrelated": 1})";
    }
    ASSERT_TRUE(registry.loadFromFile(path));

    ef::forge::ForgeOptions options = ef::forge::optionsFromRegistry(registry);
    EXPECT_TRUE(options.bySpeaker);
    EXPECT_EQ(options.maxWidth, 72);
    EXPECT_EQ(options.theme, ef::forge::Theme::Light);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(ForgeOptions, StoreThenReadGivesTheSameOptions)
{
    ef::config::OptionRegistry registry("echoforge");
    ef::forge::registerForgeOptions(registry);

    ef::forge::ForgeOptions options;
    options.bySpeaker = true;
    options.prettyMarkdown = true;
    options.maxWidth = 80;
    options.tocDepth = 2;
    options.title = "Notes";
    options.theme = ef::forge::Theme::Auto;
    options.noSignature = true;
    ef::forge::storeForgeOptions(registry, options);

    ef::forge::ForgeOptions read = ef::forge::optionsFromRegistry(registry);
    EXPECT_TRUE(read.bySpeaker);
    EXPECT_TRUE(read.prettyMarkdown);
    EXPECT_EQ(read.maxWidth, 80);
    EXPECT_EQ(read.tocDepth, 2);
    EXPECT_EQ(read.title, "Notes");
    EXPECT_EQ(read.theme, ef::forge::Theme::Auto);
    EXPECT_TRUE(read.noSignature);
    EXPECT_FALSE(read.noToc);
}
