#include <gtest/gtest.h>

#include "ef/options.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <optional>
#include <string>

namespace
{

std::filesystem::path makeTempFilePath()
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("ef_options_test_" + std::to_string(dist(rng)) + ".json");
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / "ef_options_test.json";
}

ef::config::OptionDefinition themeOption()
{
    return {"theme", ef::config::OptionKind::Choice, ef::config::OptionValue("light"), "Theme", "Colour theme",
            std::nullopt, std::nullopt, {"light", "dark"}};
}

// Points XDG_CONFIG_HOME at a scratch directory for the lifetime of the guard.
class ScopedConfigHome
{
public:
    ScopedConfigHome()
        : root(makeTempFilePath().replace_extension())
    {
        if (const char *current = std::getenv("XDG_CONFIG_HOME"))
            previous = current;
        ::setenv("XDG_CONFIG_HOME", root.c_str(), 1);
    }

    ~ScopedConfigHome()
    {
        if (previous)
            ::setenv("XDG_CONFIG_HOME", previous->c_str(), 1);
        else
            ::unsetenv("XDG_CONFIG_HOME");
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::filesystem::path root;

private:
    std::optional<std::string> previous;
};

} // namespace

TEST(OptionRegistry, RegistersAndReadsDefaults)
{
    ef::config::OptionRegistry registry("test-app");
    ef::config::OptionDefinition def{"featureEnabled", ef::config::OptionKind::Boolean, ef::config::OptionValue(true),
                                      "Feature Enabled", "Enables a feature for testing."};
    registry.registerOption(def);

    EXPECT_TRUE(registry.hasOption("featureEnabled"));
    EXPECT_TRUE(registry.getBool("featureEnabled"));

    registry.set("featureEnabled", ef::config::OptionValue(false));
    EXPECT_FALSE(registry.getBool("featureEnabled"));
    registry.reset("featureEnabled");
    EXPECT_TRUE(registry.getBool("featureEnabled"));
}

TEST(OptionRegistry, NormalizesValuesToDefinitionTypes)
{
    ef::config::OptionRegistry registry("test-app");
    registry.registerOption({"threshold", ef::config::OptionKind::Integer, ef::config::OptionValue(std::int64_t{10}),
                             "Threshold", "Integer threshold"});
    registry.registerOption({"ignored", ef::config::OptionKind::Boolean, ef::config::OptionValue(false),
                             "Ignored", "Boolean flag"});

    registry.set("threshold", ef::config::OptionValue(std::string("42")));
    registry.set("ignored", ef::config::OptionValue(std::string("yes")));

    EXPECT_EQ(registry.getInteger("threshold"), 42);
    EXPECT_TRUE(registry.getBool("ignored"));

    registry.set("threshold", ef::config::OptionValue(std::string("many")));
    EXPECT_EQ(registry.getInteger("threshold"), 10);
}

TEST(OptionRegistry, ClampsIntegersIntoRange)
{
    ef::config::OptionRegistry registry("test-app");
    registry.registerOption({"depth", ef::config::OptionKind::Integer, ef::config::OptionValue(std::int64_t{0}),
                             "Depth", "Bounded", std::int64_t{0}, std::int64_t{3}});

    registry.set("depth", ef::config::OptionValue(std::int64_t{7}));
    EXPECT_EQ(registry.getInteger("depth"), 3);
    registry.set("depth", ef::config::OptionValue(std::int64_t{-2}));
    EXPECT_EQ(registry.getInteger("depth"), 0);
}

TEST(OptionRegistry, ChoiceOutsideListFallsBackToDefault)
{
    ef::config::OptionRegistry registry("test-app");
    registry.registerOption(themeOption());

    registry.set("theme", ef::config::OptionValue("dark"));
    EXPECT_EQ(registry.getString("theme"), "dark");
    registry.set("theme", ef::config::OptionValue("sepia"));
    EXPECT_EQ(registry.getString("theme"), "light");
}

TEST(OptionRegistry, IgnoresUnknownKeys)
{
    ef::config::OptionRegistry registry("test-app");
    registry.set("missing", ef::config::OptionValue(true));
    EXPECT_FALSE(registry.hasOption("missing"));
    EXPECT_TRUE(registry.get("missing").isNull());
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    ef::config::OptionRegistry registry("test-app");
    registry.registerOption(themeOption());
    registry.registerOption({"width", ef::config::OptionKind::Integer, ef::config::OptionValue(std::int64_t{0}),
                             "Width", "Column width"});

    registry.set("theme", ef::config::OptionValue("dark"));
    registry.set("width", ef::config::OptionValue(std::int64_t{72}));

    const auto filePath = makeTempFilePath();
    ASSERT_TRUE(registry.saveToFile(filePath));

    ef::config::OptionRegistry loaded("test-app");
    loaded.registerOption(themeOption());
    loaded.registerOption({"width", ef::config::OptionKind::Integer, ef::config::OptionValue(std::int64_t{0}),
                           "Width", "Column width"});
    ASSERT_TRUE(loaded.loadFromFile(filePath));

    EXPECT_EQ(loaded.getString("theme"), "dark");
    EXPECT_EQ(loaded.getInteger("width"), 72);

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, MalformedFileLeavesValuesUntouched)
{
    ef::config::OptionRegistry registry("test-app");
    registry.registerOption(themeOption());
    registry.set("theme", ef::config::OptionValue("dark"));

    const auto filePath = makeTempFilePath();
    {
        std::ofstream out(filePath);
        out << "{ \"theme\": ";
    }
    EXPECT_FALSE(registry.loadFromFile(filePath));
    EXPECT_EQ(registry.getString("theme"), "dark");

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, DefaultsLiveUnderTheConfigRoot)
{
    ef::config::OptionRegistry registry("echoforge");
    auto path = registry.defaultOptionsPath();
    EXPECT_EQ(path.filename(), "defaults.json");
    EXPECT_EQ(path.parent_path().filename(), "echoforge");
    EXPECT_EQ(path.parent_path().parent_path(), ef::config::OptionRegistry::configRoot());
}

TEST(OptionRegistry, ClearDefaultsRemovesTheSavedFile)
{
    ScopedConfigHome home;
    ef::config::OptionRegistry registry("echoforge");
    registry.registerOption(themeOption());
    registry.set("theme", ef::config::OptionValue("dark"));

    ASSERT_TRUE(registry.saveDefaults());
    EXPECT_EQ(registry.defaultOptionsPath().string().rfind(home.root.string(), 0), 0u);
    EXPECT_TRUE(std::filesystem::exists(registry.defaultOptionsPath()));

    EXPECT_TRUE(registry.clearDefaults());
    EXPECT_FALSE(std::filesystem::exists(registry.defaultOptionsPath()));

    ef::config::OptionRegistry fresh("echoforge");
    fresh.registerOption(themeOption());
    EXPECT_FALSE(fresh.loadDefaults());
    EXPECT_EQ(fresh.getString("theme"), "light");

    // Nothing left to remove is still a success.
    EXPECT_TRUE(registry.clearDefaults());
}
