#include <gtest/gtest.h>

#include "ef/app_info.hpp"

#include <stdexcept>

TEST(AppInfo, ListsTheForgeTool)
{
    auto tools = ef::appinfo::tools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools.front().id, "echoforge");
    EXPECT_EQ(tools.front().displayName, "EchoForge");
    EXPECT_FALSE(tools.front().usageSummary.empty());
}

TEST(AppInfo, RequireToolReturnsMatchingExecutable)
{
    const auto &info = ef::appinfo::requireTool("echoforge");
    EXPECT_EQ(info.executable, "echoforge");
    EXPECT_EQ(ef::appinfo::findTool("echoforge"), &info);
    EXPECT_FALSE(info.longDescription.empty());
}

TEST(AppInfo, RequireToolThrowsForUnknownId)
{
    EXPECT_EQ(ef::appinfo::findTool("ck-du"), nullptr);
    EXPECT_THROW(ef::appinfo::requireTool("does-not-exist"), std::runtime_error);
}

TEST(AppInfo, VersionLabelNamesProductAndVersion)
{
    EXPECT_EQ(ef::appinfo::kVersion, "1.1.7");
    EXPECT_EQ(ef::appinfo::versionLabel(), "EchoForge v1.1.7");
}
