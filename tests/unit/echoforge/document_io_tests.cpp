#include <gtest/gtest.h>

#include "document_io.hpp"

#include <cstdint>
#include <filesystem>
#include <random>

namespace
{

std::filesystem::path makeTempFilePath(const std::string &suffix)
{
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    return std::filesystem::temp_directory_path() / ("ef_document_io_" + std::to_string(dist(rng)) + suffix);
}

} // namespace

TEST(DocumentIo, WritesAndReadsBytesVerbatim)
{
    const auto path = makeTempFilePath(".md");
    const std::string contents = "caf\xC3\xA9\r\nline two\n\xFF";

    std::string error;
    ASSERT_TRUE(ef::forge::writeDocument(path, contents, error)) << error;

    std::string read;
    ASSERT_TRUE(ef::forge::readDocument(path, read, error)) << error;
    EXPECT_EQ(read, contents);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(DocumentIo, MissingInputIsReported)
{
    std::string contents;
    std::string error;
    EXPECT_FALSE(ef::forge::readDocument(makeTempFilePath(".html"), contents, error));
    EXPECT_NE(error.find("not found"), std::string::npos);
}

TEST(DocumentIo, UnwritableOutputIsReported)
{
    const auto path = makeTempFilePath("") / "missing-dir" / "out.txt";
    std::string error;
    EXPECT_FALSE(ef::forge::writeDocument(path, "text", error));
    EXPECT_FALSE(error.empty());
}
