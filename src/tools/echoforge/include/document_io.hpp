#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ef::forge
{

// Reads the whole file as bytes. On failure returns false and explains why
// in error.
bool readDocument(const std::filesystem::path &path, std::string &contents, std::string &error);

// Replaces the file with contents in one write.
bool writeDocument(const std::filesystem::path &path, std::string_view contents, std::string &error);

} // namespace ef::forge
