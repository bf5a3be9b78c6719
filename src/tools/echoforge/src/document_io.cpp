#include "document_io.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace ef::forge
{

bool readDocument(const std::filesystem::path &path, std::string &contents, std::string &error)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        error = "input file not found: " + path.string();
        return false;
    }
    if (std::filesystem::is_directory(path, ec))
    {
        error = "input is a directory: " + path.string();
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        error = "cannot open input file: " + path.string();
        return false;
    }
    contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        error = "failed to read input file: " + path.string();
        return false;
    }
    return true;
}

bool writeDocument(const std::filesystem::path &path, std::string_view contents, std::string &error)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        error = "cannot open output file: " + path.string();
        return false;
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out)
    {
        error = "failed to write output file: " + path.string();
        return false;
    }
    return true;
}

} // namespace ef::forge
