#include "file.hpp"

#include <filesystem>
#include <iterator>

FileError::FileError(const std::string& description)
: BaseError{"File error", description}
{
}

auto openInput(const std::string& filename) -> std::ifstream
{
    if (auto ec = std::error_code{}; std::filesystem::is_directory(filename, ec))
        throw FileError{"could not open input file " + filename + " (is a directory)"};

    if (auto is = std::ifstream{filename, std::ios::binary})
        return is;
    else
        throw FileError{"could not open input file " + filename};
}

auto loadStream(std::istream& is, std::size_t size) -> std::vector<std::uint8_t>
{
    auto content = std::vector<std::uint8_t>{};
    auto it      = std::istreambuf_iterator{is};
    for (auto i = std::size_t{}; i < size && it != std::istreambuf_iterator<char>{}; i++, ++it)
        content.push_back(*it);

    return content;
}

auto loadFile(const std::string& filename, std::size_t size) -> std::vector<std::uint8_t>
{
    auto is = openInput(filename);
    return loadStream(is, size);
}

auto loadText(const std::string& filename) -> std::string
{
    auto is = openInput(filename);
    return {std::istreambuf_iterator<char>{is}, std::istreambuf_iterator<char>{}};
}

auto getFileSize(const std::string& filename) -> std::uint64_t
{
    auto       ec   = std::error_code{};
    const auto size = std::filesystem::file_size(filename, ec);
    return ec ? 0 : size;
}
