#ifndef BROOTFILE_FILE_HPP
#define BROOTFILE_FILE_HPP

/// \file file.hpp
/// \brief Opening target and wordlist files and loading their content

#include "types.hpp"

#include <fstream>
#include <limits>

/// Exception thrown if a file cannot be opened or read
class FileError : public BaseError
{
public:
    /// Constructor
    explicit FileError(const std::string& description);
};

/// \brief Open an input file stream in binary mode
/// \exception FileError if the file cannot be opened or is a directory
auto openInput(const std::string& filename) -> std::ifstream;

/// Load at most \a size bytes from an input stream
auto loadStream(std::istream& is, std::size_t size) -> std::vector<std::uint8_t>;

/// \brief Load at most \a size bytes from a file
/// \exception FileError if the file cannot be opened
auto loadFile(const std::string& filename, std::size_t size = std::numeric_limits<std::size_t>::max())
    -> std::vector<std::uint8_t>;

/// \brief Load a whole file as text, without any conversion
/// \exception FileError if the file cannot be opened
auto loadText(const std::string& filename) -> std::string;

/// \return the size of a file in bytes, or 0 if it cannot be queried
auto getFileSize(const std::string& filename) -> std::uint64_t;

#endif // BROOTFILE_FILE_HPP
