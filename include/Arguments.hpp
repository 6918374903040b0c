#ifndef BROOTFILE_ARGUMENTS_HPP
#define BROOTFILE_ARGUMENTS_HPP

#include "types.hpp"

#include <chrono>
#include <optional>

/// Parse and store arguments
class Arguments
{
public:
    /// Exception thrown if an argument is not valid
    class Error : public BaseError
    {
    public:
        /// Constructor
        Error(const std::string& description);
    };

    /// \brief Constructor parsing command line arguments
    /// \exception Error if an argument is not valid
    Arguments(int argc, const char* argv[]);

    /// File to unlock
    std::optional<std::string> targetFile;

    /// Newline-delimited file of password candidates
    std::optional<std::string> wordlistFile;

    /// Number of threads to use, 0 or 1 to try candidates sequentially on the main thread
    int jobs = 0;

    /// Number of candidates to skip at the beginning of the wordlist, to resume an interrupted attack
    std::uint64_t skip = 0;

    /// Interval between two progress lines
    std::chrono::milliseconds progressInterval{200};

    /// Tell whether to list supported formats and their availability
    bool listFormats = false;

    /// Tell whether version information is needed or not
    bool version = false;

    /// Tell whether help message is needed or not
    bool help = false;

private:
    const char**       m_current;
    const char** const m_end;

    bool finished() const;

    void parseArgument();
    void parsePositional(const std::string& value);

    enum class Option
    {
        jobs,
        skip,
        progressInterval,
        listFormats,
        version,
        help
    };

    std::string   readString(const std::string& description);
    Option        readOption(const std::string& description);
    int           readInt(const std::string& description);
    std::uint64_t readSize(const std::string& description);
};

#endif // BROOTFILE_ARGUMENTS_HPP
