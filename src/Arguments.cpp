#include "Arguments.hpp"

#include <map>

namespace
{

template <typename F>
auto translateIntParseError(F&& f, const std::string& value)
{
    try
    {
        return f(value);
    }
    catch (const std::invalid_argument&)
    {
        throw Arguments::Error{"expected an integer, got \"" + value + "\""};
    }
    catch (const std::out_of_range&)
    {
        throw Arguments::Error{"integer value " + value + " is out of range"};
    }
}

auto parseInt(const std::string& value) -> int
{
    auto end    = std::size_t{};
    auto result = translateIntParseError([&end](const std::string& value) { return std::stoi(value, &end, 10); },
                                         value);
    if (end != value.size())
        throw Arguments::Error{"expected an integer, got \"" + value + "\""};
    return result;
}

auto parseSize(const std::string& value) -> std::uint64_t
{
    if (value.empty() || value.front() == '-')
        throw Arguments::Error{"expected a non-negative integer, got \"" + value + "\""};

    auto end    = std::size_t{};
    auto result = translateIntParseError([&end](const std::string& value) { return std::stoull(value, &end, 10); },
                                         value);
    if (end != value.size())
        throw Arguments::Error{"expected an integer, got \"" + value + "\""};
    return result;
}

} // namespace

Arguments::Error::Error(const std::string& description)
: BaseError{"Arguments error", description}
{
}

Arguments::Arguments(int argc, const char* argv[])
: m_current{argv + 1}
, m_end{argv + argc}
{
    // parse arguments
    while (!finished())
        parseArgument();

    if (help || version || listFormats)
        return; // no further checks are needed for those options

    // check constraints on arguments
    if (!targetFile)
        throw Error{"TARGET_FILE parameter is missing"};
    if (!wordlistFile)
        throw Error{"WORDLIST_FILE parameter is missing"};

    if (jobs < 0)
        throw Error{"number of threads must not be negative, got " + std::to_string(jobs)};
    if (progressInterval.count() <= 0)
        throw Error{"progress interval must be positive, got " + std::to_string(progressInterval.count())};
}

auto Arguments::finished() const -> bool
{
    return m_current == m_end;
}

void Arguments::parseArgument()
{
    if (const auto str = std::string{*m_current}; str.size() < 2 || str.front() != '-')
    {
        ++m_current;
        parsePositional(str);
        return;
    }

    switch (readOption("an option"))
    {
    case Option::jobs:
        jobs = readInt("count");
        break;
    case Option::skip:
        skip = readSize("count");
        break;
    case Option::progressInterval:
        progressInterval = std::chrono::milliseconds{readInt("milliseconds")};
        break;
    case Option::listFormats:
        listFormats = true;
        break;
    case Option::version:
        version = true;
        break;
    case Option::help:
        help = true;
        break;
    }
}

void Arguments::parsePositional(const std::string& value)
{
    if (!targetFile)
        targetFile = value;
    else if (!wordlistFile)
        wordlistFile = value;
    else
        throw Error{"unexpected argument " + value};
}

auto Arguments::readString(const std::string& description) -> std::string
{
    if (finished())
        throw Error{"expected " + description + ", got nothing"};

    return *m_current++;
}

auto Arguments::readOption(const std::string& description) -> Arguments::Option
{
    // clang-format off
#define PAIR(string, option) {#string, Option::option}
#define PAIRS(short, long, option) PAIR(short, option), PAIR(long, option)

    static const auto stringToOption = std::map<std::string, Option>{
        PAIRS(-t, --threads,      jobs),
        PAIR (    --skip,         skip),
        PAIR (    --progress,     progressInterval),
        PAIR (    --list-formats, listFormats),
        PAIR (    --version,      version),
        PAIRS(-h, --help,         help),
    };
    // clang-format on

#undef PAIR
#undef PAIRS

    const auto str = readString(description);
    if (const auto it = stringToOption.find(str); it == stringToOption.end())
        throw Error{"unknown option " + str};
    else
        return it->second;
}

auto Arguments::readInt(const std::string& description) -> int
{
    return parseInt(readString(description));
}

auto Arguments::readSize(const std::string& description) -> std::uint64_t
{
    return parseSize(readString(description));
}
