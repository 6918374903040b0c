#include "ToolValidator.hpp"

#include "SshKeyValidator.hpp"
#include "file.hpp"

#include <algorithm>

ToolValidator::ToolValidator(std::string tool)
: m_tool{std::move(tool)}
{
}

auto ToolValidator::attempt(const std::string& candidate, const Target& target) const -> bool
{
    const auto result = runProcess(m_tool, getArguments(candidate, target), getInput(candidate));

    if (result.signal)
        throw TransientError{m_tool + " was killed by signal " + std::to_string(result.signal)};
    if (result.exitCode == execFailureExitCode)
        throw StructuralError{"could not execute " + m_tool};

    return interpret(result, target);
}

auto ToolValidator::getInput(const std::string&) const -> std::string
{
    return {};
}

auto ToolValidator::contains(const std::string& output, std::initializer_list<const char*> markers) -> bool
{
    return std::any_of(markers.begin(), markers.end(),
                       [&output](const char* marker) { return output.find(marker) != std::string::npos; });
}

auto ToolValidator::lastLine(const std::string& output) -> std::string
{
    const auto end = output.find_last_not_of(" \t\r\n");
    if (end == std::string::npos)
        return "no output";

    const auto newline = output.find_last_of('\n', end);
    const auto begin   = newline == std::string::npos ? 0 : newline + 1;
    return output.substr(begin, end + 1 - begin);
}

auto KeepassValidator::getArguments(const std::string&, const Target& target) const -> std::vector<std::string>
{
    return {"db-info", "-q", target.getPath()};
}

auto KeepassValidator::getInput(const std::string& candidate) const -> std::string
{
    return candidate + '\n';
}

auto KeepassValidator::interpret(const ProcessResult& result, const Target& target) const -> bool
{
    if (result.exitCode == 0)
        return true;
    if (contains(result.output, {"Invalid credentials", "Wrong key", "HMAC mismatch"}))
        return false;
    if (contains(result.output, {"does not exist", "Not a KeePass database", "Unsupported KeePass"}))
        throw StructuralError{target.getPath() + ": " + lastLine(result.output)};

    throw TransientError{getTool() + ": " + lastLine(result.output)};
}

auto RarValidator::getArguments(const std::string& candidate, const Target& target) const -> std::vector<std::string>
{
    return {"t", "-p" + candidate, "-inul", "-y", target.getPath()};
}

auto RarValidator::interpret(const ProcessResult& result, const Target& target) const -> bool
{
    // clang-format off
    switch (result.exitCode)
    {
    case 0:  return true;
    case 3:  // checksum error, wrong password for an archive without encrypted headers
    case 11: return false; // bad password
    case 2:  // fatal error
    case 6:  // open error
    case 7:  // wrong command line
    case 10: throw StructuralError{target.getPath() + ": unrar exited with status " + std::to_string(result.exitCode)};
    default: throw TransientError{"unrar exited with status " + std::to_string(result.exitCode)};
    }
    // clang-format on
}

auto SevenZipValidator::getArguments(const std::string& candidate, const Target& target) const
    -> std::vector<std::string>
{
    return {"t", "-p" + candidate, "-y", "-bd", target.getPath()};
}

auto SevenZipValidator::interpret(const ProcessResult& result, const Target& target) const -> bool
{
    if (result.exitCode == 0)
        return true;

    if (result.exitCode == 2)
    {
        if (contains(result.output, {"Wrong password", "Data Error in encrypted", "CRC Failed in encrypted"}))
            return false;
        if (contains(result.output, {"Can not open the file as archive", "Cannot open the file as archive",
                                     "Is not archive", "cannot find the file", "Unexpected end of archive"}))
            throw StructuralError{target.getPath() + ": " + lastLine(result.output)};
        return false;
    }

    if (result.exitCode == 7)
        throw StructuralError{getTool() + ": " + lastLine(result.output)};

    throw TransientError{getTool() + " exited with status " + std::to_string(result.exitCode)};
}

auto PdfValidator::getArguments(const std::string& candidate, const Target& target) const -> std::vector<std::string>
{
    return {"--password=" + candidate, "--show-npages", target.getPath()};
}

auto PdfValidator::interpret(const ProcessResult& result, const Target& target) const -> bool
{
    // exit status 3 means the document was opened with warnings
    if (result.exitCode == 0 || result.exitCode == 3)
        return true;
    if (result.exitCode == 2)
    {
        if (contains(result.output, {"invalid password"}))
            return false;
        throw StructuralError{target.getPath() + ": " + lastLine(result.output)};
    }

    throw TransientError{getTool() + " exited with status " + std::to_string(result.exitCode)};
}

auto OfficeValidator::getArguments(const std::string& candidate, const Target& target) const
    -> std::vector<std::string>
{
    // attached to the option so that a candidate starting with '-' is not parsed as an option
    return {"--password=" + candidate, target.getPath(), "/dev/null"};
}

auto OfficeValidator::interpret(const ProcessResult& result, const Target& target) const -> bool
{
    if (result.exitCode == 0)
        return true;
    if (contains(result.output, {"InvalidKeyError", "verification failed", "Failed to verify", "could not be decrypted"}))
        return false;
    if (contains(result.output,
                 {"not encrypted", "FileFormatError", "Unsupported", "not an OLE", "No such file"}))
        throw StructuralError{target.getPath() + ": " + lastLine(result.output)};

    throw TransientError{getTool() + " exited with status " + std::to_string(result.exitCode) + ": " +
                         lastLine(result.output)};
}

OpenSshKeyValidator::OpenSshKeyValidator(std::string tool, const Target& target)
: ToolValidator{std::move(tool)}
{
    if (getOpenSshCipher(loadText(target.getPath())) == "none")
        throw StructuralError{target.getPath() + " is not encrypted"};
}

auto OpenSshKeyValidator::getArguments(const std::string& candidate, const Target& target) const
    -> std::vector<std::string>
{
    return {"-y", "-P", candidate, "-f", target.getPath()};
}

auto OpenSshKeyValidator::interpret(const ProcessResult& result, const Target& target) const -> bool
{
    if (result.exitCode == 0)
        return true;
    if (contains(result.output, {"incorrect passphrase"}))
        return false;
    if (contains(result.output, {"UNPROTECTED PRIVATE KEY FILE", "bad permissions", "invalid format",
                                 "No such file", "not a key file"}))
        throw StructuralError{target.getPath() + ": " + lastLine(result.output)};

    throw TransientError{getTool() + " exited with status " + std::to_string(result.exitCode) + ": " +
                         lastLine(result.output)};
}
