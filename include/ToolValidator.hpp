#ifndef BROOTFILE_TOOLVALIDATOR_HPP
#define BROOTFILE_TOOLVALIDATOR_HPP

#include "Process.hpp"
#include "Validator.hpp"

#include <initializer_list>

/// \file ToolValidator.hpp
/// \brief Validators delegating to an external command line tool

/// \brief Validator running an external tool once per candidate
///
/// The tool is run without a shell. Being killed by a signal is a transient error,
/// failing to execute the tool is a structural error. Any other outcome is
/// interpreted by the subclass from the exit status and the output of the tool.
class ToolValidator : public Validator
{
public:
    /// \param tool Path to the executable
    explicit ToolValidator(std::string tool);

    auto attempt(const std::string& candidate, const Target& target) const -> bool override;

    /// \return path to the executable
    auto getTool() const -> const std::string&
    {
        return m_tool;
    }

protected:
    /// \return the arguments given to the tool to test a candidate
    virtual auto getArguments(const std::string& candidate, const Target& target) const
        -> std::vector<std::string> = 0;

    /// \return the data written to the standard input of the tool
    virtual auto getInput(const std::string& candidate) const -> std::string;

    /// \brief Interpret the result of the tool
    /// \exception TransientError, StructuralError
    virtual auto interpret(const ProcessResult& result, const Target& target) const -> bool = 0;

    /// \return true if the output contains any of the given markers
    static auto contains(const std::string& output, std::initializer_list<const char*> markers) -> bool;

    /// \return the last non-empty line of the output, used in error messages
    static auto lastLine(const std::string& output) -> std::string;

private:
    std::string m_tool;
};

/// KeePass 2 database, tested with `keepassxc-cli db-info` reading the password on its standard input
class KeepassValidator : public ToolValidator
{
public:
    using ToolValidator::ToolValidator;

protected:
    auto getArguments(const std::string& candidate, const Target& target) const -> std::vector<std::string> override;
    auto getInput(const std::string& candidate) const -> std::string override;
    auto interpret(const ProcessResult& result, const Target& target) const -> bool override;
};

/// RAR archive, tested with `unrar t`
class RarValidator : public ToolValidator
{
public:
    using ToolValidator::ToolValidator;

protected:
    auto getArguments(const std::string& candidate, const Target& target) const -> std::vector<std::string> override;
    auto interpret(const ProcessResult& result, const Target& target) const -> bool override;
};

/// 7-Zip archive, tested with `7z t`
class SevenZipValidator : public ToolValidator
{
public:
    using ToolValidator::ToolValidator;

protected:
    auto getArguments(const std::string& candidate, const Target& target) const -> std::vector<std::string> override;
    auto interpret(const ProcessResult& result, const Target& target) const -> bool override;
};

/// PDF document, tested with `qpdf --show-npages`
class PdfValidator : public ToolValidator
{
public:
    using ToolValidator::ToolValidator;

protected:
    auto getArguments(const std::string& candidate, const Target& target) const -> std::vector<std::string> override;
    auto interpret(const ProcessResult& result, const Target& target) const -> bool override;
};

/// Encrypted Microsoft Office document, tested with `msoffcrypto-tool`
class OfficeValidator : public ToolValidator
{
public:
    using ToolValidator::ToolValidator;

protected:
    auto getArguments(const std::string& candidate, const Target& target) const -> std::vector<std::string> override;
    auto interpret(const ProcessResult& result, const Target& target) const -> bool override;
};

/// Private key in the OpenSSH format, tested with `ssh-keygen -y`
class OpenSshKeyValidator : public ToolValidator
{
public:
    /// \brief Check that the key is encrypted
    /// \exception FileError if the file cannot be opened
    /// \exception StructuralError if the key cannot be parsed or is not encrypted
    OpenSshKeyValidator(std::string tool, const Target& target);

protected:
    auto getArguments(const std::string& candidate, const Target& target) const -> std::vector<std::string> override;
    auto interpret(const ProcessResult& result, const Target& target) const -> bool override;
};

#endif // BROOTFILE_TOOLVALIDATOR_HPP
