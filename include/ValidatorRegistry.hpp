#ifndef BROOTFILE_VALIDATORREGISTRY_HPP
#define BROOTFILE_VALIDATORREGISTRY_HPP

#include "Validator.hpp"

#include <memory>
#include <optional>

/// Exception thrown when no validator exists for a target's format
class UnsupportedFormatError : public BaseError
{
public:
    /// Constructor
    explicit UnsupportedFormatError(const std::string& description);
};

/// Exception thrown when a target's format is supported but its backing tool is not installed
class MissingDependencyError : public BaseError
{
public:
    /// Constructor
    MissingDependencyError(FormatKind kind, const std::string& dependency, const std::string& hint);

    /// \return the format kind which could not be handled
    auto getKind() const -> FormatKind
    {
        return m_kind;
    }

    /// \return the name of the missing tool
    auto getDependency() const -> const std::string&
    {
        return m_dependency;
    }

    /// \return a suggestion to install the missing tool
    auto getHint() const -> const std::string&
    {
        return m_hint;
    }

private:
    FormatKind  m_kind;
    std::string m_dependency;
    std::string m_hint;
};

/// Search of executables in a list of directories
class ToolLocator
{
public:
    /// Search in the given directories, in order
    explicit ToolLocator(std::vector<std::string> directories);

    /// \return a locator searching the directories listed in the PATH environment variable
    static auto fromEnvironment() -> ToolLocator;

    /// \return the path to an executable regular file with the given name, if any
    auto find(const std::string& name) const -> std::optional<std::string>;

private:
    std::vector<std::string> m_directories;
};

/// \brief Mapping from format kind to validator
///
/// Tool availability is probed once, when the registry is constructed.
/// Resolving a target never tries a password.
class ValidatorRegistry
{
public:
    /// Backend handling a format kind and its availability on this system
    struct Backend
    {
        FormatKind                 kind;       ///< Handled format kind
        std::string                dependency; ///< Library or tool doing the work
        std::optional<std::string> tool;       ///< Path to the tool found, if any
        bool                       available;  ///< Whether targets of this kind can be resolved
        std::string                hint;       ///< How to install the missing tool
    };

    /// Probe the tools needed by each backend with the given locator
    explicit ValidatorRegistry(const ToolLocator& locator);

    /// \brief Prepare a validator for the given target
    /// \exception UnsupportedFormatError if no validator exists for the target's format
    /// \exception MissingDependencyError if the tool needed for the target is not installed
    /// \exception StructuralError if the target cannot be unlocked by any candidate
    /// \exception FileError if the target cannot be read
    auto resolve(const Target& target) const -> std::unique_ptr<Validator>;

    /// \return the backend of every supported format kind
    auto availability() const -> const std::vector<Backend>&
    {
        return m_backends;
    }

private:
    std::vector<Backend> m_backends;
};

#endif // BROOTFILE_VALIDATORREGISTRY_HPP
