#include "ValidatorRegistry.hpp"

#include "SshKeyValidator.hpp"
#include "ToolValidator.hpp"
#include "ZipValidator.hpp"
#include "file.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <sstream>

namespace
{

using Factory = std::function<std::unique_ptr<Validator>(const ValidatorRegistry::Backend&, const Target&)>;

struct Descriptor
{
    FormatKind               kind;
    std::string              dependency;
    std::vector<std::string> tools; // alternatives, the first one found is used
    bool                     builtIn;
    std::string              hint;
    Factory                  factory;
};

template <typename T>
auto makeToolValidator(const ValidatorRegistry::Backend& backend, const Target&) -> std::unique_ptr<Validator>
{
    return std::make_unique<T>(*backend.tool);
}

auto makeSshKeyValidator(const ValidatorRegistry::Backend& backend, const Target& target)
    -> std::unique_ptr<Validator>
{
    if (!isOpenSshPrivateKey(loadText(target.getPath())))
        return std::make_unique<SshKeyValidator>(target);

    if (!backend.tool)
        throw MissingDependencyError{backend.kind, "ssh-keygen", backend.hint};
    return std::make_unique<OpenSshKeyValidator>(*backend.tool, target);
}

auto getDescriptors() -> const std::vector<Descriptor>&
{
    // clang-format off
    static const auto descriptors = std::vector<Descriptor>{
        {FormatKind::PasswordDatabase, "keepassxc-cli", {"keepassxc-cli"}, false,
         "install KeePassXC (package keepassxc)", makeToolValidator<KeepassValidator>},
        {FormatKind::ZipArchive, "built-in", {}, true,
         "", [](const auto&, const Target& target) -> std::unique_ptr<Validator> { return std::make_unique<ZipValidator>(target); }},
        {FormatKind::RarArchive, "unrar", {"unrar"}, false,
         "install package unrar", makeToolValidator<RarValidator>},
        {FormatKind::SevenZipArchive, "7z", {"7z", "7za", "7zz"}, false,
         "install package p7zip-full or 7zip", makeToolValidator<SevenZipValidator>},
        {FormatKind::PdfDocument, "qpdf", {"qpdf"}, false,
         "install package qpdf", makeToolValidator<PdfValidator>},
        {FormatKind::OfficeDocument, "msoffcrypto-tool", {"msoffcrypto-tool"}, false,
         "install it with pip install msoffcrypto-tool", makeToolValidator<OfficeValidator>},
        {FormatKind::SshKey, "OpenSSL, ssh-keygen for OpenSSH format", {"ssh-keygen"}, true,
         "install package openssh-client", makeSshKeyValidator},
    };
    // clang-format on

    return descriptors;
}

} // namespace

UnsupportedFormatError::UnsupportedFormatError(const std::string& description)
: BaseError{"Unsupported format", description}
{
}

MissingDependencyError::MissingDependencyError(FormatKind kind, const std::string& dependency, const std::string& hint)
: BaseError{"Missing dependency", getFormatName(kind) + " files need " + dependency + ", " + hint}
, m_kind{kind}
, m_dependency{dependency}
, m_hint{hint}
{
}

ToolLocator::ToolLocator(std::vector<std::string> directories)
: m_directories{std::move(directories)}
{
}

auto ToolLocator::fromEnvironment() -> ToolLocator
{
    const auto path = std::getenv("PATH");

    auto directories = std::vector<std::string>{};
    auto is          = std::istringstream{path ? path : "/usr/local/bin:/usr/bin:/bin"};
    for (auto directory = std::string{}; std::getline(is, directory, ':');)
        directories.push_back(directory.empty() ? "." : directory);

    return ToolLocator{std::move(directories)};
}

auto ToolLocator::find(const std::string& name) const -> std::optional<std::string>
{
    for (const auto& directory : m_directories)
    {
        const auto path = (std::filesystem::path{directory} / name).string();

        auto ec = std::error_code{};
        if (std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0)
            return path;
    }

    return std::nullopt;
}

ValidatorRegistry::ValidatorRegistry(const ToolLocator& locator)
{
    for (const auto& descriptor : getDescriptors())
    {
        auto tool = std::optional<std::string>{};
        for (const auto& name : descriptor.tools)
            if ((tool = locator.find(name)))
                break;

        m_backends.push_back(
            {descriptor.kind, descriptor.dependency, tool, descriptor.builtIn || tool.has_value(), descriptor.hint});
    }
}

auto ValidatorRegistry::resolve(const Target& target) const -> std::unique_ptr<Validator>
{
    const auto& descriptors = getDescriptors();
    const auto  it          = std::find_if(descriptors.begin(), descriptors.end(),
                                           [&target](const Descriptor& d) { return d.kind == target.getKind(); });
    if (it == descriptors.end())
        throw UnsupportedFormatError{"no validator for " + target.getPath() + " (format " +
                                     getFormatName(target.getKind()) + ")"};

    const auto& backend = m_backends[it - descriptors.begin()];
    if (!backend.available)
        throw MissingDependencyError{backend.kind, backend.dependency, backend.hint};

    return it->factory(backend, target);
}
