#ifndef BROOTFILE_TARGET_HPP
#define BROOTFILE_TARGET_HPP

#include "types.hpp"

/// \file Target.hpp
/// \brief Encrypted artifact under attack and detection of its format

/// Container families for which a validator may exist
enum class FormatKind
{
    PasswordDatabase, ///< KeePass 2 database (.kdbx)
    ZipArchive,       ///< Zip archive and derived formats (.zip, .jar, .war)
    RarArchive,       ///< RAR archive
    SevenZipArchive,  ///< 7-Zip archive
    PdfDocument,      ///< PDF document
    OfficeDocument,   ///< Encrypted Microsoft Office document
    SshKey,           ///< Private key, PEM or OpenSSH format
    Unknown           ///< Anything else
};

/// Every format kind, in display order
constexpr std::array<FormatKind, 8> allFormatKinds = {
    FormatKind::PasswordDatabase, FormatKind::ZipArchive,     FormatKind::RarArchive, FormatKind::SevenZipArchive,
    FormatKind::PdfDocument,      FormatKind::OfficeDocument, FormatKind::SshKey,     FormatKind::Unknown};

/// \return a short upper case name for the given format kind
auto getFormatName(FormatKind kind) -> std::string;

/// \return the file extensions recognized for the given format kind, dot included
auto getFormatExtensions(FormatKind kind) -> const std::vector<std::string>&;

/// \brief Detect the format of a file
///
/// The file extension is looked at first (case insensitive).
/// If it is not recognized, the first bytes of the file are compared to known signatures.
///
/// \exception FileError if the file cannot be opened
auto detectFormat(const std::string& filename) -> FormatKind;

/// File under attack, with its detected format
class Target
{
public:
    /// \brief Open the given file and detect its format
    /// \exception FileError if the file cannot be opened
    explicit Target(const std::string& path);

    /// Construct a target with an already known format
    Target(const std::string& path, FormatKind kind);

    /// \return path of the file
    auto getPath() const -> const std::string&
    {
        return m_path;
    }

    /// \return detected format
    auto getKind() const -> FormatKind
    {
        return m_kind;
    }

private:
    std::string m_path;
    FormatKind  m_kind;
};

#endif // BROOTFILE_TARGET_HPP
