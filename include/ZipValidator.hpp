#ifndef BROOTFILE_ZIPVALIDATOR_HPP
#define BROOTFILE_ZIPVALIDATOR_HPP

#include "Validator.hpp"
#include "Zip.hpp"

/// \brief Built-in validator for zip archives
///
/// One encrypted entry is selected and loaded in memory when the validator is constructed:
/// - with traditional PKWARE encryption (ZipCrypto), a candidate must give the expected check byte
///   at the end of the encryption header, then the deciphered data must match the entry's CRC-32.
///   Stored and deflated entries are fully verified this way. For other compression methods,
///   the check bytes of all ZipCrypto entries are compared instead, which leaves a small
///   probability of false positive.
/// - with WinZip AES encryption, a candidate must give the stored password verification value,
///   then the authentication code computed over the encrypted data.
///
/// Entries that can be fully verified are preferred, then the smallest one.
class ZipValidator : public Validator
{
public:
    /// \brief Parse the archive and load the data needed to test candidates
    /// \exception FileError if the archive cannot be opened
    /// \exception StructuralError if the archive is invalid or has no entry encrypted with a supported method
    explicit ZipValidator(const Target& target);

    auto attempt(const std::string& candidate, const Target& target) const -> bool override;

    /// \return the entry used to test candidates
    auto getEntry() const -> const Zip::Entry&
    {
        return m_entry;
    }

    /// Size of the traditional PKWARE encryption header
    static constexpr std::size_t encryptionHeaderSize = 12;

    /// Size of the WinZip AES authentication code
    static constexpr std::size_t aesAuthenticationCodeSize = 10;

    /// Size of the WinZip AES password verification value
    static constexpr std::size_t aesPasswordVerifierSize = 2;

private:
    auto attemptTraditional(const std::string& candidate) const -> bool;
    auto attemptAes(const std::string& candidate) const -> bool;

    Zip::Entry                m_entry; // entry used to test candidates
    std::vector<std::uint8_t> m_data;  // raw data of m_entry

    // check byte and encryption header of other ZipCrypto entries,
    // used only when m_entry cannot be verified with its CRC-32
    std::vector<std::pair<std::uint8_t, std::vector<std::uint8_t>>> m_otherHeaders;
};

#endif // BROOTFILE_ZIPVALIDATOR_HPP
