#ifndef BROOTFILE_SSHKEYVALIDATOR_HPP
#define BROOTFILE_SSHKEYVALIDATOR_HPP

#include "Validator.hpp"

/// \file SshKeyValidator.hpp
/// \brief Private keys in PEM and OpenSSH formats

/// \return true if the given text is a private key in the OpenSSH format
auto isOpenSshPrivateKey(const std::string& text) -> bool;

/// \brief Get the name of the cipher protecting a private key in the OpenSSH format
/// \return "none" for an unencrypted key
/// \exception StructuralError if the key cannot be parsed
auto getOpenSshCipher(const std::string& text) -> std::string;

/// \brief Built-in validator for private keys in PEM format (PKCS#1, PKCS#8, SEC1)
///
/// Each attempt decrypts the key with OpenSSL from an in-memory copy of the file.
class SshKeyValidator : public Validator
{
public:
    /// \brief Load the key and check that it is encrypted
    /// \exception FileError if the file cannot be opened
    /// \exception StructuralError if the file is not a supported private key or is not encrypted
    explicit SshKeyValidator(const Target& target);

    auto attempt(const std::string& candidate, const Target& target) const -> bool override;

private:
    std::string m_pem;
};

#endif // BROOTFILE_SSHKEYVALIDATOR_HPP
