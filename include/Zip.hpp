#ifndef BROOTFILE_ZIP_HPP
#define BROOTFILE_ZIP_HPP

#include "types.hpp"

#include <fstream>
#include <limits>

/// \brief Zip archive opened for reading: entries metadata and raw encrypted content
///
/// \note Zip64 extensions are supported.
///
/// \limitation Spanned or split zip files are not supported.
/// \limitation Strong encryption (SES) is not supported.
///             In particular, central directory encryption is not supported.
/// \limitation Language Encoding (EFS) is not supported. (\ref APPNOTE "APPNOTE.TXT", Appendix D)
///
/// \see \ref APPNOTE "APPNOTE.TXT"
class Zip
{
public:
    /// Exception thrown when parsing a zip file fails
    class Error : public BaseError
    {
    public:
        /// Constructor
        explicit Error(const std::string& description);
    };

    /// Encryption algorithm
    enum class Encryption
    {
        None,        ///< No encryption
        Traditional, ///< Traditional PKWARE encryption (ZipCrypto)
        Aes,         ///< WinZip AES encryption (AE-1 and AE-2)
        Unsupported  ///< Other encryption (DES, RC2, 3DES, PKWARE AES, Blowfish, Twofish, RC4)
    };

    /// Compression algorithm. \note This enumeration is not exhaustive.
    enum class Compression
    {
        Store     = 0,
        Shrink    = 1,
        Implode   = 6,
        Deflate   = 8,
        Deflate64 = 9,
        BZip2     = 12,
        LZMA      = 14,
        Zstandard = 93,
        MP3       = 94,
        XZ        = 95,
        JPEG      = 96,
        WavPack   = 97,
        PPMd      = 98,
    };

    /// Information about a zip entry
    struct Entry
    {
        std::string   name;             ///< File name
        Encryption    encryption;       ///< Encryption method
        Compression   compression;      ///< Compression method. \note It may take a value not listed in Compression
        std::uint32_t crc32;            ///< CRC-32 checksum
        std::uint64_t offset;           ///< Offset of local file header
        std::uint64_t packedSize;       ///< Packed data size
        std::uint64_t uncompressedSize; ///< Uncompressed data size
        std::uint8_t  checkByte;        ///< Last byte of the ZipCrypto encryption header after decryption
        std::uint8_t  aesStrength;      ///< WinZip AES key strength (1, 2 or 3), 0 if not AES encrypted
    };

    /// \brief Open a zip archive and read its central directory
    /// \exception FileError if the file cannot be opened
    /// \exception Error if the opened file is not a valid zip archive
    explicit Zip(const std::string& filename);

    /// @{
    /// \brief Entries in central directory order
    auto begin() const -> std::vector<Entry>::const_iterator
    {
        return m_entries.begin();
    }
    auto end() const -> std::vector<Entry>::const_iterator
    {
        return m_entries.end();
    }
    /// @}

    /// Number of entries in the central directory
    auto size() const -> std::size_t
    {
        return m_entries.size();
    }

    /// \brief Load at most \a count bytes of the given entry's raw data
    /// \exception Error if the given entry's data is not at the expected offset or is truncated
    auto load(const Entry& entry, std::size_t count = std::numeric_limits<std::size_t>::max()) const
        -> std::vector<std::uint8_t>;

private:
    // position the stream at the beginning of the given entry's raw data
    auto seek(const Entry& entry) const -> std::istream&;

    mutable std::ifstream m_is;
    std::vector<Entry>    m_entries;
};

#endif // BROOTFILE_ZIP_HPP
