#include "ZipValidator.hpp"

#include "Keys.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <zlib.h>

#include <algorithm>
#include <climits>
#include <memory>
#include <optional>

namespace
{

constexpr auto aesIterations = 1000;

auto getAesSaltSize(std::uint8_t strength) -> std::size_t
{
    return 4 + 4 * strength;
}

auto getAesKeySize(std::uint8_t strength) -> std::size_t
{
    return 8 + 8 * strength;
}

// An empty entry has a constant checksum, so only its check byte can be tested.
auto isVerifiable(const Zip::Entry& entry) -> bool
{
    return (entry.compression == Zip::Compression::Store || entry.compression == Zip::Compression::Deflate) &&
           entry.uncompressedSize > 0;
}

// Lower is better, nothing if the entry cannot be used.
auto getRank(const Zip::Entry& entry) -> std::optional<int>
{
    switch (entry.encryption)
    {
    case Zip::Encryption::Traditional:
        if (entry.packedSize < ZipValidator::encryptionHeaderSize)
            return std::nullopt;
        return isVerifiable(entry) ? 0 : 2;
    case Zip::Encryption::Aes:
        if (entry.aesStrength < 1 || 3 < entry.aesStrength ||
            entry.packedSize < getAesSaltSize(entry.aesStrength) + ZipValidator::aesPasswordVerifierSize +
                                   ZipValidator::aesAuthenticationCodeSize)
            return std::nullopt;
        return 1;
    case Zip::Encryption::None:
    case Zip::Encryption::Unsupported:
        break;
    }

    return std::nullopt;
}

// Decompress raw deflate data and return the CRC-32 of the result,
// or nothing if the data is not a valid deflate stream of the expected size.
auto inflateChecksum(const std::vector<std::uint8_t>& compressed, std::uint64_t expectedSize)
    -> std::optional<std::uint32_t>
{
    auto stream = z_stream{};
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK)
        throw TransientError{"could not initialize zlib"};

    const auto cleanup = std::unique_ptr<z_stream, decltype(&inflateEnd)>{&stream, &inflateEnd};

    auto       buffer    = std::array<std::uint8_t, 1 << 14>{};
    auto       crc       = crc32(0L, Z_NULL, 0);
    auto       size      = std::uint64_t{};
    auto       input     = compressed.data();
    auto       remaining = compressed.size();
    const auto refill    = [&]
    {
        const auto chunk = std::min<std::size_t>(remaining, UINT_MAX);
        stream.next_in   = const_cast<Bytef*>(input);
        stream.avail_in  = static_cast<uInt>(chunk);
        input += chunk;
        remaining -= chunk;
    };
    refill();

    for (;;)
    {
        if (!stream.avail_in && remaining)
            refill();

        stream.next_out  = buffer.data();
        stream.avail_out = static_cast<uInt>(buffer.size());

        const auto ret      = inflate(&stream, Z_NO_FLUSH);
        const auto produced = buffer.size() - stream.avail_out;

        size += produced;
        if (expectedSize < size)
            return std::nullopt;
        crc = crc32_z(crc, buffer.data(), produced);

        if (ret == Z_STREAM_END)
            break;
        if (ret == Z_MEM_ERROR)
            throw TransientError{"zlib ran out of memory"};
        if (ret != Z_OK) // Z_DATA_ERROR, Z_NEED_DICT or Z_BUF_ERROR on a truncated stream
            return std::nullopt;
    }

    if (size != expectedSize)
        return std::nullopt;

    return static_cast<std::uint32_t>(crc);
}

} // namespace

ZipValidator::ZipValidator(const Target& target)
try
{
    const auto archive = Zip{target.getPath()};

    auto best        = std::optional<std::pair<int, Zip::Entry>>{};
    auto traditional = std::vector<Zip::Entry>{};
    auto unsupported = false;
    for (const auto& entry : archive)
    {
        unsupported |= entry.encryption == Zip::Encryption::Unsupported;

        const auto rank = getRank(entry);
        if (!rank)
            continue;

        if (entry.encryption == Zip::Encryption::Traditional)
            traditional.push_back(entry);

        if (!best || *rank < best->first || (*rank == best->first && entry.packedSize < best->second.packedSize))
            best.emplace(*rank, entry);
    }

    if (!best)
    {
        if (unsupported)
            throw StructuralError{target.getPath() + " is encrypted with an unsupported method"};
        else
            throw StructuralError{target.getPath() + " has no encrypted entry"};
    }

    m_entry = best->second;
    m_data  = archive.load(m_entry);

    if (m_entry.encryption == Zip::Encryption::Traditional && !isVerifiable(m_entry))
        for (const auto& entry : traditional)
            if (entry.offset != m_entry.offset)
                m_otherHeaders.emplace_back(entry.checkByte, archive.load(entry, encryptionHeaderSize));
}
catch (const Zip::Error& e)
{
    auto description = std::string{e.what()};
    if (!description.empty() && description.back() == '.')
        description.pop_back();
    throw StructuralError{target.getPath() + ": " + description};
}

auto ZipValidator::attempt(const std::string& candidate, const Target&) const -> bool
{
    if (m_entry.encryption == Zip::Encryption::Aes)
        return attemptAes(candidate);
    else
        return attemptTraditional(candidate);
}

auto ZipValidator::attemptTraditional(const std::string& candidate) const -> bool
{
    const auto initial = Keys{candidate};

    // filter with the check byte
    auto keys = initial;
    auto p    = std::uint8_t{};
    for (auto i = std::size_t{}; i < encryptionHeaderSize; i++)
        p = keys.decrypt(m_data[i]);
    if (p != m_entry.checkByte)
        return false;

    if (isVerifiable(m_entry))
    {
        auto deciphered = std::vector<std::uint8_t>(m_data.size() - encryptionHeaderSize);
        std::transform(m_data.begin() + encryptionHeaderSize, m_data.end(), deciphered.begin(),
                       [&keys](std::uint8_t c) { return keys.decrypt(c); });

        if (m_entry.compression == Zip::Compression::Deflate)
            return inflateChecksum(deciphered, m_entry.uncompressedSize) == m_entry.crc32;

        return deciphered.size() == m_entry.uncompressedSize &&
               crc32_z(0L, deciphered.data(), deciphered.size()) == m_entry.crc32;
    }

    return std::all_of(m_otherHeaders.begin(), m_otherHeaders.end(),
                       [&initial](const auto& other)
                       {
                           auto keys = initial;
                           auto p    = std::uint8_t{};
                           for (const auto c : other.second)
                               p = keys.decrypt(c);
                           return p == other.first;
                       });
}

auto ZipValidator::attemptAes(const std::string& candidate) const -> bool
{
    const auto saltSize = getAesSaltSize(m_entry.aesStrength);
    const auto keySize  = getAesKeySize(m_entry.aesStrength);

    // derived material: encryption key, authentication key, password verification value
    auto derived = std::array<unsigned char, 2 * 32 + aesPasswordVerifierSize>{};
    if (PKCS5_PBKDF2_HMAC_SHA1(candidate.data(), static_cast<int>(candidate.size()), m_data.data(),
                               static_cast<int>(saltSize), aesIterations,
                               static_cast<int>(2 * keySize + aesPasswordVerifierSize), derived.data()) != 1)
        throw TransientError{"PBKDF2 key derivation failed"};

    const auto verifier = m_data.begin() + saltSize;
    if (!std::equal(verifier, verifier + aesPasswordVerifierSize, derived.begin() + 2 * keySize))
        return false;

    const auto encrypted = m_data.data() + saltSize + aesPasswordVerifierSize;
    const auto size      = m_data.size() - saltSize - aesPasswordVerifierSize - aesAuthenticationCodeSize;

    auto code     = std::array<unsigned char, EVP_MAX_MD_SIZE>{};
    auto codeSize = 0u;
    if (!HMAC(EVP_sha1(), derived.data() + keySize, static_cast<int>(keySize), encrypted, size, code.data(),
              &codeSize))
        throw TransientError{"HMAC-SHA1 computation failed"};

    return std::equal(code.begin(), code.begin() + aesAuthenticationCodeSize, m_data.end() - aesAuthenticationCodeSize);
}
