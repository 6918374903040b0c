#ifndef BROOTFILE_KEYS_HPP
#define BROOTFILE_KEYS_HPP

#include "types.hpp"

#include <zlib.h>

#include <string>

/// \brief Cipher state of traditional PKWARE encryption (ZipCrypto)
///
/// The state is initialized from a password, then updated with each plaintext byte.
class Keys
{
public:
    /// Construct default state
    Keys() = default;

    /// Construct keys associated to the given password
    explicit Keys(const std::string& password);

    /// Update the state with a plaintext byte
    inline void update(std::uint8_t p)
    {
        x = crc32Step(x, p);
        y = (y + lsb(x)) * mult + 1;
        z = crc32Step(z, msb(y));
    }

    /// Decipher a ciphertext byte and update the state with the resulting plaintext byte
    inline auto decrypt(std::uint8_t c) -> std::uint8_t
    {
        const auto p = static_cast<std::uint8_t>(c ^ getK());
        update(p);
        return p;
    }

    /// Encipher a plaintext byte and update the state with it
    inline auto encrypt(std::uint8_t p) -> std::uint8_t
    {
        const auto c = static_cast<std::uint8_t>(p ^ getK());
        update(p);
        return c;
    }

    /// \return the keystream byte derived from the keys
    /// \note Only Z[2,16) is used
    std::uint8_t getK() const
    {
        const auto temp = (z | 2) & mask<0, 16>;
        return lsb(temp * (temp ^ 1) >> 8);
    }

    /// Multiplicative constant used in traditional PKWARE encryption
    static constexpr std::uint32_t mult = 0x08088405;

private:
    // one step of CRC-32 without pre and post conditioning
    static auto crc32Step(std::uint32_t pval, std::uint8_t b) -> std::uint32_t
    {
        return pval >> 8 ^ static_cast<std::uint32_t>(crcTable[lsb(pval) ^ b]);
    }

    static const z_crc_t* const crcTable;

    std::uint32_t x = 0x12345678, y = 0x23456789, z = 0x34567890;
};

#endif // BROOTFILE_KEYS_HPP
